#pragma once

#include <pinion/result.hpp>
#include <pinion/specifier.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pinion {

enum class MarkerOp { Eq, Ne, Lt, Le, Gt, Ge, In, NotIn };

const char* marker_op_string(MarkerOp op);

// Values of the marker variables for one target interpreter and platform
struct MarkerEnvironment {
    std::map<std::string, std::string> values;

    // Host platform via uname(); python 3.11
    static MarkerEnvironment defaults();
    // defaults() with python_version / python_full_version replaced
    static MarkerEnvironment for_python(const std::string& version);

    std::optional<std::string> get(const std::string& variable) const;
    void set(const std::string& variable, std::string value);
};

// PEP 508 environment marker. Immutable: every transformation below
// returns a new tree. And/Or nodes are n-ary and keep source structure.
class Marker {
public:
    enum Kind { Leaf, And, Or };

    // Static constructors
    static Marker leaf(std::string variable, MarkerOp op, std::string literal,
                       bool literal_first = false);
    static Marker all(std::vector<Marker> children);
    static Marker any(std::vector<Marker> children);

    // Parse from string: "python_version >= '3.7' and (os_name == 'nt' or extra == 'x')"
    static Result<Marker> parse(const std::string& input);

    // Unknown variables or unparsable version values are errors, never false
    Result<bool> evaluate(const MarkerEnvironment& env,
                          const std::vector<std::string>& extras = {}) const;

    // Canonical serialization with single-quoted literals
    std::string to_string() const;

    Kind kind() const { return kind_; }
    const std::string& variable() const { return variable_; }
    MarkerOp op() const { return op_; }
    const std::string& literal() const { return literal_; }
    bool literal_first() const { return literal_first_; }
    const std::vector<Marker>& children() const { return children_; }

    bool operator==(const Marker& o) const;
    bool operator!=(const Marker& o) const;

private:
    Kind kind_ = Leaf;
    std::string variable_;
    MarkerOp op_ = MarkerOp::Eq;
    std::string literal_;
    bool literal_first_ = false;         // "'3.7' < python_version"
    std::vector<Marker> children_;       // for And, Or
};

bool is_marker_variable(const std::string& name);
bool is_python_variable(const std::string& name);

// Remove every leaf comparing `variable`. The bool reports whether anything
// was removed; nullopt means nothing is left.
std::pair<std::optional<Marker>, bool> strip(const Marker& m, const std::string& variable);

// Literals compared against `variable` anywhere in the tree
std::set<std::string> collect(const Marker& m, const std::string& variable);

bool contains(const Marker& m, const std::string& variable);

// Tree restricted to python_version / python_full_version leaves
std::optional<Marker> python_subtree(const Marker& m);

// Interpreter constraint of a python-only tree. And groups intersect and
// Or groups unite, folded with collapse(). An Or whose branches cannot be
// written as one specifier set fails with InvalidArg.
Result<SpecifierSet> to_specifier_set(const Marker& m);

// Python clauses of a top-level And (or a python-only tree) rewritten as
// their collapsed specifier form. Other trees come back unchanged.
Result<Marker> normalize(const Marker& m);

// merge(a, nullopt) == a; otherwise "a and b" with one set of python clauses
Result<std::optional<Marker>> merge(const std::optional<Marker>& a,
                                    const std::optional<Marker>& b);

// Plain conjunction / disjunction, flattening nested groups of the same kind
Marker and_markers(const Marker& a, const Marker& b);
Marker or_markers(const Marker& a, const Marker& b);

// Python-version marker equivalent to a specifier such as ">=3.6,<4".
// "", "*" and "any" yield no marker.
Result<std::optional<Marker>> marker_from_specifier(const std::string& spec);

// Per-variable manifest keys ({"os_name": "== 'nt'"}) and the free-form
// "markers" value, joined with "and" in sorted key order
Result<std::optional<Marker>> marker_from_manifest(
    const std::map<std::string, std::string>& keys, const std::string& markers);

} // namespace pinion
