#pragma once

#include <pinion/result.hpp>
#include <pinion/version.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

// In and NotIn are membership forms: produced when several == (or !=)
// values are collapsed, and by marker "in" / "not in" comparisons.
enum class SpecOp { Eq, Ne, Lt, Le, Gt, Ge, Compatible, Arbitrary, In, NotIn };

const char* spec_op_string(SpecOp op);

struct VersionSpecifier {
    SpecOp op = SpecOp::Eq;
    std::string version;                 // as written, e.g. "3.7" or "1.*"
    std::vector<std::string> members;    // In / NotIn values

    // "<op><version>"; a bare version implies ==
    static Result<VersionSpecifier> parse(const std::string& s);
    static VersionSpecifier membership(SpecOp op, std::vector<std::string> values);

    bool has_wildcard() const;
    bool contains(const Version& v) const;
    std::string to_string() const;

    bool operator==(const VersionSpecifier& o) const;
    bool operator!=(const VersionSpecifier& o) const;
};

// A set of specifiers, all of which must hold. Deduplicated by
// (operator, version) and kept in a stable order.
class SpecifierSet {
public:
    SpecifierSet() = default;

    // Comma separated; an empty string yields an empty set
    static Result<SpecifierSet> parse(const std::string& s);

    void add(VersionSpecifier spec);
    const std::vector<VersionSpecifier>& specs() const { return specs_; }
    bool empty() const { return specs_.empty(); }
    size_t size() const { return specs_.size(); }

    // Pre-releases match only if allowed or a specifier names one
    bool contains(const Version& v, bool allow_prereleases = false) const;
    std::vector<Version> filter(const std::vector<Version>& versions,
                                bool allow_prereleases = false) const;

    // Combined constraint: every specifier of both sets
    SpecifierSet intersect(const SpecifierSet& o) const;

    // "<2,>=1" style, comma-joined without spaces
    std::string to_string() const;

    bool operator==(const SpecifierSet& o) const;
    bool operator!=(const SpecifierSet& o) const;

private:
    std::vector<VersionSpecifier> specs_;
};

// Highest known minor per interpreter major version, used to turn open
// bounds into half-open ranges.
struct VersionCeilings {
    std::map<uint64_t, uint64_t> max_minor;

    static VersionCeilings defaults();   // {1: 7, 2: 7, 3: 11, 4: 0}
    std::optional<uint64_t> ceiling(uint64_t major) const;
};

enum class Join { And, Or };

// ">X.Y" -> ">=X.(Y+1)" and "<=X.Y" -> "<X.(Y+1)" when X.(Y+1) stays within
// the ceiling table; anything else comes back unchanged.
Result<SpecifierSet> normalize_open_bound(const VersionSpecifier& spec,
                                          const VersionCeilings& ceilings = VersionCeilings::defaults());

struct SpecGroup {
    SpecOp op;
    bool multi_segment;                          // versions with more than two parts
    std::vector<std::vector<uint64_t>> versions; // sorted, deduplicated
};

// Buckets by (operator, multi_segment); membership forms are expanded
// into their == / != values first.
Result<std::vector<SpecGroup>> group_by_operator(const SpecifierSet& specs);

// Reduce each operator group to a single bound: the loosest under Or, the
// tightest under And. == and != keep every value; several of them become
// "in" / "not in". Open bounds are normalized first.
Result<SpecifierSet> collapse(const SpecifierSet& specs, Join join,
                              const VersionCeilings& ceilings = VersionCeilings::defaults());

// Semantic equality: identical collapsed forms
bool equivalent(const SpecifierSet& a, const SpecifierSet& b);

} // namespace pinion
