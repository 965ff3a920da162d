#include <pinion/marker.hpp>
#include <pinion/name.hpp>
#include <pinion/version.hpp>
#include <algorithm>
#include <cctype>

#include <sys/utsname.h>

namespace pinion {

namespace {

const char* MARKER_VARIABLES[] = {
    "python_version", "python_full_version", "os_name", "sys_platform",
    "platform_release", "platform_system", "platform_version",
    "platform_machine", "platform_python_implementation",
    "implementation_name", "implementation_version", "extra",
};

bool is_version_variable(const std::string& name) {
    return is_python_variable(name) || name == "implementation_version";
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

// "2.7, 3.6" or "2.7 3.6" -> {"2.7", "3.6"}
std::vector<std::string> split_members(const std::string& literal) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : literal) {
        if (c == ',' || c == ' ' || c == '\t') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

MarkerOp flip(MarkerOp op) {
    switch (op) {
        case MarkerOp::Lt: return MarkerOp::Gt;
        case MarkerOp::Le: return MarkerOp::Ge;
        case MarkerOp::Gt: return MarkerOp::Lt;
        case MarkerOp::Ge: return MarkerOp::Le;
        default:           return op;
    }
}

SpecOp to_spec_op(MarkerOp op) {
    switch (op) {
        case MarkerOp::Eq:    return SpecOp::Eq;
        case MarkerOp::Ne:    return SpecOp::Ne;
        case MarkerOp::Lt:    return SpecOp::Lt;
        case MarkerOp::Le:    return SpecOp::Le;
        case MarkerOp::Gt:    return SpecOp::Gt;
        case MarkerOp::Ge:    return SpecOp::Ge;
        case MarkerOp::In:    return SpecOp::In;
        case MarkerOp::NotIn: return SpecOp::NotIn;
    }
    return SpecOp::Eq;
}

// === has no marker spelling and becomes ==
MarkerOp from_spec_op(SpecOp op) {
    switch (op) {
        case SpecOp::Ne:    return MarkerOp::Ne;
        case SpecOp::Lt:    return MarkerOp::Lt;
        case SpecOp::Le:    return MarkerOp::Le;
        case SpecOp::Gt:    return MarkerOp::Gt;
        case SpecOp::Ge:    return MarkerOp::Ge;
        case SpecOp::In:    return MarkerOp::In;
        case SpecOp::NotIn: return MarkerOp::NotIn;
        default:            return MarkerOp::Eq;
    }
}

// python_full_version for "X.Y.Z", python_version otherwise
std::string python_variable_for(const std::string& version) {
    auto parts = split_members(version);
    std::string v = parts.empty() ? version : parts.front();
    size_t dots = static_cast<size_t>(std::count(v.begin(), v.end(), '.'));
    bool numeric = std::all_of(v.begin(), v.end(),
        [](unsigned char c) { return std::isdigit(c) || c == '.'; });
    return (numeric && dots >= 2) ? "python_full_version" : "python_version";
}

bool has_python_leaf(const Marker& m) {
    if (m.kind() == Marker::Leaf) return is_python_variable(m.variable());
    return std::any_of(m.children().begin(), m.children().end(), has_python_leaf);
}

bool is_python_only(const Marker& m) {
    if (m.kind() == Marker::Leaf) return is_python_variable(m.variable());
    return std::all_of(m.children().begin(), m.children().end(), is_python_only);
}

Marker combine(Marker::Kind kind, const Marker& a, const Marker& b) {
    std::vector<Marker> children;
    auto append = [&](const Marker& m) {
        if (m.kind() == kind) {
            for (const auto& c : m.children()) {
                if (std::find(children.begin(), children.end(), c) == children.end()) {
                    children.push_back(c);
                }
            }
        } else if (std::find(children.begin(), children.end(), m) == children.end()) {
            children.push_back(m);
        }
    };
    append(a);
    append(b);
    if (children.size() == 1) return children.front();
    return kind == Marker::And ? Marker::all(std::move(children))
                               : Marker::any(std::move(children));
}

Status check_version_literal(const std::string& variable, MarkerOp op,
                             const std::string& literal, bool literal_first) {
    if (op == MarkerOp::In || op == MarkerOp::NotIn) {
        if (literal_first) return ok_status();
        for (const auto& member : split_members(literal)) {
            auto v = Version::parse(member);
            if (v.is_err()) {
                return PinionError{PinionError::Parse,
                    "invalid version '" + member + "' compared with " + variable};
            }
        }
        return ok_status();
    }

    MarkerOp effective = literal_first ? flip(op) : op;
    std::string text = std::string(spec_op_string(to_spec_op(effective))) + literal;
    auto spec = VersionSpecifier::parse(text);
    if (spec.is_err()) {
        return PinionError{PinionError::Parse,
            "invalid version '" + literal + "' compared with " + variable,
            spec.error().hint};
    }
    return ok_status();
}

// Python clause of a collapsed specifier set as marker leaves
Result<std::vector<Marker>> specifier_to_leaves(const SpecifierSet& set) {
    std::vector<Marker> leaves;
    for (const auto& spec : set.specs()) {
        switch (spec.op) {
        case SpecOp::In:
        case SpecOp::NotIn: {
            bool full = std::any_of(spec.members.begin(), spec.members.end(),
                [](const std::string& m) {
                    return python_variable_for(m) == "python_full_version";
                });
            leaves.push_back(Marker::leaf(
                full ? "python_full_version" : "python_version",
                spec.op == SpecOp::In ? MarkerOp::In : MarkerOp::NotIn,
                join(spec.members, ", ")));
            break;
        }
        case SpecOp::Compatible: {
            // ~=X.Y -> >=X.Y, <(X+1); ~=X.Y.Z -> >=X.Y.Z, <X.(Y+1)
            auto parts = tuplize(spec.version);
            if (parts.is_err()) return std::move(parts).error();
            std::vector<uint64_t> upper(parts.value().begin(), parts.value().end() - 1);
            upper.back() += 1;
            leaves.push_back(Marker::leaf(python_variable_for(spec.version),
                                          MarkerOp::Ge, spec.version));
            std::string upper_text = join_version(upper);
            leaves.push_back(Marker::leaf(python_variable_for(upper_text),
                                          MarkerOp::Lt, upper_text));
            break;
        }
        default:
            leaves.push_back(Marker::leaf(python_variable_for(spec.version),
                                          from_spec_op(spec.op), spec.version));
            break;
        }
    }
    return Result<std::vector<Marker>>::ok(std::move(leaves));
}

// ---------------------------------------------------------------------------
// Recursive descent parser
// ---------------------------------------------------------------------------

struct Value {
    std::string text;
    bool quoted = false;
};

struct Parser {
    const std::string& input;
    size_t pos;

    Parser(const std::string& s) : input(s), pos(0) {}

    void skip_ws() {
        while (pos < input.size() && (input[pos] == ' ' || input[pos] == '\t')) {
            ++pos;
        }
    }

    bool at_end() const {
        return pos >= input.size();
    }

    char peek() const {
        return input[pos];
    }

    static bool is_ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
    }

    bool try_consume(const std::string& token) {
        if (input.compare(pos, token.size(), token) != 0) return false;
        pos += token.size();
        return true;
    }

    // Whole-word keyword: "and" must not match the start of "android"
    bool try_keyword(const std::string& word) {
        if (input.compare(pos, word.size(), word) != 0) return false;
        size_t end = pos + word.size();
        if (end < input.size() && is_ident_char(input[end])) return false;
        pos = end;
        return true;
    }

    Result<Marker> parse_or() {
        auto first = parse_and();
        if (first.is_err()) return first;

        std::vector<Marker> children;
        children.push_back(std::move(first).value());
        while (true) {
            skip_ws();
            if (!try_keyword("or")) break;
            auto next = parse_and();
            if (next.is_err()) return next;
            children.push_back(std::move(next).value());
        }

        if (children.size() == 1) return Result<Marker>::ok(std::move(children.front()));
        return Result<Marker>::ok(Marker::any(std::move(children)));
    }

    Result<Marker> parse_and() {
        auto first = parse_atom();
        if (first.is_err()) return first;

        std::vector<Marker> children;
        children.push_back(std::move(first).value());
        while (true) {
            skip_ws();
            if (!try_keyword("and")) break;
            auto next = parse_atom();
            if (next.is_err()) return next;
            children.push_back(std::move(next).value());
        }

        if (children.size() == 1) return Result<Marker>::ok(std::move(children.front()));
        return Result<Marker>::ok(Marker::all(std::move(children)));
    }

    Result<Marker> parse_atom() {
        skip_ws();
        if (at_end()) {
            return PinionError{PinionError::Parse, "unexpected end of marker"};
        }

        if (peek() == '(') {
            ++pos;
            auto inner = parse_or();
            if (inner.is_err()) return inner;
            skip_ws();
            if (at_end() || peek() != ')') {
                return PinionError{PinionError::Parse,
                    "expected ')' in marker", "check for unclosed parentheses"};
            }
            ++pos;
            return inner;
        }

        return parse_comparison();
    }

    Result<Value> parse_value() {
        skip_ws();
        if (at_end()) {
            return PinionError{PinionError::Parse,
                "expected marker variable or quoted string"};
        }

        char c = peek();
        if (c == '\'' || c == '"') {
            size_t close = input.find(c, pos + 1);
            if (close == std::string::npos) {
                return PinionError{PinionError::Parse,
                    "unterminated string in marker",
                    "at position " + std::to_string(pos)};
            }
            Value v{input.substr(pos + 1, close - pos - 1), true};
            pos = close + 1;
            return Result<Value>::ok(std::move(v));
        }

        size_t start = pos;
        while (!at_end() && is_ident_char(peek())) ++pos;
        if (pos == start) {
            std::string msg = "unexpected character '";
            msg += c;
            msg += "' in marker";
            return PinionError{PinionError::Parse, msg,
                "at position " + std::to_string(pos)};
        }
        return Result<Value>::ok(Value{input.substr(start, pos - start), false});
    }

    Result<MarkerOp> parse_op() {
        skip_ws();
        if (try_consume("===") || try_consume("~=")) {
            return PinionError{PinionError::Parse,
                "unsupported marker operator",
                "use one of ==, !=, <, <=, >, >=, in, not in"};
        }
        if (try_consume("==")) return Result<MarkerOp>::ok(MarkerOp::Eq);
        if (try_consume("!=")) return Result<MarkerOp>::ok(MarkerOp::Ne);
        if (try_consume("<=")) return Result<MarkerOp>::ok(MarkerOp::Le);
        if (try_consume(">=")) return Result<MarkerOp>::ok(MarkerOp::Ge);
        if (try_consume("<"))  return Result<MarkerOp>::ok(MarkerOp::Lt);
        if (try_consume(">"))  return Result<MarkerOp>::ok(MarkerOp::Gt);
        if (try_keyword("in")) return Result<MarkerOp>::ok(MarkerOp::In);
        if (try_keyword("not")) {
            skip_ws();
            if (try_keyword("in")) return Result<MarkerOp>::ok(MarkerOp::NotIn);
        }
        return PinionError{PinionError::Parse,
            "expected comparison operator in marker",
            "at position " + std::to_string(pos)};
    }

    Result<Marker> parse_comparison() {
        auto lhs = parse_value();
        if (lhs.is_err()) return std::move(lhs).error();
        auto op = parse_op();
        if (op.is_err()) return std::move(op).error();
        auto rhs = parse_value();
        if (rhs.is_err()) return std::move(rhs).error();

        const Value& l = lhs.value();
        const Value& r = rhs.value();
        if (l.quoted == r.quoted) {
            return PinionError{PinionError::Parse,
                l.quoted ? "marker compares two literals"
                         : "marker compares two variables",
                "expected <variable> <op> '<value>'"};
        }

        const std::string& variable = l.quoted ? r.text : l.text;
        const std::string& literal = l.quoted ? l.text : r.text;
        if (!is_marker_variable(variable)) {
            return PinionError{PinionError::Parse,
                "unknown marker variable '" + variable + "'"};
        }
        if (is_version_variable(variable)) {
            PINION_TRY(check_version_literal(variable, op.value(), literal, l.quoted));
        }

        return Result<Marker>::ok(Marker::leaf(variable, op.value(), literal, l.quoted));
    }
};

} // anonymous namespace

const char* marker_op_string(MarkerOp op) {
    switch (op) {
        case MarkerOp::Eq:    return "==";
        case MarkerOp::Ne:    return "!=";
        case MarkerOp::Lt:    return "<";
        case MarkerOp::Le:    return "<=";
        case MarkerOp::Gt:    return ">";
        case MarkerOp::Ge:    return ">=";
        case MarkerOp::In:    return "in";
        case MarkerOp::NotIn: return "not in";
    }
    return "";
}

bool is_marker_variable(const std::string& name) {
    return std::any_of(std::begin(MARKER_VARIABLES), std::end(MARKER_VARIABLES),
        [&](const char* v) { return name == v; });
}

bool is_python_variable(const std::string& name) {
    return name == "python_version" || name == "python_full_version";
}

// ---------------------------------------------------------------------------
// MarkerEnvironment
// ---------------------------------------------------------------------------

MarkerEnvironment MarkerEnvironment::defaults() {
    MarkerEnvironment env;
    env.values["python_version"] = "3.11";
    env.values["python_full_version"] = "3.11.0";
    env.values["implementation_name"] = "cpython";
    env.values["implementation_version"] = "3.11.0";
    env.values["platform_python_implementation"] = "CPython";
    env.values["os_name"] = "posix";

    struct utsname info;
    if (uname(&info) == 0) {
        std::string system = info.sysname;
        env.values["platform_system"] = system;
        env.values["platform_release"] = info.release;
        env.values["platform_version"] = info.version;
        env.values["platform_machine"] = info.machine;

        std::string platform = system;
        std::transform(platform.begin(), platform.end(), platform.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        env.values["sys_platform"] = platform;
    } else {
        env.values["platform_system"] = "Linux";
        env.values["platform_release"] = "";
        env.values["platform_version"] = "";
        env.values["platform_machine"] = "";
        env.values["sys_platform"] = "linux";
    }
    return env;
}

MarkerEnvironment MarkerEnvironment::for_python(const std::string& version) {
    MarkerEnvironment env = defaults();
    std::string v = trim(version);
    size_t dots = static_cast<size_t>(std::count(v.begin(), v.end(), '.'));
    if (dots >= 2) {
        env.values["python_full_version"] = v;
        size_t second = v.find('.', v.find('.') + 1);
        env.values["python_version"] = v.substr(0, second);
    } else {
        env.values["python_version"] = v;
        env.values["python_full_version"] = v + ".0";
    }
    env.values["implementation_version"] = env.values["python_full_version"];
    return env;
}

std::optional<std::string> MarkerEnvironment::get(const std::string& variable) const {
    auto it = values.find(variable);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

void MarkerEnvironment::set(const std::string& variable, std::string value) {
    values[variable] = std::move(value);
}

// ---------------------------------------------------------------------------
// Marker static constructors
// ---------------------------------------------------------------------------

Marker Marker::leaf(std::string variable, MarkerOp op, std::string literal,
                    bool literal_first) {
    Marker m;
    m.kind_ = Leaf;
    m.variable_ = std::move(variable);
    m.op_ = op;
    m.literal_ = std::move(literal);
    m.literal_first_ = literal_first;
    return m;
}

Marker Marker::all(std::vector<Marker> children) {
    Marker m;
    m.kind_ = And;
    m.children_ = std::move(children);
    return m;
}

Marker Marker::any(std::vector<Marker> children) {
    Marker m;
    m.kind_ = Or;
    m.children_ = std::move(children);
    return m;
}

Result<Marker> Marker::parse(const std::string& input) {
    if (trim(input).empty()) {
        return PinionError{PinionError::Parse, "empty marker"};
    }

    Parser parser(input);
    auto result = parser.parse_or();
    if (result.is_err()) {
        auto err = std::move(result).error();
        err.message += " in '" + input + "'";
        return err;
    }

    parser.skip_ws();
    if (!parser.at_end()) {
        return PinionError{PinionError::Parse,
            "unexpected characters after marker '" + input + "'",
            "at position " + std::to_string(parser.pos)};
    }

    return result;
}

// ---------------------------------------------------------------------------
// Evaluator
// ---------------------------------------------------------------------------

static Result<bool> evaluate_leaf(const Marker& m, const MarkerEnvironment& env,
                                  const std::vector<std::string>& extras) {
    if (m.variable() == "extra") {
        std::string wanted = normalize_name(m.literal());
        bool any = std::any_of(extras.begin(), extras.end(),
            [&](const std::string& e) { return normalize_name(e) == wanted; });
        switch (m.op()) {
            case MarkerOp::Eq:
            case MarkerOp::In:    return Result<bool>::ok(any);
            case MarkerOp::Ne:
            case MarkerOp::NotIn: return Result<bool>::ok(!any);
            default:
                return PinionError{PinionError::Parse,
                    std::string("operator '") + marker_op_string(m.op()) +
                    "' cannot compare extras"};
        }
    }

    auto value = env.get(m.variable());
    if (!value) {
        return PinionError{PinionError::Parse,
            "marker variable '" + m.variable() + "' has no value in the environment"};
    }

    if (m.op() == MarkerOp::In || m.op() == MarkerOp::NotIn) {
        bool hit;
        if (is_version_variable(m.variable()) && !m.literal_first()) {
            auto current = Version::parse(*value);
            if (current.is_err()) return std::move(current).error();
            auto members = split_members(m.literal());
            hit = std::any_of(members.begin(), members.end(),
                [&](const std::string& member) {
                    auto v = Version::parse(member);
                    return v.is_ok() && v.value().compare(current.value()) == 0;
                });
        } else if (m.literal_first()) {
            hit = value->find(m.literal()) != std::string::npos;
        } else {
            hit = m.literal().find(*value) != std::string::npos;
        }
        return Result<bool>::ok(m.op() == MarkerOp::In ? hit : !hit);
    }

    MarkerOp op = m.literal_first() ? flip(m.op()) : m.op();

    if (is_version_variable(m.variable())) {
        auto current = Version::parse(*value);
        if (current.is_err()) {
            return PinionError{PinionError::Parse,
                "environment value '" + *value + "' of " + m.variable() +
                " is not a version"};
        }
        auto spec = VersionSpecifier::parse(spec_op_string(to_spec_op(op)) + m.literal());
        if (spec.is_err()) return std::move(spec).error();
        return Result<bool>::ok(spec.value().contains(current.value()));
    }

    const std::string& lhs = *value;
    const std::string& rhs = m.literal();
    int cmp;
    auto lv = Version::parse(lhs);
    auto rv = Version::parse(rhs);
    if (op != MarkerOp::Eq && op != MarkerOp::Ne && lv.is_ok() && rv.is_ok()) {
        cmp = lv.value().compare(rv.value());
    } else {
        cmp = lhs.compare(rhs);
    }

    switch (op) {
        case MarkerOp::Eq: return Result<bool>::ok(cmp == 0);
        case MarkerOp::Ne: return Result<bool>::ok(cmp != 0);
        case MarkerOp::Lt: return Result<bool>::ok(cmp < 0);
        case MarkerOp::Le: return Result<bool>::ok(cmp <= 0);
        case MarkerOp::Gt: return Result<bool>::ok(cmp > 0);
        case MarkerOp::Ge: return Result<bool>::ok(cmp >= 0);
        default:           return Result<bool>::ok(false);
    }
}

Result<bool> Marker::evaluate(const MarkerEnvironment& env,
                              const std::vector<std::string>& extras) const {
    switch (kind_) {
    case Leaf:
        return evaluate_leaf(*this, env, extras);
    case And:
        for (const auto& c : children_) {
            auto r = c.evaluate(env, extras);
            if (r.is_err() || !r.value()) return r;
        }
        return Result<bool>::ok(true);
    case Or:
        for (const auto& c : children_) {
            auto r = c.evaluate(env, extras);
            if (r.is_err() || r.value()) return r;
        }
        return Result<bool>::ok(false);
    }
    return Result<bool>::ok(false); // unreachable
}

// ---------------------------------------------------------------------------
// to_string
// ---------------------------------------------------------------------------

std::string Marker::to_string() const {
    if (kind_ == Leaf) {
        char q = literal_.find('\'') == std::string::npos ? '\'' : '"';
        std::string quoted = q + literal_ + q;
        if (literal_first_) {
            return quoted + " " + marker_op_string(op_) + " " + variable_;
        }
        return variable_ + " " + marker_op_string(op_) + " " + quoted;
    }

    std::string s;
    const char* sep = kind_ == And ? " and " : " or ";
    for (size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) s += sep;
        if (children_[i].kind() == Leaf) {
            s += children_[i].to_string();
        } else {
            s += "(" + children_[i].to_string() + ")";
        }
    }
    return s;
}

bool Marker::operator==(const Marker& o) const {
    if (kind_ != o.kind_) return false;
    if (kind_ == Leaf) {
        return variable_ == o.variable_ && op_ == o.op_ &&
               literal_ == o.literal_ && literal_first_ == o.literal_first_;
    }
    return children_ == o.children_;
}

bool Marker::operator!=(const Marker& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// Tree queries and rewrites
// ---------------------------------------------------------------------------

std::pair<std::optional<Marker>, bool> strip(const Marker& m, const std::string& variable) {
    if (m.kind() == Marker::Leaf) {
        if (m.variable() == variable) return {std::nullopt, true};
        return {m, false};
    }

    bool removed = false;
    std::vector<Marker> kept;
    for (const auto& c : m.children()) {
        auto [rest, gone] = strip(c, variable);
        removed = removed || gone;
        if (rest) kept.push_back(std::move(*rest));
    }

    if (kept.empty()) return {std::nullopt, removed};
    if (kept.size() == 1) return {std::move(kept.front()), removed};
    if (m.kind() == Marker::And) return {Marker::all(std::move(kept)), removed};
    return {Marker::any(std::move(kept)), removed};
}

std::set<std::string> collect(const Marker& m, const std::string& variable) {
    std::set<std::string> out;
    if (m.kind() == Marker::Leaf) {
        if (m.variable() == variable) out.insert(m.literal());
        return out;
    }
    for (const auto& c : m.children()) {
        auto sub = collect(c, variable);
        out.insert(sub.begin(), sub.end());
    }
    return out;
}

bool contains(const Marker& m, const std::string& variable) {
    if (m.kind() == Marker::Leaf) return m.variable() == variable;
    return std::any_of(m.children().begin(), m.children().end(),
        [&](const Marker& c) { return contains(c, variable); });
}

std::optional<Marker> python_subtree(const Marker& m) {
    if (m.kind() == Marker::Leaf) {
        if (is_python_variable(m.variable())) return m;
        return std::nullopt;
    }

    std::vector<Marker> kept;
    for (const auto& c : m.children()) {
        auto sub = python_subtree(c);
        if (sub) kept.push_back(std::move(*sub));
    }
    if (kept.empty()) return std::nullopt;
    if (kept.size() == 1) return kept.front();
    if (m.kind() == Marker::And) return Marker::all(std::move(kept));
    return Marker::any(std::move(kept));
}

static int op_family(SpecOp op) {
    switch (op) {
        case SpecOp::Gt: case SpecOp::Ge: return 1;
        case SpecOp::Lt: case SpecOp::Le: return 2;
        case SpecOp::Eq: case SpecOp::In: return 3;
        default:                          return 0;
    }
}

Result<SpecifierSet> to_specifier_set(const Marker& m) {
    if (m.kind() == Marker::Leaf) {
        if (!is_python_variable(m.variable())) {
            return PinionError{PinionError::InvalidArg,
                "'" + m.variable() + "' is not a python version clause"};
        }
        SpecifierSet set;
        MarkerOp op = m.literal_first() ? flip(m.op()) : m.op();
        if (op == MarkerOp::In || op == MarkerOp::NotIn) {
            set.add(VersionSpecifier::membership(to_spec_op(op), split_members(m.literal())));
            return Result<SpecifierSet>::ok(std::move(set));
        }
        auto spec = VersionSpecifier::parse(spec_op_string(to_spec_op(op)) + m.literal());
        if (spec.is_err()) return std::move(spec).error();
        set.add(std::move(spec).value());
        return Result<SpecifierSet>::ok(std::move(set));
    }

    std::vector<SpecifierSet> parts;
    for (const auto& c : m.children()) {
        auto sub = to_specifier_set(c);
        if (sub.is_err()) return sub;
        parts.push_back(std::move(sub).value());
    }

    SpecifierSet united;
    for (const auto& p : parts) united = united.intersect(p);

    if (m.kind() == Marker::And) return collapse(united, Join::And);

    // A union folds into one set only when every branch is a single bound
    // from the same operator family
    int family = -1;
    for (const auto& p : parts) {
        int f = p.size() == 1 ? op_family(p.specs().front().op) : 0;
        if (f == 0 || (family != -1 && f != family)) {
            return PinionError{PinionError::InvalidArg,
                "python clauses joined by 'or' do not form one range: " + m.to_string()};
        }
        family = f;
    }
    return collapse(united, Join::Or);
}

static Result<std::optional<Marker>> rebuild_python(const Marker& python_part) {
    auto spec = to_specifier_set(python_part);
    if (spec.has_error(PinionError::InvalidArg)) {
        return Result<std::optional<Marker>>::ok(std::nullopt);
    }
    if (spec.is_err()) return std::move(spec).error();
    auto leaves = specifier_to_leaves(spec.value());
    if (leaves.is_err()) return std::move(leaves).error();
    auto& ls = leaves.value();
    if (ls.empty()) return Result<std::optional<Marker>>::ok(std::nullopt);
    if (ls.size() == 1) return Result<std::optional<Marker>>::ok(ls.front());
    return Result<std::optional<Marker>>::ok(Marker::all(std::move(ls)));
}

Result<Marker> normalize(const Marker& m) {
    if (!has_python_leaf(m)) return Result<Marker>::ok(m);

    if (is_python_only(m)) {
        auto rebuilt = rebuild_python(m);
        if (rebuilt.is_err()) return std::move(rebuilt).error();
        return Result<Marker>::ok(rebuilt.value() ? *rebuilt.value() : m);
    }

    if (m.kind() != Marker::And) return Result<Marker>::ok(m);

    std::vector<Marker> python_kids;
    std::vector<Marker> other_kids;
    for (const auto& c : m.children()) {
        if (is_python_only(c)) {
            python_kids.push_back(c);
        } else if (has_python_leaf(c)) {
            // python clause tangled with other variables: leave as written
            return Result<Marker>::ok(m);
        } else {
            other_kids.push_back(c);
        }
    }

    Marker python_part = python_kids.size() == 1 ? python_kids.front()
                                                 : Marker::all(python_kids);
    auto rebuilt = rebuild_python(python_part);
    if (rebuilt.is_err()) return std::move(rebuilt).error();
    if (!rebuilt.value()) return Result<Marker>::ok(m);

    Marker out = *rebuilt.value();
    for (const auto& other : other_kids) out = and_markers(out, other);
    return Result<Marker>::ok(std::move(out));
}

Marker and_markers(const Marker& a, const Marker& b) {
    return combine(Marker::And, a, b);
}

Marker or_markers(const Marker& a, const Marker& b) {
    return combine(Marker::Or, a, b);
}

Result<std::optional<Marker>> merge(const std::optional<Marker>& a,
                                    const std::optional<Marker>& b) {
    if (!a) return Result<std::optional<Marker>>::ok(b);
    if (!b) return Result<std::optional<Marker>>::ok(a);

    auto na = normalize(*a);
    if (na.is_err()) return std::move(na).error();
    auto nb = normalize(*b);
    if (nb.is_err()) return std::move(nb).error();

    auto merged = normalize(and_markers(na.value(), nb.value()));
    if (merged.is_err()) return std::move(merged).error();
    return Result<std::optional<Marker>>::ok(std::move(merged).value());
}

Result<std::optional<Marker>> marker_from_specifier(const std::string& spec) {
    std::string text = trim(spec);
    if (text.empty() || text == "*" || text == "any") {
        return Result<std::optional<Marker>>::ok(std::nullopt);
    }

    auto set = SpecifierSet::parse(text);
    if (set.is_err()) return std::move(set).error();
    auto collapsed = collapse(set.value(), Join::And);
    if (collapsed.is_err()) return std::move(collapsed).error();

    auto leaves = specifier_to_leaves(collapsed.value());
    if (leaves.is_err()) return std::move(leaves).error();
    auto& ls = leaves.value();
    if (ls.empty()) return Result<std::optional<Marker>>::ok(std::nullopt);
    if (ls.size() == 1) return Result<std::optional<Marker>>::ok(ls.front());
    return Result<std::optional<Marker>>::ok(Marker::all(std::move(ls)));
}

Result<std::optional<Marker>> marker_from_manifest(
    const std::map<std::string, std::string>& keys, const std::string& markers) {
    std::vector<std::string> pieces;
    for (const auto& [key, value] : keys) {
        if (!is_marker_variable(key)) {
            return PinionError{PinionError::Parse,
                "unknown marker key '" + key + "'"};
        }
        std::string v = trim(value);
        if (v.empty()) continue;
        pieces.push_back(key + " " + v);
    }
    if (!trim(markers).empty()) pieces.push_back(trim(markers));
    if (pieces.empty()) return Result<std::optional<Marker>>::ok(std::nullopt);

    std::sort(pieces.begin(), pieces.end());
    for (auto& p : pieces) {
        if (p.find(" or ") != std::string::npos) p = "(" + p + ")";
    }

    auto parsed = Marker::parse(join(pieces, " and "));
    if (parsed.is_err()) return std::move(parsed).error();
    return Result<std::optional<Marker>>::ok(std::move(parsed).value());
}

} // namespace pinion
