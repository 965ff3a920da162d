#include <pinion/specifier.hpp>
#include <algorithm>
#include <cctype>
#include <tuple>

namespace pinion {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string strip_wildcard(const std::string& version) {
    std::string v = version;
    if (v.size() >= 2 && v.compare(v.size() - 2, 2, ".*") == 0) {
        v.resize(v.size() - 2);
    }
    while (!v.empty() && v.back() == '*') v.pop_back();
    return v;
}

static bool release_prefix_matches(const Version& v, const Version& prefix,
                                   size_t count) {
    if (v.epoch != prefix.epoch) return false;
    for (size_t i = 0; i < count; ++i) {
        if (v.segment(i) != prefix.segment(i)) return false;
    }
    return true;
}

const char* spec_op_string(SpecOp op) {
    switch (op) {
        case SpecOp::Eq:         return "==";
        case SpecOp::Ne:         return "!=";
        case SpecOp::Lt:         return "<";
        case SpecOp::Le:         return "<=";
        case SpecOp::Gt:         return ">";
        case SpecOp::Ge:         return ">=";
        case SpecOp::Compatible: return "~=";
        case SpecOp::Arbitrary:  return "===";
        case SpecOp::In:         return "in";
        case SpecOp::NotIn:      return "not in";
    }
    return "";
}

// ---------------------------------------------------------------------------
// VersionSpecifier
// ---------------------------------------------------------------------------

Result<VersionSpecifier> VersionSpecifier::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return PinionError{PinionError::Parse, "empty version specifier"};
    }

    static const std::pair<const char*, SpecOp> OPERATORS[] = {
        {"===", SpecOp::Arbitrary}, {"~=", SpecOp::Compatible},
        {"==", SpecOp::Eq}, {"!=", SpecOp::Ne},
        {"<=", SpecOp::Le}, {">=", SpecOp::Ge},
        {"<", SpecOp::Lt}, {">", SpecOp::Gt},
    };

    VersionSpecifier spec;
    std::string rest = text;
    for (const auto& [prefix, op] : OPERATORS) {
        size_t len = std::char_traits<char>::length(prefix);
        if (text.compare(0, len, prefix) == 0) {
            spec.op = op;
            rest = trim(text.substr(len));
            break;
        }
    }
    spec.version = rest;

    if (spec.version.empty()) {
        return PinionError{PinionError::Parse,
            "missing version in specifier '" + text + "'"};
    }
    if (spec.op == SpecOp::Arbitrary) {
        return Result<VersionSpecifier>::ok(std::move(spec));
    }

    bool wildcard = spec.has_wildcard();
    if (wildcard && spec.op != SpecOp::Eq && spec.op != SpecOp::Ne) {
        return PinionError{PinionError::Parse,
            "wildcard not allowed with '" + std::string(spec_op_string(spec.op)) +
            "' in '" + text + "'",
            "only == and != accept a trailing .*"};
    }

    auto parsed = Version::parse(wildcard ? strip_wildcard(spec.version) : spec.version);
    if (parsed.is_err()) {
        return PinionError{PinionError::Parse,
            "invalid version specifier '" + text + "'",
            parsed.error().message};
    }
    if (spec.op == SpecOp::Compatible && parsed.value().release.size() < 2) {
        return PinionError{PinionError::Parse,
            "'~=' needs at least two release segments in '" + text + "'"};
    }

    return Result<VersionSpecifier>::ok(std::move(spec));
}

VersionSpecifier VersionSpecifier::membership(SpecOp op, std::vector<std::string> values) {
    VersionSpecifier spec;
    spec.op = op;
    spec.members = std::move(values);
    for (size_t i = 0; i < spec.members.size(); ++i) {
        if (i > 0) spec.version += ", ";
        spec.version += spec.members[i];
    }
    return spec;
}

bool VersionSpecifier::has_wildcard() const {
    return !version.empty() && version.back() == '*';
}

bool VersionSpecifier::contains(const Version& v) const {
    if (op == SpecOp::In || op == SpecOp::NotIn) {
        bool any = std::any_of(members.begin(), members.end(),
            [&](const std::string& m) {
                auto spec = VersionSpecifier::parse("==" + m);
                return spec.is_ok() && spec.value().contains(v);
            });
        return op == SpecOp::In ? any : !any;
    }

    if (op == SpecOp::Arbitrary) {
        std::string a = v.to_string();
        std::string b = version;
        auto lower = [](std::string& s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        };
        lower(a);
        lower(b);
        return a == b;
    }

    if (has_wildcard()) {
        auto prefix = Version::parse(strip_wildcard(version));
        if (prefix.is_err()) return false;
        bool match = release_prefix_matches(v, prefix.value(),
                                            prefix.value().release.size());
        return op == SpecOp::Eq ? match : !match;
    }

    auto parsed = Version::parse(version);
    if (parsed.is_err()) return false;
    const Version& sv = parsed.value();

    switch (op) {
    case SpecOp::Eq:
        return sv.local.empty() ? v.compare(sv) == 0 : v == sv;
    case SpecOp::Ne:
        return sv.local.empty() ? v.compare(sv) != 0 : v != sv;
    case SpecOp::Le:
        return v.compare(sv) <= 0;
    case SpecOp::Ge:
        return v.compare(sv) >= 0;
    case SpecOp::Lt:
        // <3.0 excludes 3.0a1 unless the bound itself is a pre-release
        if (v.compare(sv) >= 0) return false;
        return sv.is_prerelease() || !v.is_prerelease() ||
               v.base().compare(sv.base()) != 0;
    case SpecOp::Gt:
        // >3.0 excludes 3.0.post1 unless the bound itself is a post-release
        if (v.compare(sv) <= 0) return false;
        return sv.is_postrelease() || !v.is_postrelease() ||
               v.base().compare(sv.base()) != 0;
    case SpecOp::Compatible:
        return v.compare(sv) >= 0 &&
               release_prefix_matches(v, sv, sv.release.size() - 1);
    default:
        return false;
    }
}

std::string VersionSpecifier::to_string() const {
    if (op == SpecOp::In || op == SpecOp::NotIn) {
        return std::string(spec_op_string(op)) + " " + version;
    }
    return std::string(spec_op_string(op)) + version;
}

bool VersionSpecifier::operator==(const VersionSpecifier& o) const {
    return op == o.op && version == o.version;
}

bool VersionSpecifier::operator!=(const VersionSpecifier& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// SpecifierSet
// ---------------------------------------------------------------------------

// Order by version (numerically where possible), then operator
static bool spec_less(const VersionSpecifier& a, const VersionSpecifier& b) {
    const std::string& va = a.members.empty() ? a.version : a.members.front();
    const std::string& vb = b.members.empty() ? b.version : b.members.front();
    auto pa = Version::parse(strip_wildcard(va));
    auto pb = Version::parse(strip_wildcard(vb));
    if (pa.is_ok() && pb.is_ok()) {
        int c = pa.value().compare(pb.value());
        if (c != 0) return c < 0;
    }
    if (va != vb) return va < vb;
    return static_cast<int>(a.op) < static_cast<int>(b.op);
}

Result<SpecifierSet> SpecifierSet::parse(const std::string& s) {
    SpecifierSet set;
    std::string text = trim(s);
    if (text.empty()) return Result<SpecifierSet>::ok(std::move(set));

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string token = text.substr(start,
            comma == std::string::npos ? std::string::npos : comma - start);
        if (trim(token).empty()) {
            return PinionError{PinionError::Parse,
                "empty specifier in '" + text + "'",
                "check for consecutive or trailing commas"};
        }
        auto spec = VersionSpecifier::parse(token);
        if (spec.is_err()) return std::move(spec).error();
        set.add(std::move(spec).value());

        if (comma == std::string::npos) break;
        start = comma + 1;
    }

    return Result<SpecifierSet>::ok(std::move(set));
}

void SpecifierSet::add(VersionSpecifier spec) {
    if (std::find(specs_.begin(), specs_.end(), spec) != specs_.end()) return;
    auto pos = std::upper_bound(specs_.begin(), specs_.end(), spec, spec_less);
    specs_.insert(pos, std::move(spec));
}

bool SpecifierSet::contains(const Version& v, bool allow_prereleases) const {
    if (v.is_prerelease() && !allow_prereleases) {
        bool names_prerelease = std::any_of(specs_.begin(), specs_.end(),
            [](const VersionSpecifier& s) {
                auto p = Version::parse(strip_wildcard(s.version));
                return p.is_ok() && p.value().is_prerelease();
            });
        if (!names_prerelease) return false;
    }
    return std::all_of(specs_.begin(), specs_.end(),
        [&](const VersionSpecifier& s) { return s.contains(v); });
}

std::vector<Version> SpecifierSet::filter(const std::vector<Version>& versions,
                                          bool allow_prereleases) const {
    std::vector<Version> out;
    for (const auto& v : versions) {
        if (contains(v, allow_prereleases)) out.push_back(v);
    }
    return out;
}

SpecifierSet SpecifierSet::intersect(const SpecifierSet& o) const {
    SpecifierSet out = *this;
    for (const auto& s : o.specs_) out.add(s);
    return out;
}

std::string SpecifierSet::to_string() const {
    std::string s;
    for (size_t i = 0; i < specs_.size(); ++i) {
        if (i > 0) s += ",";
        s += specs_[i].to_string();
    }
    return s;
}

bool SpecifierSet::operator==(const SpecifierSet& o) const {
    return specs_ == o.specs_;
}

bool SpecifierSet::operator!=(const SpecifierSet& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// Ceilings and open-bound normalization
// ---------------------------------------------------------------------------

VersionCeilings VersionCeilings::defaults() {
    VersionCeilings c;
    c.max_minor = {{1, 7}, {2, 7}, {3, 11}, {4, 0}};
    return c;
}

std::optional<uint64_t> VersionCeilings::ceiling(uint64_t major) const {
    auto it = max_minor.find(major);
    if (it == max_minor.end()) return std::nullopt;
    return it->second;
}

Result<SpecifierSet> normalize_open_bound(const VersionSpecifier& spec,
                                          const VersionCeilings& ceilings) {
    SpecifierSet out;
    VersionSpecifier s = spec;
    if (s.members.empty() && s.op != SpecOp::Arbitrary && s.has_wildcard()) {
        s.version = strip_wildcard(s.version);
    }

    if (s.op != SpecOp::Gt && s.op != SpecOp::Le) {
        out.add(std::move(s));
        return Result<SpecifierSet>::ok(std::move(out));
    }

    auto curr = tuplize(s.version);
    if (curr.is_err()) return std::move(curr).error();
    const auto& parts = curr.value();
    if (parts.empty()) {
        out.add(std::move(s));
        return Result<SpecifierSet>::ok(std::move(out));
    }

    std::vector<uint64_t> next = {parts[0], parts.size() >= 2 ? parts[1] + 1 : 1};
    auto ceiling = ceilings.ceiling(next[0]);
    if (!ceiling || next[1] > *ceiling) {
        out.add(std::move(s));
        return Result<SpecifierSet>::ok(std::move(out));
    }

    VersionSpecifier bumped;
    bumped.op = s.op == SpecOp::Gt ? SpecOp::Ge : SpecOp::Lt;
    bumped.version = join_version(next);
    out.add(std::move(bumped));
    return Result<SpecifierSet>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Grouping and collapsing
// ---------------------------------------------------------------------------

Result<std::vector<SpecGroup>> group_by_operator(const SpecifierSet& specs) {
    std::map<std::pair<int, bool>, std::vector<std::vector<uint64_t>>> buckets;

    auto add_one = [&](SpecOp op, const std::string& version) -> Status {
        auto parts = tuplize(version);
        if (parts.is_err()) return std::move(parts).error();
        bool multi = parts.value().size() > 2;
        buckets[{static_cast<int>(op), multi}].push_back(std::move(parts).value());
        return ok_status();
    };

    for (const auto& spec : specs.specs()) {
        if (spec.op == SpecOp::In || spec.op == SpecOp::NotIn) {
            SpecOp single = spec.op == SpecOp::In ? SpecOp::Eq : SpecOp::Ne;
            for (const auto& m : spec.members) {
                PINION_TRY(add_one(single, m));
            }
        } else {
            PINION_TRY(add_one(spec.op, spec.version));
        }
    }

    std::vector<SpecGroup> groups;
    for (auto& [key, versions] : buckets) {
        std::sort(versions.begin(), versions.end());
        versions.erase(std::unique(versions.begin(), versions.end()), versions.end());
        groups.push_back(SpecGroup{static_cast<SpecOp>(key.first), key.second,
                                   std::move(versions)});
    }
    return Result<std::vector<SpecGroup>>::ok(std::move(groups));
}

Result<SpecifierSet> collapse(const SpecifierSet& specs, Join join,
                              const VersionCeilings& ceilings) {
    SpecifierSet normalized;
    for (const auto& spec : specs.specs()) {
        if (spec.op == SpecOp::In || spec.op == SpecOp::NotIn) {
            normalized.add(spec);
            continue;
        }
        auto bounded = normalize_open_bound(spec, ceilings);
        if (bounded.is_err()) return std::move(bounded).error();
        for (const auto& s : bounded.value().specs()) normalized.add(s);
    }

    auto groups = group_by_operator(normalized);
    if (groups.is_err()) return std::move(groups).error();

    SpecifierSet out;
    for (const auto& g : groups.value()) {
        const auto& vs = g.versions;
        VersionSpecifier spec;
        spec.op = g.op;

        switch (g.op) {
        case SpecOp::Gt:
        case SpecOp::Ge:
            spec.version = join_version(join == Join::Or ? vs.front() : vs.back());
            out.add(std::move(spec));
            break;
        case SpecOp::Lt:
        case SpecOp::Le:
            spec.version = join_version(join == Join::Or ? vs.back() : vs.front());
            out.add(std::move(spec));
            break;
        case SpecOp::Eq:
        case SpecOp::Ne:
            if (vs.size() > 1) {
                std::vector<std::string> values;
                for (const auto& v : vs) values.push_back(join_version(v));
                out.add(VersionSpecifier::membership(
                    g.op == SpecOp::Eq ? SpecOp::In : SpecOp::NotIn, std::move(values)));
            } else {
                spec.version = join_version(vs.front());
                out.add(std::move(spec));
            }
            break;
        default:
            for (const auto& v : vs) {
                VersionSpecifier kept;
                kept.op = g.op;
                kept.version = join_version(v);
                out.add(std::move(kept));
            }
            break;
        }
    }

    return Result<SpecifierSet>::ok(std::move(out));
}

bool equivalent(const SpecifierSet& a, const SpecifierSet& b) {
    auto ca = collapse(a, Join::And);
    auto cb = collapse(b, Join::And);
    if (ca.is_err() || cb.is_err()) return a == b;
    return ca.value().to_string() == cb.value().to_string();
}

} // namespace pinion
