#include <pinion/name.hpp>
#include <algorithm>
#include <cctype>

namespace pinion {

static bool is_name_edge(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

static bool is_name_inner(char c) {
    return is_name_edge(c) || c == '_' || c == '-' || c == '.';
}

bool is_valid_name(const std::string& raw) {
    if (raw.empty()) return false;
    if (!is_name_edge(raw.front()) || !is_name_edge(raw.back())) return false;
    return std::all_of(raw.begin(), raw.end(), is_name_inner);
}

std::string normalize_name(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    bool in_sep = false;
    for (char c : raw) {
        if (c == '_' || c == '.' || c == '-') {
            if (!in_sep) out += '-';
            in_sep = true;
            continue;
        }
        in_sep = false;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

Result<PkgName> PkgName::parse(const std::string& raw) {
    if (raw.empty()) {
        return PinionError{PinionError::InvalidArg, "empty package name"};
    }

    if (!is_name_edge(raw.front()) || !is_name_edge(raw.back())) {
        return PinionError{PinionError::InvalidArg,
            "invalid package name '" + raw + "'",
            "package names must start and end with a letter or digit"};
    }

    for (char c : raw) {
        if (!is_name_inner(c)) {
            return PinionError{PinionError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in package name '" + raw + "'",
                "allowed: [A-Za-z0-9._-]"};
        }
    }

    PkgName name;
    name.raw_ = raw;
    name.normalized_ = normalize_name(raw);
    return Result<PkgName>::ok(std::move(name));
}

const std::string& PkgName::raw() const { return raw_; }
const std::string& PkgName::normalized() const { return normalized_; }

bool PkgName::operator==(const PkgName& o) const {
    return normalized_ == o.normalized_;
}

bool PkgName::operator!=(const PkgName& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// Extras
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> normalize_extras(const std::vector<std::string>& extras) {
    std::vector<std::string> out;
    for (const auto& e : extras) {
        std::string t = trim(e);
        if (t.empty()) continue;
        std::transform(t.begin(), t.end(), t.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out.push_back(std::move(t));
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<std::string> parse_extras(const std::string& text) {
    std::string body = trim(text);
    if (!body.empty() && body.front() == '[') body.erase(0, 1);
    if (!body.empty() && body.back() == ']') body.pop_back();

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        if (comma == std::string::npos) {
            parts.push_back(body.substr(start));
            break;
        }
        parts.push_back(body.substr(start, comma - start));
        start = comma + 1;
    }
    return normalize_extras(parts);
}

std::string extras_to_string(const std::vector<std::string>& extras) {
    if (extras.empty()) return "";
    std::string s = "[";
    for (size_t i = 0; i < extras.size(); ++i) {
        if (i > 0) s += ",";
        s += extras[i];
    }
    s += "]";
    return s;
}

} // namespace pinion
