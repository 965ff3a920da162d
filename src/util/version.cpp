#include <pinion/version.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <tuple>

namespace pinion {

// ---------------------------------------------------------------------------
// Parsing helpers
// ---------------------------------------------------------------------------

namespace {

struct Cursor {
    const std::string& s;
    size_t pos = 0;
    bool overflow = false;  // a number did not fit in 64 bits

    explicit Cursor(const std::string& str) : s(str) {}

    bool at_end() const { return pos >= s.size(); }
    char peek() const { return at_end() ? '\0' : s[pos]; }

    bool is_digit() const {
        return !at_end() && std::isdigit(static_cast<unsigned char>(s[pos]));
    }

    bool try_consume(const std::string& word) {
        if (s.compare(pos, word.size(), word) == 0) {
            pos += word.size();
            return true;
        }
        return false;
    }

    void skip_separator() {
        if (!at_end() && (s[pos] == '.' || s[pos] == '-' || s[pos] == '_')) ++pos;
    }

    bool read_number(uint64_t& out) {
        if (!is_digit()) return false;
        constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
        uint64_t v = 0;
        while (is_digit()) {
            uint64_t d = static_cast<uint64_t>(s[pos] - '0');
            if (v > (max - d) / 10) overflow = true;
            else v = v * 10 + d;
            ++pos;
        }
        out = v;
        return true;
    }
};

// Longest spelling first so "alpha" is not read as "a" + garbage
const std::pair<const char*, const char*> PRE_SPELLINGS[] = {
    {"preview", "rc"}, {"alpha", "a"}, {"beta", "b"},
    {"pre", "rc"}, {"rc", "rc"}, {"a", "a"}, {"b", "b"}, {"c", "rc"},
};

const char* POST_SPELLINGS[] = {"post", "rev", "r"};

bool try_pre(Cursor& c, Version& v) {
    size_t saved = c.pos;
    c.skip_separator();
    for (const auto& [spelling, canonical] : PRE_SPELLINGS) {
        if (c.try_consume(spelling)) {
            v.pre_label = canonical;
            c.skip_separator();
            uint64_t n = 0;
            c.read_number(n);
            v.pre_number = n;
            return true;
        }
    }
    c.pos = saved;
    return false;
}

bool try_post(Cursor& c, Version& v) {
    size_t saved = c.pos;
    // Implicit post release: "1.0-1"
    if (c.peek() == '-') {
        ++c.pos;
        uint64_t n = 0;
        if (c.read_number(n)) {
            v.post = n;
            return true;
        }
        c.pos = saved;
    }
    c.skip_separator();
    for (const char* spelling : POST_SPELLINGS) {
        if (c.try_consume(spelling)) {
            c.skip_separator();
            uint64_t n = 0;
            c.read_number(n);
            v.post = n;
            return true;
        }
    }
    c.pos = saved;
    return false;
}

bool try_dev(Cursor& c, Version& v) {
    size_t saved = c.pos;
    c.skip_separator();
    if (c.try_consume("dev")) {
        c.skip_separator();
        uint64_t n = 0;
        c.read_number(n);
        v.dev = n;
        return true;
    }
    c.pos = saved;
    return false;
}

std::string lowercase_trimmed(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    std::string out = s.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    std::string text = lowercase_trimmed(s);
    if (text.empty()) {
        return PinionError{PinionError::Version, "empty version string"};
    }

    Cursor c(text);
    Version v;
    if (c.peek() == 'v') ++c.pos;

    uint64_t first = 0;
    if (!c.read_number(first)) {
        return PinionError{PinionError::Version,
            "invalid version '" + s + "'",
            "expected format: [N!]N(.N)*[{a|b|rc}N][.postN][.devN]"};
    }

    if (c.peek() == '!') {
        ++c.pos;
        v.epoch = first;
        if (!c.read_number(first)) {
            return PinionError{PinionError::Version,
                "missing release after epoch in '" + s + "'"};
        }
    }
    v.release.push_back(first);

    while (c.peek() == '.' && c.pos + 1 < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[c.pos + 1]))) {
        ++c.pos;
        uint64_t n = 0;
        c.read_number(n);
        v.release.push_back(n);
    }

    try_pre(c, v);
    try_post(c, v);
    try_dev(c, v);

    if (c.peek() == '+') {
        ++c.pos;
        v.local = text.substr(c.pos);
        if (v.local.empty()) {
            return PinionError{PinionError::Version,
                "empty local label after '+' in '" + s + "'"};
        }
        for (char& ch : v.local) {
            if (ch == '-' || ch == '_') ch = '.';
            if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '.') {
                return PinionError{PinionError::Version,
                    "invalid local label in '" + s + "'"};
            }
        }
        c.pos = text.size();
    }

    if (c.overflow) {
        return PinionError{PinionError::Version,
            "version '" + s + "' has a number out of range",
            "numeric segments must fit in 64 bits"};
    }

    if (!c.at_end()) {
        return PinionError{PinionError::Version,
            "invalid version '" + s + "'",
            "unexpected '" + text.substr(c.pos) + "'"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s;
    if (epoch != 0) s += std::to_string(epoch) + "!";
    s += join_version(release);
    if (!pre_label.empty()) s += pre_label + std::to_string(pre_number);
    if (post) s += ".post" + std::to_string(*post);
    if (dev) s += ".dev" + std::to_string(*dev);
    if (!local.empty()) s += "+" + local;
    return s;
}

bool Version::is_prerelease() const {
    return !pre_label.empty() || dev.has_value();
}

bool Version::is_postrelease() const {
    return post.has_value();
}

uint64_t Version::segment(size_t i) const {
    return i < release.size() ? release[i] : 0;
}

Version Version::base() const {
    Version b;
    b.epoch = epoch;
    b.release = release;
    return b;
}

// Sort key per PEP 440: a dev release without pre/post sorts before
// every pre-release of the same release.
static std::tuple<int, uint64_t, int, uint64_t, int, uint64_t>
suffix_key(const Version& v) {
    int pre_phase = 3;
    if (!v.pre_label.empty()) {
        pre_phase = v.pre_label == "a" ? 0 : (v.pre_label == "b" ? 1 : 2);
    } else if (v.dev && !v.post) {
        pre_phase = -1;
    }
    int has_post = v.post ? 1 : 0;
    int no_dev = v.dev ? 0 : 1;
    return {pre_phase, v.pre_number, has_post, v.post.value_or(0),
            no_dev, v.dev.value_or(0)};
}

int Version::compare(const Version& o) const {
    if (epoch != o.epoch) return epoch < o.epoch ? -1 : 1;

    size_t n = std::max(release.size(), o.release.size());
    for (size_t i = 0; i < n; ++i) {
        uint64_t a = segment(i);
        uint64_t b = o.segment(i);
        if (a != b) return a < b ? -1 : 1;
    }

    auto ka = suffix_key(*this);
    auto kb = suffix_key(o);
    if (ka != kb) return ka < kb ? -1 : 1;
    return 0;
}

// PEP 440 local ordering: segments split on '.', numeric segments compare
// numerically and sort after alphanumeric ones, a longer label wins a tie.
static int compare_local(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    if (a.empty()) return -1;
    if (b.empty()) return 1;

    auto split = [](const std::string& text) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t dot = text.find('.', start);
            parts.push_back(text.substr(start, dot == std::string::npos ? dot : dot - start));
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        return parts;
    };
    auto numeric = [](const std::string& p) {
        return !p.empty() && std::all_of(p.begin(), p.end(),
            [](unsigned char ch) { return std::isdigit(ch) != 0; });
    };

    auto pa = split(a);
    auto pb = split(b);
    for (size_t i = 0; i < pa.size() && i < pb.size(); ++i) {
        bool na = numeric(pa[i]);
        bool nb = numeric(pb[i]);
        if (na != nb) return na ? 1 : -1;
        if (na) {
            // Strip leading zeros, then a longer digit string is larger
            std::string da = pa[i].substr(std::min(pa[i].find_first_not_of('0'), pa[i].size()));
            std::string db = pb[i].substr(std::min(pb[i].find_first_not_of('0'), pb[i].size()));
            if (da.size() != db.size()) return da.size() < db.size() ? -1 : 1;
            if (da != db) return da < db ? -1 : 1;
        } else if (pa[i] != pb[i]) {
            return pa[i] < pb[i] ? -1 : 1;
        }
    }
    if (pa.size() != pb.size()) return pa.size() < pb.size() ? -1 : 1;
    return a < b ? -1 : 1;
}

int Version::total_compare(const Version& o) const {
    int c = compare(o);
    return c != 0 ? c : compare_local(local, o.local);
}

bool Version::operator==(const Version& o) const { return total_compare(o) == 0; }
bool Version::operator!=(const Version& o) const { return total_compare(o) != 0; }
bool Version::operator<(const Version& o) const { return total_compare(o) < 0; }
bool Version::operator<=(const Version& o) const { return total_compare(o) <= 0; }
bool Version::operator>(const Version& o) const { return total_compare(o) > 0; }
bool Version::operator>=(const Version& o) const { return total_compare(o) >= 0; }

// ---------------------------------------------------------------------------
// Tuple helpers
// ---------------------------------------------------------------------------

Result<std::vector<uint64_t>> tuplize(const std::string& version) {
    std::vector<uint64_t> out;
    if (version.empty()) {
        return PinionError{PinionError::Version, "empty version string"};
    }

    size_t start = 0;
    while (start <= version.size()) {
        size_t dot = version.find('.', start);
        std::string part = version.substr(start,
            dot == std::string::npos ? std::string::npos : dot - start);

        if (part == "*") break;
        if (part.empty() ||
            !std::all_of(part.begin(), part.end(),
                         [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            return PinionError{PinionError::Version,
                "malformed version '" + version + "'",
                "segment '" + part + "' is not numeric"};
        }
        uint64_t n = 0;
        auto [end, ec] = std::from_chars(part.data(), part.data() + part.size(), n);
        if (ec != std::errc() || end != part.data() + part.size()) {
            return PinionError{PinionError::Version,
                "malformed version '" + version + "'",
                "segment '" + part + "' is out of range"};
        }
        out.push_back(n);

        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    return Result<std::vector<uint64_t>>::ok(std::move(out));
}

std::string join_version(const std::vector<uint64_t>& parts) {
    std::string s;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(parts[i]);
    }
    return s;
}

} // namespace pinion
