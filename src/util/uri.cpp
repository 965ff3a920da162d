#include <pinion/uri.hpp>
#include <pinion/name.hpp>
#include <algorithm>
#include <cctype>

namespace pinion {

const std::vector<std::string> VCS_SCHEMES = {"git", "hg", "svn", "bzr"};
const std::vector<std::string> URL_SCHEMES = {"http", "https", "ftp", "ftps", "file"};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos
                                                                 : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// "name[extra1,extra2]" -> name, extras. False if the name is not valid.
bool split_name_extras(const std::string& text, std::string& name,
                       std::vector<std::string>& extras) {
    std::string head = trim(text);
    std::string n = head;
    std::vector<std::string> e;
    size_t open = head.find('[');
    if (open != std::string::npos) {
        if (head.back() != ']') return false;
        n = trim(head.substr(0, open));
        e = parse_extras(head.substr(open));
    }
    if (!is_valid_name(n)) return false;
    name = n;
    extras = normalize_extras(e);
    return true;
}

bool has_vcs_prefix(const std::string& scheme) {
    size_t plus = scheme.find('+');
    if (plus == std::string::npos) return false;
    std::string vcs = scheme.substr(0, plus);
    return std::find(VCS_SCHEMES.begin(), VCS_SCHEMES.end(), vcs) != VCS_SCHEMES.end();
}

// "git+git@github.com:org/repo" is not a well-formed URI; rewrite it to
// "git+ssh://git@github.com/org/repo".
bool rewrite_implicit_ssh(std::string& text) {
    if (text.find("://") != std::string::npos) return false;
    size_t plus = text.find('+');
    size_t at = text.find('@');
    if (plus == std::string::npos || at == std::string::npos || plus > at) return false;
    size_t colon = text.find(':', at);
    if (colon == std::string::npos) return false;

    std::string vcs = lower(text.substr(0, plus));
    if (std::find(VCS_SCHEMES.begin(), VCS_SCHEMES.end(), vcs) == VCS_SCHEMES.end()) {
        return false;
    }
    text = text.substr(0, plus) + "+ssh://" + text.substr(plus + 1, colon - plus - 1) +
           "/" + text.substr(colon + 1);
    return true;
}

} // anonymous namespace

bool looks_like_direct_url(const std::string& s) {
    size_t at = s.find('@');
    if (at == std::string::npos) return false;

    std::string name;
    std::vector<std::string> extras;
    if (!split_name_extras(s.substr(0, at), name, extras)) return false;

    std::string tail = trim(s.substr(at + 1));
    return tail.find("://") != std::string::npos || lower(tail).compare(0, 5, "file:") == 0;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

Result<Uri> Uri::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return PinionError{PinionError::Parse, "empty URL"};
    }

    Uri uri;
    if (looks_like_direct_url(text)) {
        size_t at = text.find('@');
        split_name_extras(text.substr(0, at), uri.name, uri.extras);
        uri.is_direct_url = true;
        text = trim(text.substr(at + 1));
    }

    uri.is_implicit_ssh = rewrite_implicit_ssh(text);

    // Scheme and authority
    std::string rest;
    std::string netloc;
    size_t sep = text.find("://");
    if (sep != std::string::npos) {
        uri.scheme = lower(text.substr(0, sep));
        rest = text.substr(sep + 3);
        size_t end = rest.find_first_of("/?#");
        netloc = rest.substr(0, end);
        rest = end == std::string::npos ? "" : rest.substr(end);
    } else {
        // file:/path has no authority
        size_t colon = text.find(':');
        std::string scheme = colon == std::string::npos ? "" : lower(text.substr(0, colon));
        if (scheme != "file" && !(scheme.size() > 5 &&
                                  scheme.compare(scheme.size() - 5, 5, "+file") == 0)) {
            return PinionError{PinionError::Parse,
                "'" + s + "' is not a URL", "expected <scheme>://<host>/<path>"};
        }
        uri.scheme = scheme;
        rest = text.substr(colon + 1);
        if (rest.empty() || rest[0] != '/') {
            return PinionError{PinionError::Parse,
                "file URL must hold an absolute path: '" + s + "'"};
        }
    }

    if (uri.scheme.empty() || !std::all_of(uri.scheme.begin(), uri.scheme.end(), is_scheme_char)) {
        return PinionError{PinionError::Parse, "invalid URL scheme in '" + s + "'"};
    }

    // Credentials and host[:port]
    std::string hostport = netloc;
    size_t at = netloc.rfind('@');
    if (at != std::string::npos) {
        std::string auth = netloc.substr(0, at);
        hostport = netloc.substr(at + 1);
        size_t colon = auth.find(':');
        uri.username = auth.substr(0, colon);
        if (colon != std::string::npos) uri.password = auth.substr(colon + 1);
    }

    size_t port_sep = hostport.rfind(':');
    size_t bracket = hostport.rfind(']');
    if (port_sep != std::string::npos &&
        (bracket == std::string::npos || port_sep > bracket)) {
        std::string port = hostport.substr(port_sep + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }) || std::stoul(port) > 65535) {
            return PinionError{PinionError::Parse,
                "invalid port '" + port + "' in '" + s + "'"};
        }
        uri.port = static_cast<uint16_t>(std::stoul(port));
        hostport = hostport.substr(0, port_sep);
    }
    uri.host = lower(hostport);

    // Path, query, fragment
    size_t hash = rest.find('#');
    std::string fragment = hash == std::string::npos ? "" : rest.substr(hash + 1);
    rest = rest.substr(0, hash);
    size_t qmark = rest.find('?');
    std::string query = qmark == std::string::npos ? "" : rest.substr(qmark + 1);
    uri.path = rest.substr(0, qmark);

    std::vector<std::string> kept;
    if (!query.empty()) {
        for (const auto& item : split(query, '&')) {
            if (item.compare(0, 13, "subdirectory=") == 0) {
                uri.subdirectory = item.substr(13);
            } else if (!item.empty()) {
                kept.push_back(item);
            }
        }
    }
    uri.query = join(kept, '&');

    kept.clear();
    if (!fragment.empty()) {
        for (const auto& item : split(fragment, '&')) {
            if (item.compare(0, 4, "egg=") == 0) {
                std::string egg_name;
                std::vector<std::string> egg_extras;
                if (!split_name_extras(item.substr(4), egg_name, egg_extras)) {
                    return PinionError{PinionError::Parse,
                        "invalid egg fragment '" + item + "' in '" + s + "'"};
                }
                if (uri.name.empty()) uri.name = egg_name;
                egg_extras.insert(egg_extras.end(), uri.extras.begin(), uri.extras.end());
                uri.extras = normalize_extras(egg_extras);
            } else if (item.compare(0, 13, "subdirectory=") == 0) {
                uri.subdirectory = item.substr(13);
            } else if (!item.empty()) {
                kept.push_back(item);
            }
        }
    }
    uri.fragment = join(kept, '&');

    if (has_vcs_prefix(uri.scheme)) {
        size_t ref_at = uri.path.rfind('@');
        if (ref_at != std::string::npos) {
            uri.ref = uri.path.substr(ref_at + 1);
            uri.path = uri.path.substr(0, ref_at);
            if (uri.ref.empty()) {
                return PinionError{PinionError::Parse,
                    "empty ref after '@' in '" + s + "'"};
            }
        }
    }

    if (uri.host.empty() && !uri.is_file_url()) {
        return PinionError{PinionError::Parse,
            "URL '" + s + "' has no host"};
    }

    return Result<Uri>::ok(std::move(uri));
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string Uri::to_string(const UriFormat& fmt) const {
    bool direct = fmt.direct.value_or(is_direct_url) && !name.empty() && !fmt.strip_name;
    bool strip_ssh = fmt.strip_ssh.value_or(is_implicit_ssh) && !host.empty();

    std::string auth;
    if (!username.empty() || !password.empty()) {
        auth = username;
        if (!password.empty()) {
            auth += ":" + (fmt.escape_password ? std::string("----") : password);
        }
        auth += "@";
    }

    std::string url;
    if (strip_ssh) {
        size_t plus = scheme.find('+');
        if (plus != std::string::npos) url = scheme.substr(0, plus + 1);
        url += auth + host + ":" + (!path.empty() && path[0] == '/' ? path.substr(1) : path);
    } else {
        url = scheme + "://" + auth + host;
        if (port) url += ":" + std::to_string(*port);
        url += path;
    }

    if (!ref.empty() && !fmt.strip_ref) url += "@" + ref;
    if (!query.empty()) url += "?" + query;

    std::vector<std::string> frag;
    if (!name.empty() && !fmt.strip_name && !direct) {
        frag.push_back("egg=" + name_with_extras());
    }
    if (!subdirectory.empty() && !fmt.strip_subdir) {
        frag.push_back("subdirectory=" + subdirectory);
    }
    if (!fragment.empty()) frag.push_back(fragment);
    if (!frag.empty()) url += "#" + join(frag, '&');

    if (direct) return name_with_extras() + " @ " + url;
    return url;
}

std::string Uri::bare_url() const {
    UriFormat fmt;
    fmt.escape_password = false;
    fmt.direct = false;
    fmt.strip_ref = true;
    fmt.strip_name = true;
    fmt.strip_subdir = true;
    return to_string(fmt);
}

std::string Uri::url_without_fragment() const {
    UriFormat fmt;
    fmt.escape_password = false;
    fmt.direct = false;
    fmt.strip_name = true;
    fmt.strip_subdir = true;
    return to_string(fmt);
}

std::string Uri::url_without_ref() const {
    UriFormat fmt;
    fmt.escape_password = false;
    fmt.direct = false;
    fmt.strip_ref = true;
    return to_string(fmt);
}

std::string Uri::safe_string() const {
    return to_string(UriFormat{});
}

std::string Uri::full_url() const {
    UriFormat fmt;
    fmt.escape_password = false;
    fmt.direct = false;
    return to_string(fmt);
}

std::string Uri::without_vcs_prefix() const {
    Uri copy = *this;
    size_t plus = scheme.find('+');
    if (plus != std::string::npos) copy.scheme = scheme.substr(plus + 1);
    return copy.bare_url();
}

bool Uri::is_vcs() const {
    return has_vcs_prefix(scheme);
}

bool Uri::is_file_url() const {
    return scheme == "file" ||
           (scheme.size() > 5 && scheme.compare(scheme.size() - 5, 5, "+file") == 0);
}

std::string Uri::vcs() const {
    if (!is_vcs()) return "";
    return scheme.substr(0, scheme.find('+'));
}

std::string Uri::name_with_extras() const {
    return name + extras_to_string(extras);
}

bool Uri::operator==(const Uri& o) const {
    return scheme == o.scheme && host == o.host && port == o.port &&
           path == o.path && query == o.query && fragment == o.fragment &&
           username == o.username && password == o.password &&
           ref == o.ref && name == o.name && extras == o.extras &&
           subdirectory == o.subdirectory && is_direct_url == o.is_direct_url &&
           is_implicit_ssh == o.is_implicit_ssh;
}

bool Uri::operator!=(const Uri& o) const {
    return !(*this == o);
}

} // namespace pinion
