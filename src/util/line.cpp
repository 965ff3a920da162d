#include <pinion/line.hpp>
#include <pinion/name.hpp>
#include <pinion/specifier.hpp>
#include <algorithm>
#include <cctype>

namespace pinion {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> tokens;
    std::string cur;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            if (!cur.empty()) tokens.push_back(std::move(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) tokens.push_back(std::move(cur));
    return tokens;
}

// First "--hash" flag that starts a token
size_t find_hash_flag(const std::string& s) {
    size_t pos = 0;
    while ((pos = s.find("--hash", pos)) != std::string::npos) {
        if (pos == 0 || s[pos - 1] == ' ' || s[pos - 1] == '\t') return pos;
        pos += 6;
    }
    return std::string::npos;
}

PinionError unparsable(const std::string& line) {
    return PinionError{PinionError::Unparsable,
        "cannot parse requirement '" + line + "'",
        "expected name[extras][specifier], a URL, a VCS URL or a local path"};
}

// Pull the --hash tokens off the end of the line
Status take_hashes(std::string& text, std::vector<std::string>& hashes) {
    size_t pos = find_hash_flag(text);
    if (pos == std::string::npos) return ok_status();

    auto tokens = split_ws(text.substr(pos));
    text = trim(text.substr(0, pos));

    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string value;
        if (tokens[i] == "--hash") {
            if (i + 1 < tokens.size()) value = tokens[++i];
        } else if (starts_with(tokens[i], "--hash=")) {
            value = tokens[i].substr(7);
        } else {
            return PinionError{PinionError::Parse,
                "unexpected '" + tokens[i] + "' among --hash options"};
        }
        if (value.empty()) {
            return PinionError{PinionError::Parse, "--hash given without a value"};
        }
        hashes.push_back(value);
    }
    return ok_status();
}

bool begins_with_url_scheme(const std::string& text) {
    std::string l = lower(text);
    return std::any_of(URL_SCHEMES.begin(), URL_SCHEMES.end(),
        [&](const std::string& scheme) { return starts_with(l, scheme + ":"); });
}

bool begins_with_vcs_prefix(const std::string& text) {
    std::string l = lower(text);
    return std::any_of(VCS_SCHEMES.begin(), VCS_SCHEMES.end(),
        [&](const std::string& vcs) { return starts_with(l, vcs + "+"); });
}

Status parse_url_form(const std::string& text, ParsedLine& out) {
    auto uri = Uri::parse(text);
    if (uri.is_err()) return std::move(uri).error();

    Uri& u = uri.value();
    out.name = u.name;
    out.extras = u.extras;
    out.subdirectory = u.subdirectory;

    if (u.is_vcs()) {
        out.kind = LineKind::Vcs;
        out.vcs = u.vcs();
        out.ref = u.ref;
        if (out.name.empty()) {
            return PinionError{PinionError::MissingEgg,
                "VCS requirement '" + text + "' has no package name",
                "append #egg=<name> to the URL"};
        }
    } else {
        out.kind = LineKind::File;
    }
    out.uri = std::move(u);
    return ok_status();
}

Status parse_path_form(const std::string& text, ParsedLine& out) {
    std::string path = text;

    size_t hash = path.find('#');
    if (hash != std::string::npos) {
        std::string fragment = path.substr(hash + 1);
        path = path.substr(0, hash);
        size_t start = 0;
        while (start <= fragment.size()) {
            size_t amp = fragment.find('&', start);
            std::string item = fragment.substr(start,
                amp == std::string::npos ? std::string::npos : amp - start);
            if (starts_with(item, "egg=")) {
                std::string egg = item.substr(4);
                size_t open = egg.find('[');
                if (open != std::string::npos) {
                    out.extras = parse_extras(egg.substr(open));
                    egg = egg.substr(0, open);
                }
                if (!is_valid_name(egg)) {
                    return PinionError{PinionError::Parse,
                        "invalid egg fragment '" + item + "' in '" + text + "'"};
                }
                out.name = egg;
            } else if (starts_with(item, "subdirectory=")) {
                out.subdirectory = item.substr(13);
            }
            if (amp == std::string::npos) break;
            start = amp + 1;
        }
    }

    // "./pkg[dev]"
    if (!path.empty() && path.back() == ']') {
        size_t open = path.rfind('[');
        if (open != std::string::npos) {
            auto extras = parse_extras(path.substr(open));
            extras.insert(extras.end(), out.extras.begin(), out.extras.end());
            out.extras = extras;
            path = path.substr(0, open);
        }
    }

    out.extras = normalize_extras(out.extras);
    out.kind = LineKind::File;
    out.path = trim(path);
    if (out.path.empty()) {
        return PinionError{PinionError::Parse, "empty path in '" + text + "'"};
    }
    return ok_status();
}

Status parse_named_form(const std::string& text, ParsedLine& out) {
    size_t i = 0;
    while (i < text.size() && is_name_char(text[i])) ++i;
    std::string name = text.substr(0, i);
    std::string rest = trim(text.substr(i));

    if (!rest.empty() && rest[0] == '[') {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            return PinionError{PinionError::Parse,
                "unclosed extras bracket in '" + text + "'"};
        }
        out.extras = parse_extras(rest.substr(0, close + 1));
        rest = trim(rest.substr(close + 1));
    }

    // Legacy "name (>=1.0)"
    if (rest.size() >= 2 && rest.front() == '(' && rest.back() == ')') {
        rest = trim(rest.substr(1, rest.size() - 2));
    }

    if (!is_valid_name(name)) return unparsable(text);
    if (!rest.empty() && std::string("=!<>~").find(rest[0]) == std::string::npos) {
        return unparsable(text);
    }
    if (!rest.empty()) {
        auto spec = SpecifierSet::parse(rest);
        if (spec.is_err()) return std::move(spec).error();
    }

    out.kind = LineKind::Named;
    out.name = name;
    out.specifier = rest;
    return ok_status();
}

} // anonymous namespace

bool is_archive_file(const std::string& s) {
    static const char* EXTENSIONS[] = {
        ".zip", ".tar.gz", ".tgz", ".tar.bz2", ".tbz", ".tar.xz", ".txz", ".tar", ".whl",
    };
    std::string l = lower(s.substr(0, s.find('#')));
    return std::any_of(std::begin(EXTENSIONS), std::end(EXTENSIONS),
        [&](const char* ext) { return ends_with(l, ext); });
}

bool looks_like_path(const std::string& s) {
    if (s == "." || s == "..") return true;
    if (starts_with(s, "./") || starts_with(s, "../") || starts_with(s, "/") ||
        starts_with(s, "~") || starts_with(s, ".\\")) {
        return true;
    }
    std::string head = s.substr(0, s.find('#'));
    if (head.find('/') != std::string::npos || head.find('\\') != std::string::npos) {
        return true;
    }
    return is_archive_file(s);
}

Result<ParsedLine> parse_line(const std::string& line) {
    ParsedLine out;
    out.line = line;

    std::string text = trim(line);
    if (text.empty()) {
        return PinionError{PinionError::Unparsable, "empty requirement line"};
    }

    if (starts_with(text, "-e ") || starts_with(text, "-e\t")) {
        out.editable = true;
        text = trim(text.substr(2));
    } else if (starts_with(text, "--editable=")) {
        out.editable = true;
        text = trim(text.substr(11));
    } else if (starts_with(text, "--editable ")) {
        out.editable = true;
        text = trim(text.substr(10));
    }

    PINION_TRY(take_hashes(text, out.hashes));

    // "; " after a URL, so a ';' inside the URL itself is left alone
    std::string sep = begins_with_url_scheme(text) ? "; " : ";";
    size_t semi = text.find(sep);
    if (semi != std::string::npos) {
        out.markers = trim(text.substr(semi + sep.size()));
        text = trim(text.substr(0, semi));
        if (out.markers.empty()) {
            return PinionError{PinionError::Parse,
                "empty marker after ';' in '" + line + "'"};
        }
    }
    if (text.empty()) return unparsable(line);

    if (looks_like_direct_url(text) || begins_with_vcs_prefix(text) ||
        text.find("://") != std::string::npos || starts_with(lower(text), "file:")) {
        PINION_TRY(parse_url_form(text, out));
    } else if (looks_like_path(text)) {
        PINION_TRY(parse_path_form(text, out));
    } else {
        PINION_TRY(parse_named_form(text, out));
    }

    if (out.editable && out.kind == LineKind::Named) {
        return PinionError{PinionError::Unparsable,
            "editable requirement '" + text + "' is not a local path or VCS URL",
            "use -e with a directory or a VCS URL"};
    }

    return Result<ParsedLine>::ok(std::move(out));
}

} // namespace pinion
