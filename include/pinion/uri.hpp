#pragma once

#include <pinion/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

// Recognized VCS prefixes ("git+https://...") and plain URL schemes
extern const std::vector<std::string> VCS_SCHEMES;
extern const std::vector<std::string> URL_SCHEMES;

// Rendering options for Uri::to_string. Unset optionals follow the
// parsed form of the URI.
struct UriFormat {
    bool escape_password = true;        // replace the password with "----"
    std::optional<bool> direct;         // "name @ url"; default is_direct_url
    std::optional<bool> strip_ssh;      // "git+git@host:path"; default is_implicit_ssh
    bool strip_ref = false;
    bool strip_name = false;            // drop "#egg=name[extras]"
    bool strip_subdir = false;
};

struct Uri {
    std::string scheme;                 // "https", "git+ssh", "file", ...
    std::string host;
    std::optional<uint16_t> port;
    std::string path;                   // with leading '/', ref removed
    std::string query;                  // without '?', subdirectory removed
    std::string fragment;               // leftover items, egg/subdirectory removed
    std::string username;
    std::string password;
    std::string ref;                    // "@<ref>" suffix of a VCS path
    std::string name;                   // egg name or direct-url name
    std::vector<std::string> extras;    // normalized
    std::string subdirectory;
    bool is_direct_url = false;
    bool is_implicit_ssh = false;

    static Result<Uri> parse(const std::string& s);

    std::string to_string(const UriFormat& fmt = UriFormat{}) const;

    std::string bare_url() const;             // no name, ref or subdirectory
    std::string url_without_fragment() const;
    std::string url_without_ref() const;
    std::string safe_string() const;          // password redacted
    std::string full_url() const;             // unredacted, never direct form

    // URL handed to the VCS tool: bare_url() without the "git+" prefix
    std::string without_vcs_prefix() const;

    bool is_vcs() const;
    bool is_file_url() const;
    std::string vcs() const;                  // "git", "hg", ...; empty if none
    std::string name_with_extras() const;

    bool operator==(const Uri& o) const;
    bool operator!=(const Uri& o) const;
};

// "name[extras] @ url" where url carries a scheme
bool looks_like_direct_url(const std::string& s);

} // namespace pinion
