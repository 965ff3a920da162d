#pragma once

#include <pinion/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

// PEP 440 version: [N!]N(.N)*[{a|b|rc}N][.postN][.devN][+local]
struct Version {
    uint64_t epoch = 0;
    std::vector<uint64_t> release;
    std::string pre_label;          // "a", "b", "rc"; empty for none
    uint64_t pre_number = 0;
    std::optional<uint64_t> post;
    std::optional<uint64_t> dev;
    std::string local;              // ignored by compare(), tiebreak in the operators

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const;
    bool is_postrelease() const;

    // Release segment at index i, zero when absent
    uint64_t segment(size_t i) const;

    // Version with pre/post/dev/local dropped
    Version base() const;

    // Public-version ordering, local label ignored. Specifier matching uses this.
    int compare(const Version& o) const;
    // compare() with the local label as tiebreaker; "1.0" < "1.0+a" < "1.0+b"
    int total_compare(const Version& o) const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Split on '.', stop at the first '*' segment, parse the rest as integers.
// "3.7.*" -> {3, 7}. Fails on any non-numeric segment.
Result<std::vector<uint64_t>> tuplize(const std::string& version);

// {3, 7} -> "3.7"
std::string join_version(const std::vector<uint64_t>& parts);

} // namespace pinion
