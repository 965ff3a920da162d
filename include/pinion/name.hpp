#pragma once

#include <pinion/result.hpp>
#include <string>
#include <vector>

namespace pinion {

// Package name: [A-Za-z0-9]([A-Za-z0-9._-]*[A-Za-z0-9])?
// Normalized form: lowercase, runs of '_', '.' and '-' collapsed to '-'
struct PkgName {
    static Result<PkgName> parse(const std::string& raw);

    const std::string& raw() const;
    const std::string& normalized() const;

    bool operator==(const PkgName& o) const;
    bool operator!=(const PkgName& o) const;

private:
    std::string raw_;
    std::string normalized_;
};

// Normalize without validating; used for map keys and comparisons
std::string normalize_name(const std::string& raw);

bool is_valid_name(const std::string& raw);

// Extras: lowercased, sorted, deduplicated, empty entries dropped
std::vector<std::string> normalize_extras(const std::vector<std::string>& extras);

// "a, B,c" -> ["a", "b", "c"]. Input may include the surrounding brackets.
std::vector<std::string> parse_extras(const std::string& text);

// ["a", "b"] -> "[a,b]"; empty input yields ""
std::string extras_to_string(const std::vector<std::string>& extras);

} // namespace pinion
