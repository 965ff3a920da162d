#pragma once

#include <pinion/result.hpp>
#include <string>
#include <vector>

namespace pinion {

// Package metadata as published by an index or read from a source tree
struct PackageMetadata {
    std::string name;
    std::string version;
    std::vector<std::string> dependencies;   // requirement lines
    std::string requires_python;             // specifier, empty if any
};

// Read [project] from <dir>/pyproject.toml
Result<PackageMetadata> read_local_metadata(const std::string& dir);

// Same, from TOML text
Result<PackageMetadata> parse_pyproject(const std::string& toml_str);

} // namespace pinion
