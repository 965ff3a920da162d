#pragma once

#include <pinion/requirement.hpp>
#include <pinion/result.hpp>
#include <toml++/toml.hpp>
#include <map>
#include <string>

namespace pinion {

// One package record: a bare version string or an inline table with keys
// among version, extras, markers, editable, path, file, uri, git|hg|svn|bzr,
// ref, subdirectory, index, hashes and per-variable marker keys.
Result<ManifestEntry> entry_from_toml(const std::string& name, const toml::node& node);

// Bare entries become a plain version string
void insert_entry(toml::table& tbl, const std::string& name, const ManifestEntry& entry);

// Every record of a [packages]-style table; a missing table is empty
Result<std::map<std::string, ManifestEntry>> entries_from_table(const toml::table* tbl);

toml::table entries_to_table(const std::map<std::string, ManifestEntry>& entries);

} // namespace pinion
