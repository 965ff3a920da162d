#pragma once

#include <pinion/pipfile.hpp>
#include <pinion/requirement.hpp>
#include <pinion/resolver.hpp>
#include <pinion/result.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pinion {

// Pipfile.lock, written as TOML:
//   [_meta]          pipfile-spec, hash.sha256, requires, sources
//   [default.<name>] / [develop.<name>]   lock entries
struct LockFile {
    static constexpr int64_t PIPFILE_SPEC = 6;

    std::string pipfile_hash;               // sha256 hex of Pipfile::to_toml()
    int64_t pipfile_spec = PIPFILE_SPEC;
    std::vector<PackageSource> sources;
    std::string python_version;
    std::string python_full_version;
    std::map<std::string, ManifestEntry> default_packages;
    std::map<std::string, ManifestEntry> develop;

    static Result<LockFile> parse(const std::string& toml_str);
    static Result<LockFile> load(const std::string& path);
    Status save(const std::string& path) const;
    std::string to_toml() const;

    static std::string hash_of(const Pipfile& pipfile);

    // Meta from the Pipfile, entries from a resolution. The set goes to
    // [develop] when dev is set, [default] otherwise.
    static Result<LockFile> from_resolved(const Pipfile& pipfile, const ResolvedSet& resolved,
                                          bool dev = false);
    Status add_resolved(const ResolvedSet& resolved, bool dev);

    // True when the Pipfile changed since this lock was written
    bool is_stale(const Pipfile& pipfile) const;

    Result<std::vector<Requirement>> requirements(bool dev = false) const;
};

} // namespace pinion
