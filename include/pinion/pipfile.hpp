#pragma once

#include <pinion/requirement.hpp>
#include <pinion/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace pinion {

// [[source]]
struct PackageSource {
    std::string name;
    std::string url;
    bool verify_ssl = true;

    bool operator==(const PackageSource& o) const;
};

struct Pipfile {
    std::vector<PackageSource> sources;
    std::map<std::string, ManifestEntry> packages;
    std::map<std::string, ManifestEntry> dev_packages;
    // [requires]
    std::string python_version;
    std::string python_full_version;

    static Result<Pipfile> parse(const std::string& toml_str);
    static Result<Pipfile> load(const std::string& path);
    Status save(const std::string& path) const;

    // Canonical TOML text: sorted keys, fixed layout. Lockfiles hash this.
    std::string to_toml() const;

    // Requirements of [packages], or of [dev-packages] when dev is set
    Result<std::vector<Requirement>> requirements(bool dev = false) const;

    // Insert or replace the record for req
    void add(const Requirement& req, bool dev = false);
};

} // namespace pinion
