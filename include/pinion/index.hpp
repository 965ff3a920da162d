#pragma once

#include <pinion/result.hpp>
#include <pinion/version.hpp>
#include <map>
#include <string>
#include <vector>

namespace pinion {

// Package index seam: candidate discovery, dependency metadata and
// artifact hashes. Implementations may block on the network.
class PackageIndex {
public:
    virtual ~PackageIndex() = default;

    // All published versions, highest first. NotFound for unknown packages.
    virtual Result<std::vector<Version>> find_versions(const std::string& name) = 0;

    // Requirement lines declared by name==version
    virtual Result<std::vector<std::string>> get_dependencies(const std::string& name,
                                                              const Version& version) = 0;

    // "<algo>:<hex>" for every artifact of name==version
    virtual Result<std::vector<std::string>> get_hashes(const std::string& name,
                                                        const Version& version) = 0;

    // Interpreter specifier of name==version; empty means any
    virtual std::string requires_python(const std::string& name, const Version& version) {
        (void)name;
        (void)version;
        return "";
    }
};

struct Release {
    Version version;
    std::vector<std::string> dependencies;
    std::vector<std::string> hashes;
    std::string requires_python;
};

// In-memory index. TOML layout:
//   [packages."name"."1.0"]
//   dependencies = ["other>=2"]
//   hashes = ["sha256:..."]
//   requires_python = ">=3.7"
class StaticIndex : public PackageIndex {
public:
    Status add_release(const std::string& name, const std::string& version,
                       std::vector<std::string> dependencies = {},
                       std::vector<std::string> hashes = {},
                       std::string requires_python = "");

    static Result<StaticIndex> parse(const std::string& toml_str);
    static Result<StaticIndex> load(const std::string& path);

    Result<std::vector<Version>> find_versions(const std::string& name) override;
    Result<std::vector<std::string>> get_dependencies(const std::string& name,
                                                      const Version& version) override;
    Result<std::vector<std::string>> get_hashes(const std::string& name,
                                                const Version& version) override;
    std::string requires_python(const std::string& name, const Version& version) override;

    size_t package_count() const { return packages_.size(); }

private:
    Result<const Release*> find_release(const std::string& name, const Version& version) const;

    std::map<std::string, std::vector<Release>> packages_;   // normalized name, highest first
};

} // namespace pinion
