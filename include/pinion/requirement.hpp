#pragma once

#include <pinion/line.hpp>
#include <pinion/marker.hpp>
#include <pinion/metadata.hpp>
#include <pinion/result.hpp>
#include <pinion/specifier.hpp>
#include <pinion/uri.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace pinion {

enum class VcsKind { Git, Hg, Svn, Bzr };

const char* vcs_kind_name(VcsKind kind);
std::optional<VcsKind> parse_vcs_kind(const std::string& name);

// Resolved from an index
struct NamedRequirement {
    std::string name;
    std::optional<SpecifierSet> version;
};

// Local path or archive URL. The name may be unknown until metadata is read.
struct FileRequirement {
    std::string name;
    std::optional<std::string> path;
    std::optional<Uri> uri;                 // location only: no name, ref or subdirectory
    bool editable = false;
    std::optional<std::string> subdirectory;
};

struct VcsRequirement {
    std::string name;
    VcsKind vcs = VcsKind::Git;
    Uri uri;                                // location only, as for FileRequirement
    std::optional<std::string> ref;
    bool editable = false;
    std::optional<std::string> subdirectory;
};

using RequirementSource = std::variant<NamedRequirement, FileRequirement, VcsRequirement>;

// One Pipfile / lockfile record. Unset fields are empty.
struct ManifestEntry {
    std::string version;                    // "*" or a specifier
    std::vector<std::string> extras;
    std::string markers;
    bool editable = false;
    std::string path;
    std::string file;                       // archive URL
    std::string uri;                        // accepted as a synonym of file
    std::string vcs;                        // "git", "hg", "svn", "bzr"
    std::string vcs_url;                    // value of the git/hg/svn/bzr key
    std::string ref;
    std::string subdirectory;
    std::string index;
    std::vector<std::string> hashes;
    std::map<std::string, std::string> marker_keys;   // os_name = "== 'nt'"

    // Only a version: written as a plain string rather than a table
    bool is_bare() const;

    bool operator==(const ManifestEntry& o) const;
};

class Requirement {
public:
    static Result<Requirement> from_line(const std::string& line);
    static Result<Requirement> from_parsed(const ParsedLine& parsed);
    static Result<Requirement> from_manifest(const std::string& name, const ManifestEntry& entry);
    static Result<Requirement> from_lock_entry(const std::string& name, const ManifestEntry& entry);
    static Requirement named(std::string name, std::optional<SpecifierSet> version = std::nullopt);

    // pip-style line; editable requirements never carry hashes
    std::string to_line(bool include_hashes = true) const;
    ManifestEntry to_manifest() const;
    // Named requirements must be pinned to one version
    Result<ManifestEntry> to_lock_entry() const;

    const std::string& name() const;
    std::string key() const;                // normalized name
    bool is_unnamed() const { return name().empty(); }

    bool is_named() const { return std::holds_alternative<NamedRequirement>(source_); }
    bool is_file() const { return std::holds_alternative<FileRequirement>(source_); }
    bool is_vcs() const { return std::holds_alternative<VcsRequirement>(source_); }
    bool is_editable() const;

    const RequirementSource& source() const { return source_; }
    const NamedRequirement* as_named() const { return std::get_if<NamedRequirement>(&source_); }
    const FileRequirement* as_file() const { return std::get_if<FileRequirement>(&source_); }
    const VcsRequirement* as_vcs() const { return std::get_if<VcsRequirement>(&source_); }

    const std::optional<Marker>& markers() const { return markers_; }
    const std::vector<std::string>& extras() const { return extras_; }
    const std::set<std::string>& hashes() const { return hashes_; }
    const std::optional<std::string>& index() const { return index_; }

    // "==X" (no wildcard) or "===X" on a named requirement
    std::optional<std::string> pinned_version() const;
    // Also true for a VCS requirement with a ref
    bool is_pinned() const;
    std::optional<SpecifierSet> specifier() const;

    // Adopt the name from local metadata. Allowed once, on an unnamed requirement.
    Result<Requirement> resolve_name(const PackageMetadata& meta) const;

    // Active when either the current or the given marker holds
    Requirement merge_markers(const Marker& m) const;

    Requirement with_markers(std::optional<Marker> m) const;
    Requirement with_extras(std::vector<std::string> extras) const;
    Requirement with_hashes(const std::set<std::string>& hashes) const;
    Requirement with_version(SpecifierSet version) const;    // Named only
    Requirement with_ref(std::string ref) const;             // Vcs only
    Requirement with_index(std::string index) const;

    // The one in-place mutation: hashes are appended as they are found
    void add_hash(std::string hash);

    bool operator==(const Requirement& o) const;
    bool operator!=(const Requirement& o) const;

private:
    RequirementSource source_;
    std::optional<Marker> markers_;
    std::vector<std::string> extras_;
    std::set<std::string> hashes_;
    std::optional<std::string> index_;
};

} // namespace pinion
