#pragma once

#include <pinion/hash_cache.hpp>
#include <pinion/index.hpp>
#include <pinion/marker.hpp>
#include <pinion/requirement.hpp>
#include <pinion/result.hpp>
#include <pinion/specifier.hpp>
#include <pinion/vcs.hpp>
#include <pinion/version.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace pinion {

// "Any version in this set will do" for one package name
struct AbstractDependency {
    std::string name;                       // normalized
    SpecifierSet specifiers;
    std::optional<Marker> markers;
    std::vector<Requirement> candidates;    // most preferred first
    std::set<Version> version_set;          // empty for direct sources
    std::optional<std::string> parent;      // normalized name of the requiring package
    Requirement requirement;                // the merged constraint as a requirement

    // A file or VCS requirement: its single candidate is the requirement itself
    static AbstractDependency direct(const Requirement& req,
                                     std::optional<std::string> parent = std::nullopt);

    // Named requirement against the published versions of its package.
    // Conflict when no version satisfies the specifier.
    static Result<AbstractDependency> from_versions(const Requirement& req,
                                                    const std::vector<Version>& available,
                                                    bool allow_prereleases = false,
                                                    std::optional<std::string> parent = std::nullopt);

    bool is_direct() const;

    // Intersect with another constraint on the same package. A direct source
    // wins over an index constraint. Conflict names both constraints.
    Result<AbstractDependency> merge(const AbstractDependency& other) const;

    // ">=1,<2 (required by foo)"
    std::string describe() const;
};

using RequirementInput = std::variant<std::string, Requirement, AbstractDependency>;

struct ResolvedPackage {
    Requirement requirement;                // pinned, hashes included
    std::set<std::string> hashes;
};

// Keyed by normalized name
using ResolvedSet = std::map<std::string, ResolvedPackage>;

struct ResolverState {
    std::map<std::string, Requirement> pinned;
    std::map<std::string, AbstractDependency> constraints;
    std::map<std::string, std::set<Version>> candidate_versions;
    std::vector<std::map<std::string, Requirement>> history;    // pins after each round
};

struct ResolveOptions {
    bool collect_hashes = true;
    bool parallel_hashes = false;   // one task per package; the index must tolerate it
    bool allow_prereleases = false;
};

// Backtracking resolver. One instance serves exactly one resolve() call and
// must not be shared between threads.
class Resolver {
public:
    Resolver(PackageIndex& index, MarkerEnvironment env, ResolveOptions options = {});

    // Optional collaborators; both must outlive the resolver
    void set_hash_cache(HashCache* cache) { hash_cache_ = cache; }
    void set_vcs(VcsGateway* gateway, std::string checkout_root);

    Result<ResolvedSet> resolve(const std::vector<RequirementInput>& roots,
                                size_t max_rounds = 20);

    // Merge one constraint into the state. Conflict leaves the state untouched.
    Status add_abstract_dep(const AbstractDependency& dep);

    // One pinning round over every current constraint
    Status pin_deps();

    Result<AbstractDependency> make_dependency(const Requirement& req,
                                               std::optional<std::string> parent = std::nullopt);

    const ResolverState& state() const { return state_; }

private:
    Result<std::vector<Version>> available_versions(const std::string& name);
    Result<std::vector<Requirement>> candidate_requirements(const Requirement& pin);
    Result<std::vector<AbstractDependency>> dependencies_of(const Requirement& pin,
                                                            const AbstractDependency& owner);
    Result<bool> is_active(const std::optional<Marker>& markers,
                           const std::vector<std::string>& extras) const;

    Result<std::set<std::string>> hashes_for(const Requirement& pin);
    Status collect_hashes(ResolvedSet& out);

    PackageIndex& index_;
    MarkerEnvironment env_;
    ResolveOptions options_;
    HashCache* hash_cache_ = nullptr;
    VcsGateway* vcs_ = nullptr;
    std::string checkout_root_;

    ResolverState state_;
    bool used_ = false;

    // Per-run lookups; never shared between resolvers
    std::map<std::string, std::vector<Version>> versions_cache_;
    std::map<std::string, std::vector<Requirement>> deps_cache_;
    std::map<std::string, Requirement> vcs_pins_;
    std::mutex cache_mu_;   // guards hash_cache_ during parallel collection
};

} // namespace pinion
