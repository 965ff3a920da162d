#include <pinion/resolver.hpp>
#include <pinion/log.hpp>
#include <pinion/metadata.hpp>
#include <pinion/name.hpp>
#include <pinion/sha256.hpp>

#include <algorithm>
#include <filesystem>
#include <future>
#include <iterator>

namespace pinion {

namespace fs = std::filesystem;

namespace {

std::optional<Version> candidate_version(const Requirement& req) {
    auto pinned = req.pinned_version();
    if (!pinned) return std::nullopt;
    auto v = Version::parse(*pinned);
    if (v.is_err()) return std::nullopt;
    return v.value();
}

// Either side unconditional means the union is unconditional
std::optional<Marker> either_marker(const std::optional<Marker>& a,
                                    const std::optional<Marker>& b) {
    if (!a || !b) return std::nullopt;
    if (*a == *b) return a;
    return or_markers(*a, *b);
}

std::vector<std::string> union_extras(const std::vector<std::string>& a,
                                      const std::vector<std::string>& b) {
    std::vector<std::string> all = a;
    all.insert(all.end(), b.begin(), b.end());
    return normalize_extras(all);
}

SpecifierSet exact(const Version& v) {
    SpecifierSet s;
    s.add(VersionSpecifier{SpecOp::Eq, v.to_string(), {}});
    return s;
}

// Local source tree of a direct requirement, if it has one
std::optional<fs::path> source_dir(const Requirement& req, const std::string& checkout_root) {
    fs::path dir;
    std::optional<std::string> subdir;
    if (auto f = req.as_file()) {
        if (!f->path) return std::nullopt;
        dir = *f->path;
        subdir = f->subdirectory;
    } else if (auto v = req.as_vcs()) {
        if (checkout_root.empty()) return std::nullopt;
        dir = fs::path(checkout_root) / req.key();
        subdir = v->subdirectory;
    } else {
        return std::nullopt;
    }
    if (subdir) dir /= *subdir;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return std::nullopt;
    return dir;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// AbstractDependency
// ---------------------------------------------------------------------------

AbstractDependency AbstractDependency::direct(const Requirement& req,
                                              std::optional<std::string> parent) {
    AbstractDependency dep;
    dep.name = req.key();
    dep.markers = req.markers();
    dep.candidates.push_back(req);
    dep.parent = std::move(parent);
    dep.requirement = req;
    return dep;
}

Result<AbstractDependency> AbstractDependency::from_versions(const Requirement& req,
                                                             const std::vector<Version>& available,
                                                             bool allow_prereleases,
                                                             std::optional<std::string> parent) {
    if (!req.is_named()) {
        return PinionError{PinionError::InvalidArg,
            "'" + req.name() + "' is not an index requirement"};
    }

    AbstractDependency dep;
    dep.name = req.key();
    dep.specifiers = req.specifier().value_or(SpecifierSet{});
    dep.markers = req.markers();
    dep.parent = std::move(parent);
    dep.requirement = req;

    std::vector<Version> matching = dep.specifiers.filter(available, allow_prereleases);
    std::sort(matching.begin(), matching.end(),
              [](const Version& a, const Version& b) { return a > b; });

    if (matching.empty()) {
        std::string hint = "the index lists no versions of it";
        if (!available.empty()) {
            hint = "available:";
            for (const auto& v : available) hint += " " + v.to_string();
        }
        return PinionError{PinionError::Conflict,
            "no version of '" + req.name() + "' satisfies " + dep.describe(), hint};
    }

    for (const auto& v : matching) {
        dep.candidates.push_back(req.with_version(exact(v)));
        dep.version_set.insert(v);
    }
    return Result<AbstractDependency>::ok(std::move(dep));
}

bool AbstractDependency::is_direct() const {
    return !requirement.is_named();
}

Result<AbstractDependency> AbstractDependency::merge(const AbstractDependency& other) const {
    if (name != other.name) {
        return PinionError{PinionError::InvalidArg,
            "cannot merge constraints on '" + name + "' and '" + other.name + "'"};
    }

    auto absorb = [](AbstractDependency keep, const AbstractDependency& dropped) {
        keep.markers = either_marker(keep.markers, dropped.markers);
        auto extras = union_extras(keep.requirement.extras(), dropped.requirement.extras());
        keep.requirement = keep.requirement.with_extras(extras).with_markers(keep.markers);
        for (auto& c : keep.candidates) c = c.with_extras(extras);
        return keep;
    };

    if (is_direct()) {
        if (other.is_direct() && !(other.requirement == requirement)) {
            log::debug("keeping %s over %s for '%s'",
                       requirement.to_line(false).c_str(),
                       other.requirement.to_line(false).c_str(), name.c_str());
        }
        return Result<AbstractDependency>::ok(absorb(*this, other));
    }
    if (other.is_direct()) {
        return Result<AbstractDependency>::ok(absorb(other, *this));
    }

    std::set<Version> common;
    std::set_intersection(version_set.begin(), version_set.end(),
                          other.version_set.begin(), other.version_set.end(),
                          std::inserter(common, common.begin()));
    if (common.empty()) {
        return PinionError{PinionError::Conflict,
            "conflicting requirements for '" + name + "': " +
                describe() + " and " + other.describe(),
            "no published version satisfies both"};
    }

    AbstractDependency out;
    out.name = name;
    out.specifiers = specifiers.intersect(other.specifiers);
    out.markers = either_marker(markers, other.markers);
    out.parent = parent;
    out.version_set = common;

    auto extras = union_extras(requirement.extras(), other.requirement.extras());
    out.requirement = requirement.with_version(out.specifiers)
                                 .with_extras(extras)
                                 .with_markers(out.markers);

    std::set<Version> seen;
    auto take = [&](const std::vector<Requirement>& from) {
        for (const auto& c : from) {
            auto v = candidate_version(c);
            if (!v || !common.count(*v) || seen.count(*v)) continue;
            seen.insert(*v);
            out.candidates.push_back(c.with_extras(extras));
        }
    };
    take(candidates);
    take(other.candidates);
    std::stable_sort(out.candidates.begin(), out.candidates.end(),
                     [](const Requirement& a, const Requirement& b) {
                         return *candidate_version(a) > *candidate_version(b);
                     });

    return Result<AbstractDependency>::ok(std::move(out));
}

std::string AbstractDependency::describe() const {
    std::string text;
    if (is_direct()) {
        text = requirement.with_markers(std::nullopt).to_line(false);
    } else if (specifiers.empty()) {
        text = "any version";
    } else {
        text = specifiers.to_string();
    }
    if (parent) text += " (required by " + *parent + ")";
    return text;
}

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(PackageIndex& index, MarkerEnvironment env, ResolveOptions options)
    : index_(index), env_(std::move(env)), options_(options) {}

void Resolver::set_vcs(VcsGateway* gateway, std::string checkout_root) {
    vcs_ = gateway;
    checkout_root_ = std::move(checkout_root);
}

Result<bool> Resolver::is_active(const std::optional<Marker>& markers,
                                 const std::vector<std::string>& extras) const {
    if (!markers) return Result<bool>::ok(true);
    return markers->evaluate(env_, extras);
}

Result<std::vector<Version>> Resolver::available_versions(const std::string& name) {
    std::string key = normalize_name(name);
    auto it = versions_cache_.find(key);
    if (it != versions_cache_.end()) return Result<std::vector<Version>>::ok(it->second);

    auto found = index_.find_versions(name);
    if (found.is_err()) return std::move(found).error();

    std::optional<Version> python;
    auto py_text = env_.get("python_full_version");
    if (!py_text) py_text = env_.get("python_version");
    if (py_text) {
        auto parsed = Version::parse(*py_text);
        if (parsed.is_ok()) python = parsed.value();
    }

    std::vector<Version> usable;
    for (const auto& v : found.value()) {
        std::string rp = index_.requires_python(name, v);
        if (rp.empty() || !python) {
            usable.push_back(v);
            continue;
        }
        auto spec = SpecifierSet::parse(rp);
        if (spec.is_err()) {
            log::warn("skipping %s %s: bad requires_python '%s'",
                      name.c_str(), v.to_string().c_str(), rp.c_str());
            continue;
        }
        if (spec.value().contains(*python, true)) {
            usable.push_back(v);
        } else {
            log::debug("skipping %s %s: requires python %s",
                       name.c_str(), v.to_string().c_str(), rp.c_str());
        }
    }

    versions_cache_[key] = usable;
    return Result<std::vector<Version>>::ok(std::move(usable));
}

Result<AbstractDependency> Resolver::make_dependency(const Requirement& req,
                                                     std::optional<std::string> parent) {
    Requirement r = req;

    if (r.is_unnamed()) {
        auto f = r.as_file();
        auto dir = source_dir(r, checkout_root_);
        if (!f || !dir) {
            return PinionError{PinionError::Unparsable,
                "cannot determine the package name of '" + r.to_line(false) + "'",
                "add #egg=<name> to the requirement"};
        }
        auto meta = read_local_metadata(dir->string());
        if (meta.is_err()) return std::move(meta).error();
        auto named = r.resolve_name(meta.value());
        if (named.is_err()) return std::move(named).error();
        r = std::move(named).value();
    }

    if (r.is_named()) {
        auto versions = available_versions(r.name());
        if (versions.is_err()) return std::move(versions).error();
        return AbstractDependency::from_versions(r, versions.value(),
                                                 options_.allow_prereleases, std::move(parent));
    }

    if (r.is_vcs() && vcs_ && !checkout_root_.empty()) {
        auto it = vcs_pins_.find(r.key());
        if (it == vcs_pins_.end()) {
            auto pinned = vcs_->pin(r, checkout_root_);
            if (pinned.is_err()) return std::move(pinned).error();
            it = vcs_pins_.emplace(r.key(), std::move(pinned).value()).first;
        }
        r = it->second.with_extras(r.extras()).with_markers(r.markers());
    }

    return Result<AbstractDependency>::ok(AbstractDependency::direct(r, std::move(parent)));
}

Result<std::vector<Requirement>> Resolver::candidate_requirements(const Requirement& pin) {
    std::string key = pin.with_markers(std::nullopt).to_line(false);
    auto it = deps_cache_.find(key);
    if (it != deps_cache_.end()) return Result<std::vector<Requirement>>::ok(it->second);

    std::vector<std::string> lines;
    if (pin.is_named()) {
        auto v = candidate_version(pin);
        if (!v) {
            return PinionError{PinionError::InvalidArg,
                "'" + pin.name() + "' is not pinned to a single version"};
        }
        auto deps = index_.get_dependencies(pin.name(), *v);
        if (deps.is_err()) return std::move(deps).error();
        lines = std::move(deps).value();
    } else if (auto dir = source_dir(pin, checkout_root_)) {
        std::error_code ec;
        if (fs::exists(*dir / "pyproject.toml", ec)) {
            auto meta = read_local_metadata(dir->string());
            if (meta.is_err()) return std::move(meta).error();
            lines = meta.value().dependencies;
        }
    }

    std::vector<Requirement> out;
    for (const auto& line : lines) {
        auto parsed = Requirement::from_line(line);
        if (parsed.is_err()) {
            return std::move(parsed).error().prefix(pin.name() + " declares '" + line + "'");
        }
        Requirement child = std::move(parsed).value();

        auto active = is_active(child.markers(), pin.extras());
        if (active.is_err()) return std::move(active).error();
        if (!active.value()) continue;

        if (child.markers()) {
            auto stripped = strip(*child.markers(), "extra");
            child = child.with_markers(stripped.first);
        }
        out.push_back(std::move(child));
    }

    deps_cache_[key] = out;
    return Result<std::vector<Requirement>>::ok(std::move(out));
}

Result<std::vector<AbstractDependency>> Resolver::dependencies_of(const Requirement& pin,
                                                                  const AbstractDependency& owner) {
    auto reqs = candidate_requirements(pin);
    if (reqs.is_err()) return std::move(reqs).error();

    std::vector<AbstractDependency> out;
    for (const auto& r : reqs.value()) {
        auto markers = merge(owner.markers, r.markers());
        if (markers.is_err()) return std::move(markers).error();
        auto dep = make_dependency(r.with_markers(markers.value()), owner.name);
        if (dep.is_err()) return std::move(dep).error();
        out.push_back(std::move(dep).value());
    }
    return Result<std::vector<AbstractDependency>>::ok(std::move(out));
}

Status Resolver::add_abstract_dep(const AbstractDependency& dep) {
    auto it = state_.constraints.find(dep.name);
    if (it == state_.constraints.end()) {
        state_.candidate_versions[dep.name] = dep.version_set;
        state_.constraints.emplace(dep.name, dep);
        return ok_status();
    }

    auto merged = it->second.merge(dep);
    if (merged.is_err()) return std::move(merged).error();
    state_.candidate_versions[dep.name] = merged.value().version_set;
    it->second = std::move(merged).value();
    return ok_status();
}

Status Resolver::pin_deps() {
    std::vector<std::string> names;
    for (const auto& kv : state_.constraints) names.push_back(kv.first);

    for (const auto& name : names) {
        auto cit = state_.constraints.find(name);
        if (cit == state_.constraints.end()) continue;
        const AbstractDependency owner = cit->second;

        auto existing = state_.pinned.find(name);
        if (existing != state_.pinned.end() && existing->second.is_editable()) continue;
        std::optional<Version> old_version;
        if (existing != state_.pinned.end()) old_version = candidate_version(existing->second);

        std::optional<PinionError> last_failure;
        bool pinned_now = false;

        for (const auto& candidate : owner.candidates) {
            Requirement pin = candidate.with_extras(owner.requirement.extras())
                                       .with_markers(owner.markers);

            auto new_version = candidate_version(pin);
            if (old_version && new_version && *new_version != *old_version) {
                const auto& allowed = state_.candidate_versions[name];
                if (!allowed.count(*new_version)) continue;
            }

            auto subdeps = dependencies_of(pin, owner);
            if (subdeps.is_err()) {
                log::debug("%s is unavailable: %s",
                           pin.to_line(false).c_str(), subdeps.error().message.c_str());
                last_failure = subdeps.error();
                continue;
            }

            auto saved_constraints = state_.constraints;
            auto saved_versions = state_.candidate_versions;
            bool compatible = true;
            for (const auto& sub : subdeps.value()) {
                auto added = add_abstract_dep(sub);
                if (added.is_err()) {
                    last_failure = added.error();
                    compatible = false;
                    break;
                }
            }
            if (!compatible) {
                state_.constraints = std::move(saved_constraints);
                state_.candidate_versions = std::move(saved_versions);
                log::debug("backtracking from %s: %s",
                           pin.to_line(false).c_str(), last_failure->message.c_str());
                continue;
            }

            state_.pinned[name] = std::move(pin);
            pinned_now = true;
            break;
        }

        if (pinned_now) continue;

        // An earlier pin that still fits the narrowed constraint stands
        if (existing != state_.pinned.end()) {
            auto allowed = state_.candidate_versions.find(name);
            bool still_fits = !old_version ||
                (allowed != state_.candidate_versions.end() && allowed->second.count(*old_version));
            if (still_fits) continue;
        }

        if (last_failure) {
            PinionError e = *last_failure;
            if (e.hint.empty()) e.hint = "no candidate of '" + name + "' could be pinned";
            return e;
        }
        return PinionError{PinionError::Conflict,
            "no candidate of '" + name + "' satisfies " + owner.describe()};
    }
    return ok_status();
}

Result<ResolvedSet> Resolver::resolve(const std::vector<RequirementInput>& roots,
                                      size_t max_rounds) {
    if (used_) {
        return PinionError{PinionError::InvalidArg,
            "a resolver runs only once", "create a new Resolver for each resolution"};
    }
    used_ = true;

    log::debug("seeding %zu root requirement(s)", roots.size());
    for (const auto& input : roots) {
        std::optional<AbstractDependency> dep;

        if (auto dep_in = std::get_if<AbstractDependency>(&input)) {
            auto active = is_active(dep_in->markers, dep_in->requirement.extras());
            if (active.is_err()) return std::move(active).error();
            if (!active.value()) {
                log::debug("skipping %s: markers do not match", dep_in->name.c_str());
                continue;
            }
            dep = *dep_in;
        } else {
            Requirement req;
            if (auto line = std::get_if<std::string>(&input)) {
                auto parsed = Requirement::from_line(*line);
                if (parsed.is_err()) return std::move(parsed).error();
                req = std::move(parsed).value();
            } else {
                req = std::get<Requirement>(input);
            }

            auto active = is_active(req.markers(), req.extras());
            if (active.is_err()) return std::move(active).error();
            if (!active.value()) {
                log::debug("skipping %s: markers do not match", req.to_line(false).c_str());
                continue;
            }
            auto made = make_dependency(req);
            if (made.is_err()) return std::move(made).error();
            dep = std::move(made).value();
        }

        PINION_TRY(add_abstract_dep(*dep));
    }

    for (size_t round = 0; round < max_rounds; ++round) {
        PINION_TRY(pin_deps());
        state_.history.push_back(state_.pinned);

        std::vector<const Requirement*> fresh;
        for (const auto& kv : state_.pinned) {
            if (round > 0) {
                const auto& prev = state_.history[round - 1];
                auto p = prev.find(kv.first);
                if (p != prev.end() && p->second == kv.second) continue;
            }
            fresh.push_back(&kv.second);
        }

        if (!fresh.empty()) {
            log::debug("round %zu: %zu new pin(s)", round, fresh.size());
            for (const auto* r : fresh) log::debug("  %s", r->to_line(false).c_str());
        } else if (round >= 3) {
            log::info("resolution stable after %zu rounds (%zu packages)",
                      round + 1, state_.pinned.size());

            ResolvedSet out;
            for (const auto& kv : state_.pinned) {
                out.emplace(kv.first, ResolvedPackage{kv.second, {}});
            }
            if (options_.collect_hashes) PINION_TRY(collect_hashes(out));
            return Result<ResolvedSet>::ok(std::move(out));
        } else {
            log::debug("round %zu: no new pins", round);
        }
    }

    return PinionError{PinionError::NoConvergence,
        "resolution did not stabilize after " + std::to_string(max_rounds) + " rounds",
        "raise the round limit with --max-rounds"};
}

// ---------------------------------------------------------------------------
// Hash collection
// ---------------------------------------------------------------------------

Result<std::set<std::string>> Resolver::hashes_for(const Requirement& pin) {
    std::set<std::string> hashes;
    if (pin.is_editable() || pin.is_vcs()) return Result<std::set<std::string>>::ok(hashes);

    if (auto f = pin.as_file()) {
        std::string local;
        if (f->path) local = *f->path;
        else if (f->uri && f->uri->is_file_url()) local = f->uri->path;
        std::error_code ec;
        if (!local.empty() && fs::is_regular_file(local, ec)) {
            auto h = hash_artifact(local);
            if (h.is_err()) return std::move(h).error();
            hashes.insert(h.value());
        }
        return Result<std::set<std::string>>::ok(hashes);
    }

    auto version = candidate_version(pin);
    if (!version) {
        return PinionError{PinionError::InvalidArg,
            "cannot hash '" + pin.name() + "': not pinned to a single version"};
    }
    std::string cache_key = HashCache::package_key(pin.key(), version->to_string());

    if (hash_cache_) {
        std::lock_guard<std::mutex> guard(cache_mu_);
        if (hash_cache_->is_open()) {
            auto cached = hash_cache_->lookup(cache_key);
            if (cached.is_ok()) {
                return Result<std::set<std::string>>::ok(
                    std::set<std::string>(cached.value().begin(), cached.value().end()));
            }
            if (!cached.has_error(PinionError::NotFound)) {
                log::warn("hash cache lookup failed: %s", cached.error().message.c_str());
            }
        }
    }

    auto found = index_.get_hashes(pin.name(), *version);
    if (found.is_err()) return std::move(found).error();
    hashes.insert(found.value().begin(), found.value().end());

    if (hash_cache_) {
        std::lock_guard<std::mutex> guard(cache_mu_);
        if (hash_cache_->is_open()) {
            auto stored = hash_cache_->store(cache_key, found.value());
            if (stored.is_err()) {
                log::warn("could not cache hashes for %s: %s",
                          cache_key.c_str(), stored.error().message.c_str());
            }
        }
    }
    return Result<std::set<std::string>>::ok(std::move(hashes));
}

Status Resolver::collect_hashes(ResolvedSet& out) {
    std::vector<std::string> names;
    for (const auto& kv : out) names.push_back(kv.first);

    auto apply = [&](const std::string& name, Result<std::set<std::string>> r) -> Status {
        if (r.is_err()) return std::move(r).error();
        auto& pkg = out.at(name);
        pkg.hashes = std::move(r).value();
        pkg.requirement = pkg.requirement.with_hashes(pkg.hashes);
        return ok_status();
    };

    if (!options_.parallel_hashes) {
        for (const auto& name : names) {
            PINION_TRY(apply(name, hashes_for(out.at(name).requirement)));
        }
        return ok_status();
    }

    std::vector<std::future<Result<std::set<std::string>>>> tasks;
    tasks.reserve(names.size());
    for (const auto& name : names) {
        Requirement req = out.at(name).requirement;
        tasks.push_back(std::async(std::launch::async,
                                   [this, req]() { return hashes_for(req); }));
    }

    // Wait for every task before reporting the first failure
    std::vector<Result<std::set<std::string>>> results;
    results.reserve(tasks.size());
    for (auto& t : tasks) results.push_back(t.get());
    for (size_t i = 0; i < names.size(); ++i) {
        PINION_TRY(apply(names[i], std::move(results[i])));
    }
    log::debug("collected hashes for %zu package(s)", names.size());
    return ok_status();
}

} // namespace pinion
