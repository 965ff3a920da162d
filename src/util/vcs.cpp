#include <pinion/vcs.hpp>
#include <pinion/log.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace pinion {

static std::string trim_trailing(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

// ---------------------------------------------------------------------------
// GitBackend
// ---------------------------------------------------------------------------

Status GitBackend::obtain(const std::string& url, const std::string& target_dir) {
    return git_.clone(url, target_dir);
}

Status GitBackend::update(const std::string& target_dir, const std::string& url,
                          const std::string& ref) {
    if (!git_.is_repository(target_dir)) {
        PINION_TRY(git_.clone(url, target_dir));
    } else {
        PINION_TRY(git_.fetch(target_dir));
    }
    if (ref.empty()) return ok_status();
    return git_.checkout(target_dir, ref);
}

Result<std::string> GitBackend::revision(const std::string& target_dir) {
    return git_.rev_parse(target_dir, "HEAD");
}

Result<bool> GitBackend::is_at_ref(const std::string& target_dir, const std::string& ref) {
    auto head = git_.rev_parse(target_dir, "HEAD");
    if (head.is_err()) return std::move(head).error();

    // A ref unknown locally may still exist upstream
    auto target = git_.rev_parse(target_dir, ref);
    if (target.has_error(PinionError::InvalidRef)) return Result<bool>::ok(false);
    if (target.is_err()) return std::move(target).error();
    return Result<bool>::ok(head.value() == target.value());
}

bool GitBackend::is_repository(const std::string& target_dir) {
    return git_.is_repository(target_dir);
}

// ---------------------------------------------------------------------------
// CommandBackend
// ---------------------------------------------------------------------------

Result<std::string> CommandBackend::run(const std::vector<std::string>& args,
                                        PinionError::Code failure) const {
    std::vector<std::string> argv{tool_};
    argv.insert(argv.end(), args.begin(), args.end());

    std::string shown = tool_;
    for (const auto& a : args) shown += " " + a;
    pinion::log::debug("%s", shown.c_str());

    auto r = run_command(argv, "", timeout_seconds_);
    if (r.is_err()) {
        auto err = std::move(r).error();
        return PinionError{failure, shown + ": " + err.message};
    }
    const auto& cmd = r.value();
    if (cmd.exit_code == 127 && cmd.stderr_str.empty()) {
        return PinionError{failure, tool_ + " is not installed",
            "install " + tool_ + " or drop the " + tool_ + "+ requirement"};
    }
    if (cmd.exit_code != 0) {
        return PinionError{failure, shown + " failed: " + trim_trailing(cmd.stderr_str)};
    }
    return Result<std::string>::ok(trim_trailing(cmd.stdout_str));
}

Status CommandBackend::require_online(const std::string& action) const {
    if (!offline_) return ok_status();
    return PinionError{PinionError::Unreachable,
        "cannot " + action + " in offline mode", "run without --offline"};
}

// ---------------------------------------------------------------------------
// HgBackend
// ---------------------------------------------------------------------------

Status HgBackend::obtain(const std::string& url, const std::string& target_dir) {
    PINION_TRY(require_online("clone " + url));
    auto r = run({"clone", "--quiet", url, target_dir}, PinionError::Unreachable);
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Status HgBackend::update(const std::string& target_dir, const std::string& url,
                         const std::string& ref) {
    if (!is_repository(target_dir)) {
        PINION_TRY(obtain(url, target_dir));
    } else {
        PINION_TRY(require_online("pull into " + target_dir));
        auto pulled = run({"pull", "--quiet", "-R", target_dir}, PinionError::Unreachable);
        if (pulled.is_err()) return std::move(pulled).error();
    }
    if (ref.empty()) return ok_status();
    auto r = run({"update", "--quiet", "-R", target_dir, "-r", ref}, PinionError::InvalidRef);
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Result<std::string> HgBackend::revision(const std::string& target_dir) {
    return run({"log", "-R", target_dir, "-r", ".", "--template", "{node}"},
               PinionError::Corrupt);
}

Result<bool> HgBackend::is_at_ref(const std::string& target_dir, const std::string& ref) {
    auto head = revision(target_dir);
    if (head.is_err()) return std::move(head).error();
    auto target = run({"log", "-R", target_dir, "-r", ref, "--template", "{node}"},
                      PinionError::InvalidRef);
    // Unknown locally; a pull may bring it in
    if (target.is_err()) return Result<bool>::ok(false);
    return Result<bool>::ok(head.value() == target.value());
}

bool HgBackend::is_repository(const std::string& target_dir) {
    return run({"root", "-R", target_dir}, PinionError::Corrupt).is_ok();
}

// ---------------------------------------------------------------------------
// SvnBackend
// ---------------------------------------------------------------------------

Status SvnBackend::obtain(const std::string& url, const std::string& target_dir) {
    PINION_TRY(require_online("check out " + url));
    auto r = run({"checkout", "--quiet", url, target_dir}, PinionError::Unreachable);
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Status SvnBackend::update(const std::string& target_dir, const std::string& url,
                          const std::string& ref) {
    if (!is_repository(target_dir)) {
        PINION_TRY(obtain(url, target_dir));
    }
    // Every svn update talks to the server
    PINION_TRY(require_online("update " + target_dir));
    auto r = run({"update", "--quiet", "-r", ref.empty() ? "HEAD" : ref, target_dir},
                 ref.empty() ? PinionError::Unreachable : PinionError::InvalidRef);
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Result<std::string> SvnBackend::revision(const std::string& target_dir) {
    return run({"info", "--show-item", "revision", target_dir}, PinionError::Corrupt);
}

Result<bool> SvnBackend::is_at_ref(const std::string& target_dir, const std::string& ref) {
    // Symbolic revisions (HEAD, {date}) always need an update
    if (ref.empty() || !std::all_of(ref.begin(), ref.end(),
            [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return Result<bool>::ok(false);
    }
    auto head = revision(target_dir);
    if (head.is_err()) return std::move(head).error();
    return Result<bool>::ok(head.value() == ref);
}

bool SvnBackend::is_repository(const std::string& target_dir) {
    return run({"info", target_dir}, PinionError::Corrupt).is_ok();
}

// ---------------------------------------------------------------------------
// BzrBackend
// ---------------------------------------------------------------------------

Status BzrBackend::obtain(const std::string& url, const std::string& target_dir) {
    PINION_TRY(require_online("branch " + url));
    auto r = run({"branch", "-q", url, target_dir}, PinionError::Unreachable);
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Status BzrBackend::update(const std::string& target_dir, const std::string& url,
                          const std::string& ref) {
    if (!is_repository(target_dir)) {
        PINION_TRY(obtain(url, target_dir));
    } else {
        PINION_TRY(require_online("pull into " + target_dir));
        auto pulled = run({"pull", "-q", "-d", target_dir}, PinionError::Unreachable);
        if (pulled.is_err()) return std::move(pulled).error();
    }
    if (ref.empty()) return ok_status();
    auto r = run({"update", "-q", "-r", ref, target_dir}, PinionError::InvalidRef);
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Result<std::string> BzrBackend::revision(const std::string& target_dir) {
    return run({"version-info", "--custom", "--template={revision_id}", target_dir},
               PinionError::Corrupt);
}

Result<bool> BzrBackend::is_at_ref(const std::string& target_dir, const std::string& ref) {
    auto head = revision(target_dir);
    if (head.is_err()) return std::move(head).error();

    // "<revno> <revision-id>"
    auto info = run({"revision-info", "-d", target_dir, "-r", ref}, PinionError::InvalidRef);
    if (info.is_err()) return Result<bool>::ok(false);
    auto space = info.value().find(' ');
    if (space == std::string::npos) return Result<bool>::ok(false);
    return Result<bool>::ok(info.value().substr(space + 1) == head.value());
}

bool BzrBackend::is_repository(const std::string& target_dir) {
    return run({"root", target_dir}, PinionError::Corrupt).is_ok();
}

// ---------------------------------------------------------------------------
// VcsGateway
// ---------------------------------------------------------------------------

void VcsGateway::register_backend(VcsKind kind, std::unique_ptr<VcsBackend> backend) {
    backends_[kind] = std::move(backend);
}

bool VcsGateway::has_backend(VcsKind kind) const {
    return backends_.count(kind) > 0;
}

Result<VcsBackend*> VcsGateway::backend_for(VcsKind kind) const {
    auto it = backends_.find(kind);
    if (it == backends_.end()) {
        return PinionError{PinionError::NotFound,
            std::string("no backend registered for ") + vcs_kind_name(kind),
            std::string("register a ") + vcs_kind_name(kind) + " backend with the gateway"};
    }
    return Result<VcsBackend*>::ok(it->second.get());
}

std::mutex& VcsGateway::dir_lock(const std::string& dir) {
    std::lock_guard<std::mutex> guard(mu_);
    auto& slot = locks_[dir];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

void VcsGateway::forget_revision(const std::string& dir) {
    std::lock_guard<std::mutex> guard(mu_);
    revisions_.erase(dir);
}

Status VcsGateway::obtain(VcsKind kind, const std::string& url,
                          const std::string& target_dir) {
    auto backend = backend_for(kind);
    if (backend.is_err()) return std::move(backend).error();

    std::lock_guard<std::mutex> guard(dir_lock(target_dir));
    pinion::log::debug("%s obtain %s -> %s", vcs_kind_name(kind), url.c_str(),
                       target_dir.c_str());
    forget_revision(target_dir);
    return backend.value()->obtain(url, target_dir);
}

Status VcsGateway::checkout_ref(VcsKind kind, const std::string& target_dir,
                                const std::string& ref, const std::string& url) {
    auto backend = backend_for(kind);
    if (backend.is_err()) return std::move(backend).error();

    std::lock_guard<std::mutex> guard(dir_lock(target_dir));
    return checkout_ref_locked(*backend.value(), kind, target_dir, ref, url);
}

Status VcsGateway::checkout_ref_locked(VcsBackend& backend, VcsKind kind,
                                       const std::string& target_dir,
                                       const std::string& ref, const std::string& url) {
    auto at_ref = backend.is_at_ref(target_dir, ref);
    if (at_ref.is_err()) return std::move(at_ref).error();
    if (at_ref.value()) return ok_status();

    pinion::log::debug("%s update %s to %s", vcs_kind_name(kind), target_dir.c_str(),
                       ref.c_str());
    forget_revision(target_dir);
    return backend.update(target_dir, url, ref);
}

Status VcsGateway::update(VcsKind kind, const std::string& target_dir,
                          const std::string& url, const std::string& ref) {
    auto backend = backend_for(kind);
    if (backend.is_err()) return std::move(backend).error();

    std::lock_guard<std::mutex> guard(dir_lock(target_dir));
    pinion::log::debug("%s update %s to %s", vcs_kind_name(kind), target_dir.c_str(),
                       ref.empty() ? "latest" : ref.c_str());
    forget_revision(target_dir);
    return backend.value()->update(target_dir, url, ref);
}

Result<std::string> VcsGateway::revision(VcsKind kind, const std::string& target_dir) {
    {
        std::lock_guard<std::mutex> guard(mu_);
        auto it = revisions_.find(target_dir);
        if (it != revisions_.end()) return Result<std::string>::ok(it->second);
    }

    auto backend = backend_for(kind);
    if (backend.is_err()) return std::move(backend).error();

    std::lock_guard<std::mutex> dir_guard(dir_lock(target_dir));
    auto rev = backend.value()->revision(target_dir);
    if (rev.is_err()) return rev;

    std::lock_guard<std::mutex> guard(mu_);
    revisions_[target_dir] = rev.value();
    return rev;
}

Result<Requirement> VcsGateway::pin(const Requirement& req, const std::string& checkout_root) {
    auto vcs = req.as_vcs();
    if (!vcs) {
        return PinionError{PinionError::InvalidArg,
            "'" + req.name() + "' is not a VCS requirement"};
    }

    auto backend = backend_for(vcs->vcs);
    if (backend.is_err()) return std::move(backend).error();

    std::string dir = (fs::path(checkout_root) / req.key()).string();
    std::string url = vcs->uri.without_vcs_prefix();

    {
        // Repository check, clone and checkout under one lock
        std::lock_guard<std::mutex> guard(dir_lock(dir));
        if (!backend.value()->is_repository(dir)) {
            std::error_code ec;
            fs::create_directories(checkout_root, ec);
            if (ec) {
                return PinionError{PinionError::IO,
                    "cannot create " + checkout_root + ": " + ec.message()};
            }
            pinion::log::debug("%s obtain %s -> %s", vcs_kind_name(vcs->vcs), url.c_str(),
                               dir.c_str());
            forget_revision(dir);
            PINION_TRY(backend.value()->obtain(url, dir));
        }
        if (vcs->ref) {
            PINION_TRY(checkout_ref_locked(*backend.value(), vcs->vcs, dir, *vcs->ref, url));
        }
    }

    auto rev = revision(vcs->vcs, dir);
    if (rev.is_err()) return std::move(rev).error();
    pinion::log::debug("pinned %s at %s", req.name().c_str(), rev.value().c_str());
    return Result<Requirement>::ok(req.with_ref(rev.value()));
}

void VcsGateway::clear_cache() {
    std::lock_guard<std::mutex> guard(mu_);
    revisions_.clear();
}

} // namespace pinion
