#pragma once

#include <pinion/git.hpp>
#include <pinion/requirement.hpp>
#include <pinion/result.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pinion {

// One implementation per version control system. Errors use the
// Unreachable, InvalidRef and Corrupt codes; nothing here retries.
class VcsBackend {
public:
    virtual ~VcsBackend() = default;

    // Fresh checkout of url into target_dir
    virtual Status obtain(const std::string& url, const std::string& target_dir) = 0;
    // Bring an existing checkout to ref, fetching from url as needed
    virtual Status update(const std::string& target_dir, const std::string& url,
                          const std::string& ref) = 0;
    // Canonical commit identifier of the checkout
    virtual Result<std::string> revision(const std::string& target_dir) = 0;
    virtual Result<bool> is_at_ref(const std::string& target_dir, const std::string& ref) = 0;
    virtual bool is_repository(const std::string& target_dir) = 0;
};

class GitBackend : public VcsBackend {
public:
    explicit GitBackend(GitCli git = GitCli{}) : git_(std::move(git)) {}

    Status obtain(const std::string& url, const std::string& target_dir) override;
    Status update(const std::string& target_dir, const std::string& url,
                  const std::string& ref) override;
    Result<std::string> revision(const std::string& target_dir) override;
    Result<bool> is_at_ref(const std::string& target_dir, const std::string& ref) override;
    bool is_repository(const std::string& target_dir) override;

private:
    GitCli git_;
};

// Shared plumbing for backends that drive a VCS command line tool through
// run_command. A nonzero exit becomes the error code the caller names.
class CommandBackend : public VcsBackend {
public:
    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }
    bool is_offline() const { return offline_; }

    const std::string& tool() const { return tool_; }

protected:
    explicit CommandBackend(std::string tool) : tool_(std::move(tool)) {}

    // `<tool> <args...>`; trimmed stdout on success
    Result<std::string> run(const std::vector<std::string>& args,
                            PinionError::Code failure) const;
    // Unreachable in offline mode
    Status require_online(const std::string& action) const;

private:
    std::string tool_;
    int timeout_seconds_ = 60;
    bool offline_ = false;
};

// Mercurial: revisions are full changeset hashes
class HgBackend : public CommandBackend {
public:
    HgBackend() : CommandBackend("hg") {}

    Status obtain(const std::string& url, const std::string& target_dir) override;
    Status update(const std::string& target_dir, const std::string& url,
                  const std::string& ref) override;
    Result<std::string> revision(const std::string& target_dir) override;
    Result<bool> is_at_ref(const std::string& target_dir, const std::string& ref) override;
    bool is_repository(const std::string& target_dir) override;
};

// Subversion: revisions are repository revision numbers
class SvnBackend : public CommandBackend {
public:
    SvnBackend() : CommandBackend("svn") {}

    Status obtain(const std::string& url, const std::string& target_dir) override;
    Status update(const std::string& target_dir, const std::string& url,
                  const std::string& ref) override;
    Result<std::string> revision(const std::string& target_dir) override;
    Result<bool> is_at_ref(const std::string& target_dir, const std::string& ref) override;
    bool is_repository(const std::string& target_dir) override;
};

// Bazaar: revisions are revision ids, not branch-local revnos
class BzrBackend : public CommandBackend {
public:
    BzrBackend() : CommandBackend("bzr") {}

    Status obtain(const std::string& url, const std::string& target_dir) override;
    Status update(const std::string& target_dir, const std::string& url,
                  const std::string& ref) override;
    Result<std::string> revision(const std::string& target_dir) override;
    Result<bool> is_at_ref(const std::string& target_dir, const std::string& ref) override;
    bool is_repository(const std::string& target_dir) override;
};

// Dispatches to the backend registered for each VcsKind. Operations on one
// target directory are serialized; distinct directories run independently.
// revision() is memoized per directory until that directory changes.
class VcsGateway {
public:
    void register_backend(VcsKind kind, std::unique_ptr<VcsBackend> backend);
    bool has_backend(VcsKind kind) const;

    Status obtain(VcsKind kind, const std::string& url, const std::string& target_dir);
    // No-op when already at ref, otherwise update()
    Status checkout_ref(VcsKind kind, const std::string& target_dir,
                        const std::string& ref, const std::string& url = "");
    Status update(VcsKind kind, const std::string& target_dir,
                  const std::string& url, const std::string& ref);
    Result<std::string> revision(VcsKind kind, const std::string& target_dir);

    // Check out a VCS requirement under <checkout_root>/<name> and return it
    // with its ref replaced by the checked-out revision
    Result<Requirement> pin(const Requirement& req, const std::string& checkout_root);

    void clear_cache();

private:
    Result<VcsBackend*> backend_for(VcsKind kind) const;
    // Caller holds dir_lock(target_dir)
    Status checkout_ref_locked(VcsBackend& backend, VcsKind kind,
                               const std::string& target_dir,
                               const std::string& ref, const std::string& url);
    std::mutex& dir_lock(const std::string& dir);
    void forget_revision(const std::string& dir);

    std::map<VcsKind, std::unique_ptr<VcsBackend>> backends_;
    std::mutex mu_;   // guards locks_ and revisions_
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
    std::map<std::string, std::string> revisions_;
};

} // namespace pinion
