#pragma once

#include <pinion/result.hpp>
#include <string>
#include <vector>

namespace pinion {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Wrapper around git CLI operations. Failures carry the VCS error codes:
// Unreachable for clone/fetch, InvalidRef for checkout, Corrupt for a
// working tree git cannot read.
class GitCli {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // `git clone <url> <dest>`
    Status clone(const std::string& url, const std::string& dest);

    // `git -C <repo> fetch --tags origin`
    Status fetch(const std::string& repo);

    // `git -C <repo> checkout --quiet <ref>`
    Status checkout(const std::string& repo, const std::string& ref);

    // Full commit hash of a ref ("HEAD", tag, branch or abbreviated SHA)
    Result<std::string> rev_parse(const std::string& repo, const std::string& ref);

    // `git -C <dir> rev-parse --git-dir` succeeds
    bool is_repository(const std::string& dir);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }
    bool is_offline() const { return offline_; }

private:
    int timeout_seconds_ = 60;
    bool offline_ = false;
};

} // namespace pinion
