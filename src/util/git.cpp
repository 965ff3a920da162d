#include <pinion/git.hpp>
#include <pinion/log.hpp>

#include <chrono>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pinion {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return PinionError{PinionError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        return PinionError{PinionError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        return PinionError{PinionError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return PinionError{PinionError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    auto close_read_ends = [&]() {
        close(out_pipe[0]);
        close(err_pipe[0]);
    };

    std::string out_buf, err_buf;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);

    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_read_ends();
            return PinionError{PinionError::IO,
                "'" + args[0] + "' timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        drain(out_pipe[0], out_buf);
        drain(err_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(out_pipe[0], out_buf);
            drain(err_pipe[0], err_buf);
            close_read_ends();

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0) {
            close_read_ends();
            return PinionError{PinionError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);  // 1ms
    }
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

static std::string trim_output(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

Result<std::string> GitCli::check_version() {
    auto r = run_command({"git", "--version"}, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return PinionError{PinionError::NotFound,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_output(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return PinionError{PinionError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return PinionError{PinionError::Parse,
            "cannot parse git version: " + ver_str};
    }
    if (major < 2 || (major == 2 && minor < 20)) {
        return PinionError{PinionError::Version,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Status GitCli::clone(const std::string& url, const std::string& dest) {
    if (offline_) {
        return PinionError{PinionError::Unreachable,
            "cannot clone " + url + " in offline mode", "run without --offline"};
    }

    pinion::log::debug("git clone %s %s", url.c_str(), dest.c_str());
    auto r = run_command({"git", "clone", "--quiet", url, dest}, "", timeout_seconds_);
    if (r.is_err()) {
        auto err = std::move(r).error();
        return PinionError{PinionError::Unreachable,
            "git clone " + url + ": " + err.message};
    }

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return PinionError{PinionError::Unreachable,
            "git clone " + url + " failed: " + trim_output(cmd.stderr_str)};
    }
    return ok_status();
}

Status GitCli::fetch(const std::string& repo) {
    if (offline_) {
        return PinionError{PinionError::Unreachable,
            "cannot fetch in offline mode", "run without --offline"};
    }

    pinion::log::debug("git -C %s fetch --tags origin", repo.c_str());
    auto r = run_command({"git", "-C", repo, "fetch", "--quiet", "--tags", "origin"},
                         "", timeout_seconds_);
    if (r.is_err()) {
        auto err = std::move(r).error();
        return PinionError{PinionError::Unreachable, "git fetch: " + err.message};
    }

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return PinionError{PinionError::Unreachable,
            "git fetch failed: " + trim_output(cmd.stderr_str)};
    }
    return ok_status();
}

Status GitCli::checkout(const std::string& repo, const std::string& ref) {
    pinion::log::debug("git -C %s checkout %s", repo.c_str(), ref.c_str());
    auto r = run_command({"git", "-C", repo, "checkout", "--quiet", ref},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return PinionError{PinionError::InvalidRef,
            "cannot check out '" + ref + "': " + trim_output(cmd.stderr_str)};
    }
    return ok_status();
}

Result<std::string> GitCli::rev_parse(const std::string& repo, const std::string& ref) {
    auto r = run_command({"git", "-C", repo, "rev-parse", "--verify", "--quiet", ref + "^{commit}"},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        if (ref == "HEAD") {
            return PinionError{PinionError::Corrupt,
                "cannot read HEAD of " + repo + ": " + trim_output(cmd.stderr_str)};
        }
        return PinionError{PinionError::InvalidRef,
            "cannot resolve ref '" + ref + "' in " + repo};
    }

    return Result<std::string>::ok(trim_output(cmd.stdout_str));
}

bool GitCli::is_repository(const std::string& dir) {
    auto r = run_command({"git", "-C", dir, "rev-parse", "--git-dir"}, "", timeout_seconds_);
    return r.is_ok() && r.value().exit_code == 0;
}

} // namespace pinion
