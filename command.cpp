#include "command.hpp"
#include "errors.hpp"
#include "operation.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <vector>

#include <fcntl.h>    // O_CLOEXEC
#include <sys/wait.h> // waitpid, waitid
#include <unistd.h>   // fork, execvp, chdir, dup2, pipe2

namespace live_proxy {

namespace {

// Written by the child into a close-on-exec pipe when it fails before exec
// takes over. An empty read in the parent means exec succeeded.
struct SpawnFailure {
    enum Stage : int { Chdir = 1, Exec = 2, Stdin = 3 };
    int stage = 0;
    int err = 0;
};

std::string errno_string(int err) { return std::strerror(err); }

} // namespace

Command::Command(ProgramSpec run, std::optional<std::string> workdir)
    : run_(std::move(run)), workdir_(std::move(workdir)) {}

Command Command::from_json(const nlohmann::json& j) {
    if (j.is_string() || j.is_array()) {
        return Command(ProgramSpec::from_json(j));
    }
    if (!j.is_object()) {
        throw ConfigError("'command' must be a string, a list of strings or an object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "run" && it.key() != "workdir") {
            throw ConfigError("unknown field '" + it.key() + "' in 'command'");
        }
    }
    if (!j.contains("run")) {
        throw ConfigError("missing field 'run' in 'command'");
    }
    std::optional<std::string> workdir;
    if (j.contains("workdir")) {
        if (!j["workdir"].is_string()) throw ConfigError("'workdir' must be a string");
        workdir = j["workdir"].get<std::string>();
    }
    return Command(ProgramSpec::from_json(j["run"]), std::move(workdir));
}

void Command::validate(const ValidationScope&) const {
    if (workdir_ && workdir_->empty()) {
        throw ConfigError("'workdir' of command `" + run_.to_string() + "` is empty");
    }
}

std::unique_ptr<RunningOperation> Command::start(Context& ctx) const {
    const fs::path dir = workdir_ ? ctx.join_workdir(*workdir_) : ctx.workdir();
    const std::string cwd = dir.string();

    std::cout << ctx.log_tag() << "[command] running: " << run_ << std::endl;

    // Everything the child touches is prepared before fork().
    std::vector<std::string> local_argv = run_.argv();
    std::vector<char*> cargv;
    cargv.reserve(local_argv.size() + 1);
    for (auto& s : local_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    const std::string what = "failed to spawn `" + run_.to_string() + "`";

    // Our stdin carries the manual rebuild triggers; children get none of it.
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull == -1) {
        throw OperationError(what + ": /dev/null: " + errno_string(errno));
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(devnull);
        throw OperationError(what + ": pipe: " + errno_string(err));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        ::close(devnull);
        ::close(fds[0]);
        ::close(fds[1]);
        throw OperationError(what + ": fork: " + errno_string(err));
    }
    if (pid == 0) {
        ::close(fds[0]);
        SpawnFailure failure;
        if (::dup2(devnull, STDIN_FILENO) == -1) {
            failure = {SpawnFailure::Stdin, errno};
        } else if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            failure = {SpawnFailure::Chdir, errno};
        } else {
            ::execvp(cargv[0], cargv.data());
            failure = {SpawnFailure::Exec, errno};
        }
        // Nothing left to report to if this write fails.
        ssize_t n = ::write(fds[1], &failure, sizeof failure);
        (void)n;
        _exit(127);
    }

    ::close(devnull);
    ::close(fds[1]);
    SpawnFailure failure;
    ssize_t n;
    do {
        n = ::read(fds[0], &failure, sizeof failure);
    } while (n == -1 && errno == EINTR);
    ::close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof failure)) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

        std::string msg = what;
        if (failure.stage == SpawnFailure::Chdir) {
            msg += ": cannot enter working directory '" + cwd + "': " + errno_string(failure.err);
        } else if (failure.stage == SpawnFailure::Stdin) {
            msg += ": cannot redirect stdin: " + errno_string(failure.err);
        } else {
            msg += ": " + errno_string(failure.err);
            if (failure.err == ENOENT) {
                msg += " (you probably don't have the command '" + run_.program() + "' installed)";
            }
        }
        throw OperationError(msg);
    }

    return std::make_unique<RunningCommand>(pid, run_.to_string(), ctx.log_tag());
}

// ------------------------------ RunningCommand -------------------------------
RunningCommand::RunningCommand(pid_t pid, std::string description, std::string log_tag)
    : pid_(pid), description_(std::move(description)), log_tag_(std::move(log_tag)) {}

RunningCommand::~RunningCommand() {
    std::lock_guard<std::mutex> lk(mx_);
    if (reaped_) return;
    // Never leave an orphan or a zombie behind.
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
}

Outcome RunningCommand::finish() {
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (reaped_) return outcome_;
    }

    // Wait without reaping so the pid stays reserved until we hold the lock.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno == EINTR) continue;
        int err = errno;
        std::lock_guard<std::mutex> lk(mx_);
        if (reaped_) return outcome_;
        throw OperationError("failed to wait for running process: " + errno_string(err));
    }

    std::lock_guard<std::mutex> lk(mx_);
    if (reaped_) return outcome_;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r == -1 && errno == EINTR);
    if (r == -1) {
        throw OperationError("failed to wait for running process: " + errno_string(errno));
    }
    return reap_locked(status);
}

std::optional<Outcome> RunningCommand::try_finish() {
    std::lock_guard<std::mutex> lk(mx_);
    if (reaped_) return outcome_;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return std::nullopt;
    if (r == -1) {
        if (errno == EINTR) return std::nullopt;
        throw OperationError("failed to wait for running process: " + errno_string(errno));
    }
    return reap_locked(status);
}

void RunningCommand::cancel() {
    std::lock_guard<std::mutex> lk(mx_);
    if (reaped_) return;
    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        throw OperationError("failed to kill `" + description_ + "`: " + errno_string(errno));
    }
}

Outcome RunningCommand::reap_locked(int status) {
    reaped_ = true;
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        outcome_ = Outcome::Success;
        return outcome_;
    }

    outcome_ = Outcome::Failure;
    std::cerr << log_tag_ << "[command] WARNING: `" << description_ << "`";
    if (WIFSIGNALED(status)) {
        std::cerr << " was terminated by signal " << WTERMSIG(status) << std::endl;
    } else {
        std::cerr << " returned non-zero exit code " << WEXITSTATUS(status) << std::endl;
    }
    return outcome_;
}

} // namespace live_proxy
