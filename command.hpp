#pragma once

#include "context.hpp"
#include "program_spec.hpp"
#include "running_operation.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h> // pid_t

namespace live_proxy {

struct ValidationScope;

// Runs an external program to completion.
class Command {
public:
    static constexpr const char* KEYWORD = "command";

    explicit Command(ProgramSpec run, std::optional<std::string> workdir = std::nullopt);

    // "cmd args", ["cmd", "args"] or {"run": ..., "workdir": "..."}.
    static Command from_json(const nlohmann::json& j);

    const char* keyword() const { return KEYWORD; }
    const ProgramSpec& run() const { return run_; }
    const std::optional<std::string>& workdir() const { return workdir_; }

    void validate(const ValidationScope& scope) const;

    // Spawns the program in the resolved working directory. Throws
    // OperationError if the process cannot be started at all.
    std::unique_ptr<RunningOperation> start(Context& ctx) const;

private:
    ProgramSpec run_;
    std::optional<std::string> workdir_;
};

// A spawned child process. Exit code 0 maps to Success, anything else
// (including death by signal) to Failure.
class RunningCommand : public RunningOperation {
public:
    RunningCommand(pid_t pid, std::string description, std::string log_tag);
    ~RunningCommand() override;

    RunningCommand(const RunningCommand&) = delete;
    RunningCommand& operator=(const RunningCommand&) = delete;

    Outcome finish() override;
    std::optional<Outcome> try_finish() override;
    void cancel() override;

    pid_t pid() const { return pid_; }

private:
    Outcome reap_locked(int status);

    pid_t pid_;
    std::string description_;
    std::string log_tag_;

    // Guards reaped_/outcome_. The child is only reaped under this lock so
    // cancel() never signals a recycled pid.
    std::mutex mx_;
    bool reaped_ = false;
    Outcome outcome_ = Outcome::Failure;
};

} // namespace live_proxy
