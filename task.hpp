#pragma once

#include "blocking_queue.hpp"
#include "context.hpp"
#include "operation.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace live_proxy {

// Lets another thread abort a run in progress. The operation currently
// running is cancelled and no further operation is started.
class RunControl {
public:
    void cancel();
    bool cancelled() const;

    // Clears the cancelled flag before a new run.
    void reset();

    // Registers `op` as the running operation for the lifetime of the guard.
    class Attachment {
    public:
        Attachment(RunControl* control, RunningOperation* op);
        ~Attachment();

        Attachment(const Attachment&) = delete;
        Attachment& operator=(const Attachment&) = delete;

    private:
        RunControl* control_;
    };

private:
    mutable std::mutex mx_;
    RunningOperation* current_ = nullptr;
    bool cancelled_ = false;
};

// A named, ordered list of operations, run one after the other. The first
// Failure stops the task.
class Task {
public:
    Task(std::string name, std::vector<Operation> operations);

    // {"name": "...", "operations": [...]}
    static Task from_json(const nlohmann::json& j);

    const std::string& name() const { return name_; }
    const std::vector<Operation>& operations() const { return operations_; }

    // Throws ConfigError naming the offending operation.
    void validate(const std::filesystem::path& base_workdir) const;

    // Runs inside a fresh frame of `ctx`. Returns Failure as soon as one
    // operation fails; throws OperationError if an operation could not be
    // started at all.
    Outcome run(Context& ctx, RunControl* control = nullptr) const;

private:
    std::string name_;
    std::vector<Operation> operations_;
};

// Runs the configured task pipeline and announces successful runs on the
// refresh queue.
class TaskRunner {
public:
    TaskRunner(std::vector<Task> tasks, std::filesystem::path base_workdir,
               BlockingQueue<RefreshEvent>* refresh = nullptr);

    void validate() const;

    // Where successful runs are announced; nullptr to announce nothing.
    void set_refresh_queue(BlockingQueue<RefreshEvent>* refresh) { refresh_ = refresh; }

    // Runs every task in order, stopping at the first one that fails or
    // errors. Pushes one RefreshEvent when all of them succeed. A cancel
    // that is still pending makes it return Failure without running anything.
    Outcome run_all();

    // Safe to call from any thread, before or during run_all(). Stays in
    // effect until reset().
    void cancel();
    void reset();

    const std::vector<Task>& tasks() const { return tasks_; }

private:
    std::vector<Task> tasks_;
    std::filesystem::path base_workdir_;
    BlockingQueue<RefreshEvent>* refresh_;
    RunControl control_;
};

} // namespace live_proxy
