#include "task.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <iostream>

namespace live_proxy {

// -------------------------------- RunControl ---------------------------------
void RunControl::cancel() {
    std::lock_guard<std::mutex> lk(mx_);
    cancelled_ = true;
    if (current_) current_->cancel();
}

bool RunControl::cancelled() const {
    std::lock_guard<std::mutex> lk(mx_);
    return cancelled_;
}

void RunControl::reset() {
    std::lock_guard<std::mutex> lk(mx_);
    cancelled_ = false;
}

RunControl::Attachment::Attachment(RunControl* control, RunningOperation* op) : control_(control) {
    if (!control_) return;
    std::lock_guard<std::mutex> lk(control_->mx_);
    // Cancelled between the check in Task::run() and start().
    if (control_->cancelled_) op->cancel();
    control_->current_ = op;
}

RunControl::Attachment::~Attachment() {
    if (!control_) return;
    std::lock_guard<std::mutex> lk(control_->mx_);
    control_->current_ = nullptr;
}

// ----------------------------------- Task ------------------------------------
Task::Task(std::string name, std::vector<Operation> operations)
    : name_(std::move(name)), operations_(std::move(operations)) {}

Task Task::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("a task must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "name" && it.key() != "operations") {
            throw ConfigError("unknown field '" + it.key() + "' in task");
        }
    }
    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty()) {
        throw ConfigError("a task needs a non-empty 'name'");
    }
    std::string name = j["name"].get<std::string>();
    if (!j.contains("operations") || !j["operations"].is_array()) {
        throw ConfigError("task '" + name + "' needs an 'operations' list");
    }

    std::vector<Operation> ops;
    for (const auto& jo : j["operations"]) {
        try {
            ops.push_back(Operation::from_json(jo));
        } catch (const ConfigError& e) {
            throw ConfigError("in task '" + name + "': " + e.what());
        }
    }
    return Task(std::move(name), std::move(ops));
}

void Task::validate(const std::filesystem::path& base_workdir) const {
    ValidationScope scope{name_, base_workdir};
    for (const auto& op : operations_) {
        try {
            op.validate(scope);
        } catch (const ConfigError& e) {
            throw ConfigError(std::string("invalid configuration for operation '") + op.keyword() +
                              "' in task '" + name_ + "': " + e.what());
        }
    }
}

Outcome Task::run(Context& ctx, RunControl* control) const {
    FrameGuard frame(ctx, name_);
    if (verbose()) std::cout << ctx.log_tag() << " Starting task" << std::endl;

    for (const auto& op : operations_) {
        if (control && control->cancelled()) {
            std::cerr << ctx.log_tag() << " WARNING: cancelled before '" << op.keyword()
                      << "' operation" << std::endl;
            return Outcome::Failure;
        }

        Outcome outcome;
        try {
            std::unique_ptr<RunningOperation> running = op.start(ctx);
            RunControl::Attachment attached(control, running.get());
            outcome = running->finish();
        } catch (const OperationError& e) {
            throw OperationError(std::string("failed to run operation '") + op.keyword() +
                                 "' for task '" + name_ + "': " + e.what());
        }

        if (is_failure(outcome)) {
            std::cerr << ctx.log_tag() << " WARNING: " << op.describe()
                      << " failed -> stopping (no further operations of this task are run)" << std::endl;
            return Outcome::Failure;
        }
    }

    if (verbose()) std::cout << ctx.log_tag() << " Finished running all operations of task" << std::endl;
    return Outcome::Success;
}

// -------------------------------- TaskRunner ---------------------------------
TaskRunner::TaskRunner(std::vector<Task> tasks, std::filesystem::path base_workdir,
                       BlockingQueue<RefreshEvent>* refresh)
    : tasks_(std::move(tasks)), base_workdir_(std::move(base_workdir)), refresh_(refresh) {}

void TaskRunner::validate() const {
    for (const auto& task : tasks_) task.validate(base_workdir_);
}

Outcome TaskRunner::run_all() {
    Context ctx(base_workdir_);

    for (const auto& task : tasks_) {
        if (control_.cancelled()) {
            std::cerr << "[task:" << task.name() << "] WARNING: pipeline cancelled, not starting task" << std::endl;
            return Outcome::Failure;
        }

        Outcome outcome;
        try {
            outcome = task.run(ctx, &control_);
        } catch (const OperationError& e) {
            std::cerr << "[task:" << task.name() << "] ERROR: " << e.what() << std::endl;
            return Outcome::Failure;
        }
        if (is_failure(outcome)) return Outcome::Failure;
    }

    if (refresh_) refresh_->push(RefreshEvent{});
    return Outcome::Success;
}

void TaskRunner::cancel() { control_.cancel(); }

void TaskRunner::reset() { control_.reset(); }

} // namespace live_proxy
