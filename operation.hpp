#pragma once

#include "command.hpp"
#include "context.hpp"
#include "copy.hpp"
#include "running_operation.hpp"
#include "set_workdir.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <variant>

namespace live_proxy {

// What validate() may look at: the enclosing task and the configured base
// working directory. Nothing on disk is required to exist yet.
struct ValidationScope {
    std::string task;
    std::filesystem::path base_workdir;
};

// One step of a task. The set of kinds is closed; adding a kind means
// adding it to Variant and to from_json().
class Operation {
public:
    using Variant = std::variant<Command, Copy, SetWorkDir>;

    Operation(Command op) : op_(std::move(op)) {}
    Operation(Copy op) : op_(std::move(op)) {}
    Operation(SetWorkDir op) : op_(std::move(op)) {}

    // A single-key object: {"command": ...}, {"copy": {...}} or
    // {"set-workdir": "..."}.
    static Operation from_json(const nlohmann::json& j);

    const char* keyword() const;

    // Human readable one-liner for log and error messages.
    std::string describe() const;

    void validate(const ValidationScope& scope) const;
    std::unique_ptr<RunningOperation> start(Context& ctx) const;

    const Variant& variant() const { return op_; }

private:
    Variant op_;
};

} // namespace live_proxy
