#include "operation.hpp"
#include "errors.hpp"

namespace live_proxy {

Operation Operation::from_json(const nlohmann::json& j) {
    if (!j.is_object() || j.size() != 1) {
        throw ConfigError("an operation must be an object with exactly one key naming its kind");
    }

    auto it = j.begin();
    const std::string key = it.key();
    const nlohmann::json& value = it.value();
    if (key == Command::KEYWORD) return Command::from_json(value);
    if (key == Copy::KEYWORD) return Copy::from_json(value);
    if (key == SetWorkDir::KEYWORD) return SetWorkDir::from_json(value);
    throw ConfigError("unknown operation '" + key + "'");
}

const char* Operation::keyword() const {
    return std::visit([](const auto& op) { return op.keyword(); }, op_);
}

std::string Operation::describe() const {
    struct Describe {
        std::string operator()(const Command& c) const {
            std::string s = "command `" + c.run().to_string() + "`";
            if (c.workdir()) s += " in '" + *c.workdir() + "'";
            return s;
        }
        std::string operator()(const Copy& c) const {
            return "copy '" + c.src() + "' -> '" + c.dst() + "'";
        }
        std::string operator()(const SetWorkDir& s) const {
            return "set-workdir '" + s.path() + "'";
        }
    };
    return std::visit(Describe{}, op_);
}

void Operation::validate(const ValidationScope& scope) const {
    std::visit([&](const auto& op) { op.validate(scope); }, op_);
}

std::unique_ptr<RunningOperation> Operation::start(Context& ctx) const {
    return std::visit([&](const auto& op) { return op.start(ctx); }, op_);
}

} // namespace live_proxy
