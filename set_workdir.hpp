#pragma once

#include "context.hpp"
#include "running_operation.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace live_proxy {

struct ValidationScope;

// Changes the working directory seen by the following operations of the
// same task run.
class SetWorkDir {
public:
    static constexpr const char* KEYWORD = "set-workdir";

    explicit SetWorkDir(std::string path) : path_(std::move(path)) {}

    static SetWorkDir from_json(const nlohmann::json& j);

    const char* keyword() const { return KEYWORD; }
    const std::string& path() const { return path_; }

    void validate(const ValidationScope& scope) const;

    // Throws OperationError if the target is not an existing directory.
    std::unique_ptr<RunningOperation> start(Context& ctx) const;

private:
    std::string path_;
};

} // namespace live_proxy
