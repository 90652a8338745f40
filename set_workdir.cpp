#include "set_workdir.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "operation.hpp"

#include <iostream>
#include <system_error>

namespace live_proxy {

SetWorkDir SetWorkDir::from_json(const nlohmann::json& j) {
    if (!j.is_string()) {
        throw ConfigError("'set-workdir' must be a path string");
    }
    return SetWorkDir(j.get<std::string>());
}

void SetWorkDir::validate(const ValidationScope&) const {
    if (path_.empty()) {
        throw ConfigError("'set-workdir' path is empty");
    }
}

std::unique_ptr<RunningOperation> SetWorkDir::start(Context& ctx) const {
    fs::path dir = ctx.join_workdir(path_);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw OperationError("'" + dir.string() +
                             "' is not a valid path to a directory (or it is inaccessible)");
    }

    if (verbose()) {
        std::cout << ctx.log_tag() << "[set-workdir] set working directory to " << dir.string() << std::endl;
    }
    ctx.set_workdir(std::move(dir));

    return std::make_unique<CompletedOperation>(Outcome::Success);
}

} // namespace live_proxy
