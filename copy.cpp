#include "copy.hpp"
#include "errors.hpp"
#include "operation.hpp"

#include <iostream>
#include <system_error>

namespace live_proxy {

Copy Copy::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("'copy' must be an object with 'src' and 'dst'");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "src" && it.key() != "dst") {
            throw ConfigError("unknown field '" + it.key() + "' in 'copy'");
        }
    }
    auto field = [&](const char* name) {
        if (!j.contains(name)) throw ConfigError(std::string("missing field '") + name + "' in 'copy'");
        if (!j[name].is_string()) throw ConfigError(std::string("'") + name + "' must be a string");
        return j[name].get<std::string>();
    };
    return Copy(field("src"), field("dst"));
}

void Copy::validate(const ValidationScope&) const {
    if (src_.empty()) throw ConfigError("'copy' source path is empty");
    if (dst_.empty()) throw ConfigError("'copy' destination path is empty");
}

std::unique_ptr<RunningOperation> Copy::start(Context& ctx) const {
    const fs::path src = ctx.join_workdir(src_);
    const fs::path dst = ctx.join_workdir(dst_);

    std::error_code ec;
    auto status = fs::symlink_status(src, ec);
    if (ec || !fs::exists(status)) {
        throw OperationError("cannot copy '" + src.string() + "': no such file or directory");
    }

    std::cout << ctx.log_tag() << "[copy] " << src.string() << " -> " << dst.string() << std::endl;

    if (dst.has_parent_path()) {
        fs::create_directories(dst.parent_path(), ec);
        if (ec) {
            throw OperationError("cannot create '" + dst.parent_path().string() + "': " + ec.message());
        }
    }

    const auto options = fs::copy_options::recursive
                       | fs::copy_options::overwrite_existing
                       | fs::copy_options::copy_symlinks;

    if (fs::is_symlink(status) && fs::exists(fs::symlink_status(dst, ec))) {
        // copy_symlink does not overwrite.
        fs::remove(dst, ec);
        if (ec) {
            throw OperationError("cannot replace '" + dst.string() + "': " + ec.message());
        }
    }

    fs::copy(src, dst, options, ec);
    if (ec) {
        throw OperationError("cannot copy '" + src.string() + "' to '" + dst.string() + "': " + ec.message());
    }

    return std::make_unique<CompletedOperation>(Outcome::Success);
}

} // namespace live_proxy
