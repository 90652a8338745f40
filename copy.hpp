#pragma once

#include "context.hpp"
#include "running_operation.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace live_proxy {

struct ValidationScope;

// Copies a file or a directory tree. Both paths are relative to the
// context working directory.
//
// Existing destination files are overwritten, directories are copied
// recursively and merged into an existing destination, symlinks are copied
// as symlinks. Missing parent directories of `dst` are created.
class Copy {
public:
    static constexpr const char* KEYWORD = "copy";

    Copy(std::string src, std::string dst) : src_(std::move(src)), dst_(std::move(dst)) {}

    // {"src": "...", "dst": "..."}; any other field is rejected.
    static Copy from_json(const nlohmann::json& j);

    const char* keyword() const { return KEYWORD; }
    const std::string& src() const { return src_; }
    const std::string& dst() const { return dst_; }

    void validate(const ValidationScope& scope) const;

    std::unique_ptr<RunningOperation> start(Context& ctx) const;

private:
    std::string src_;
    std::string dst_;
};

} // namespace live_proxy
