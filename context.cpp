#include "context.hpp"

#include <stdexcept>

namespace live_proxy {

Context::Context(fs::path base_workdir) : base_workdir_(std::move(base_workdir)) {}

Frame& Context::push_frame(std::string name) {
    frames_.emplace_back(std::move(name));
    return frames_.back();
}

void Context::pop_frame() {
    if (frames_.empty()) throw std::logic_error("pop_frame on an empty context");
    frames_.pop_back();
}

Frame& Context::top_frame() {
    if (frames_.empty()) throw std::logic_error("no frame has been pushed");
    return frames_.back();
}

fs::path Context::workdir() const {
    if (const WorkDir* dir = lookup<WorkDir>()) return dir->path;
    return base_workdir_;
}

fs::path Context::join_workdir(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute()) return p.lexically_normal();
    return (workdir() / p).lexically_normal();
}

void Context::set_workdir(fs::path dir) {
    top_frame().insert_var(WorkDir{std::move(dir)});
}

std::string Context::log_tag() const {
    if (frames_.empty()) return "[main]";
    return "[task:" + frames_.back().name() + "]";
}

} // namespace live_proxy
