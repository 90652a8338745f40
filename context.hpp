#pragma once

#include <any>
#include <deque>
#include <filesystem>
#include <map>
#include <string>
#include <typeindex>

namespace live_proxy {

namespace fs = std::filesystem;

// Scoped working directory, stored in a Frame by set-workdir.
struct WorkDir {
    fs::path path;
};

// One scope of variables, keyed by the variable's type.
class Frame {
public:
    explicit Frame(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    template <typename T>
    void insert_var(T value) {
        vars_[std::type_index(typeid(T))] = std::move(value);
    }

    template <typename T>
    const T* get_var() const {
        auto it = vars_.find(std::type_index(typeid(T)));
        if (it == vars_.end()) return nullptr;
        return std::any_cast<T>(&it->second);
    }

private:
    std::string name_;
    std::map<std::type_index, std::any> vars_;
};

// Stack of frames consulted innermost-first by operations. A task run
// pushes one frame and pops it when done, so nothing an operation stores
// survives into the next run.
class Context {
public:
    explicit Context(fs::path base_workdir);

    Frame& push_frame(std::string name);
    void pop_frame();

    Frame& top_frame();
    std::size_t depth() const { return frames_.size(); }

    template <typename T>
    const T* lookup() const {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            if (const T* v = it->template get_var<T>()) return v;
        }
        return nullptr;
    }

    const fs::path& base_workdir() const { return base_workdir_; }

    // Innermost WorkDir, or the base working directory.
    fs::path workdir() const;

    // Resolves `path` against workdir(). Absolute paths are kept as is.
    fs::path join_workdir(const std::string& path) const;

    // Writes into the current frame only.
    void set_workdir(fs::path dir);

    // "[task:NAME]" for the innermost frame, "[main]" outside any task.
    std::string log_tag() const;

private:
    fs::path base_workdir_;
    std::deque<Frame> frames_;
};

// Pushes a frame on construction and pops it on scope exit.
class FrameGuard {
public:
    FrameGuard(Context& ctx, std::string name) : ctx_(ctx) { ctx_.push_frame(std::move(name)); }
    ~FrameGuard() { ctx_.pop_frame(); }

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

private:
    Context& ctx_;
};

} // namespace live_proxy
