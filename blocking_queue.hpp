#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>

namespace live_proxy {

// Multi-producer FIFO with a blocking pop. Once closed, pushes are refused
// and pop() returns std::nullopt after the remaining items are drained.
template <typename T>
class BlockingQueue {
public:
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_) return false;
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mx_);
        cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
        return take_locked();
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mx_);
        cv_.wait_for(lk, timeout, [this] { return closed_ || !items_.empty(); });
        return take_locked();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mx_);
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mx_);
        return items_.size();
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

// "A watched pipeline finished, tell the browsers." Carries no payload.
struct RefreshEvent {};

// Background threads report fatal errors here; main() waits on it.
using ErrorChannel = BlockingQueue<std::exception_ptr>;

} // namespace live_proxy
