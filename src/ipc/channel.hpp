/**
 * Warden Channel
 *
 * Ordered, asynchronous single-queue channel used between an execution
 * context and its supervisor. Messages are delivered in push order; once
 * closed, pushes are dropped and waiting readers wake up.
 */
#pragma once
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

namespace warden::ipc {

template <typename T>
class Channel {
public:
    Channel() = default;

    // Non-copyable
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel is closed (message dropped)
    bool push(T message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    // Wait up to `timeout` for the next message
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return take_locked();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;

    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }
};

} // namespace warden::ipc
