#pragma once

/**
 * @file line_channel.hpp
 * @brief Per-execution queue between the stdout drain thread and the stream consumer
 *
 * One producer (the drain thread) pushes lines in emission order; one consumer
 * (the HTTP chunk provider) pops them. The channel is closed exactly once,
 * either cleanly or with an error; lines queued before the close are still
 * delivered before the terminal status.
 */

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace agentgate {
namespace agent {

class LineChannel {
public:
    enum class PopStatus {
        LINE,     // A line was returned
        EMPTY,    // Timed out with nothing queued, channel still open
        CLOSED,   // Drained and closed cleanly
        FAILED    // Drained and closed with an error
    };

    /**
     * @brief Push a line (producer side). Ignored once the channel is closed.
     * @return true if the line was queued
     */
    bool push(std::string line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push(std::move(line));
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Pop the next line (consumer side)
     *
     * Blocks until a line is available, the channel closes, or timeout_ms
     * expires (timeout_ms < 0 waits indefinitely, 0 never blocks).
     */
    PopStatus pop(std::string &line, int timeout_ms = -1) {
        std::unique_lock<std::mutex> lock(mutex_);

        auto ready = [this] { return !queue_.empty() || closed_; };
        if (timeout_ms < 0) {
            cv_.wait(lock, ready);
        } else if (timeout_ms > 0) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready);
        }

        if (!queue_.empty()) {
            line = std::move(queue_.front());
            queue_.pop();
            return PopStatus::LINE;
        }
        if (!closed_) {
            return PopStatus::EMPTY;
        }
        return error_ ? PopStatus::FAILED : PopStatus::CLOSED;
    }

    // Close cleanly. First close wins; returns false if already closed.
    bool close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        closed_ = true;
        cv_.notify_all();
        return true;
    }

    // Close with an error. First close wins; returns false if already closed.
    bool close_with_error(const std::string &error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        closed_ = true;
        error_ = error;
        cv_.notify_all();
        return true;
    }

    // Drop queued lines (consumer gave up)
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<std::string> empty;
        queue_.swap(empty);
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::optional<std::string> error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::string> queue_;
    bool closed_ = false;
    std::optional<std::string> error_;
};

}  // namespace agent
}  // namespace agentgate
