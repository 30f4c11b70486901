#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "agent_process.hpp"
#include "i_agent_runner.hpp"
#include "line_channel.hpp"

namespace agentgate {
namespace agent {

/**
 * @brief Streaming execution of one agent process
 *
 * Threads (all owned and joined by this object):
 * - stdout drain: splits chunks into lines and pushes them to the channel
 * - stderr drain: logs diagnostic output, never offered to the consumer
 * - watcher: writes the prompt, then waits for EOF/exit or the deadline and
 *   closes the channel with the terminal status
 *
 * Cancellation (explicit or by destruction) sends SIGTERM once and wakes the
 * watcher before its deadline can fire.
 */
class AgentStream : public ILineStream {
public:
    AgentStream(std::unique_ptr<AgentProcess> process, std::string prompt,
                std::optional<std::chrono::milliseconds> timeout, int terminate_grace_ms);
    ~AgentStream() override;

    AgentStream(const AgentStream &) = delete;
    AgentStream &operator=(const AgentStream &) = delete;

    // Spawn the process and start the worker threads. On spawn failure the
    // stream is immediately FAILED.
    void start();

    Status next(std::string &line, int timeout_ms) override;
    void cancel() override;
    std::string error() const override;

    bool timed_out() const;
    bool cancelled() const;
    bool finished() const;
    int terminate_count() const { return process_->terminate_count(); }
    bool process_running() const { return process_->is_running(); }

private:
    void drain_stdout();
    void drain_stderr();
    void watch();
    void on_pipe_closed();
    void finish_with_timeout();
    long long remaining_ms() const;

    std::unique_ptr<AgentProcess> process_;
    std::string prompt_;
    std::optional<std::chrono::milliseconds> timeout_;
    std::chrono::steady_clock::time_point deadline_;
    int terminate_grace_ms_;

    LineChannel channel_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    int open_pipes_ = 0;
    bool cancelled_ = false;
    bool timed_out_ = false;
    bool finished_ = false;

    std::atomic<bool> stop_{false};
    std::thread stdout_thread_;
    std::thread stderr_thread_;
    std::thread watcher_thread_;
};

// Stream that failed before any process was started
class FailedLineStream : public ILineStream {
public:
    explicit FailedLineStream(std::string error) : error_(std::move(error)) {}

    Status next(std::string &, int) override { return Status::FAILED; }
    void cancel() override {}
    std::string error() const override { return error_; }

private:
    std::string error_;
};

}  // namespace agent
}  // namespace agentgate
