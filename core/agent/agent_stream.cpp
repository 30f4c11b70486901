#include "agent_stream.hpp"

#include "line_splitter.hpp"
#include "logging/logger.hpp"

namespace agentgate {
namespace agent {

AgentStream::AgentStream(std::unique_ptr<AgentProcess> process, std::string prompt,
                         std::optional<std::chrono::milliseconds> timeout, int terminate_grace_ms)
    : process_(std::move(process)),
      prompt_(std::move(prompt)),
      timeout_(timeout),
      deadline_(std::chrono::steady_clock::time_point::max()),
      terminate_grace_ms_(terminate_grace_ms) {}

AgentStream::~AgentStream() {
    cancel();

    // The watcher may still be blocked writing the prompt; killing the group breaks the pipe
    process_->reap(terminate_grace_ms_);

    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
    stop_.store(true);
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

void AgentStream::start() {
    LOG_INFO("[Stream] Executing " << process_->name() << " streaming with prompt (" << prompt_.size()
                                   << " chars)");

    if (!process_->spawn()) {
        std::string error = "Failed to spawn " + process_->name() + ": " + process_->last_error();
        LOG_ERROR("[Stream] " << error);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            finished_ = true;
        }
        channel_.close_with_error(error);
        return;
    }

    // Deadline starts at spawn
    if (timeout_) {
        deadline_ = std::chrono::steady_clock::now() + *timeout_;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_pipes_ = 2;
    }

    stdout_thread_ = std::thread([this]() { drain_stdout(); });
    stderr_thread_ = std::thread([this]() { drain_stderr(); });
    watcher_thread_ = std::thread([this]() { watch(); });
}

ILineStream::Status AgentStream::next(std::string &line, int timeout_ms) {
    switch (channel_.pop(line, timeout_ms)) {
        case LineChannel::PopStatus::LINE:
            return Status::LINE;
        case LineChannel::PopStatus::EMPTY:
            return Status::PENDING;
        case LineChannel::PopStatus::CLOSED:
            return Status::END;
        case LineChannel::PopStatus::FAILED:
        default:
            return Status::FAILED;
    }
}

void AgentStream::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (cancelled_ || finished_) {
            return;
        }
        cancelled_ = true;
    }
    // Wake the watcher before anything else so its deadline can no longer fire
    state_cv_.notify_all();

    LOG_INFO("[Stream] Cancelling " << process_->name() << " (PID=" << process_->pid() << ")");
    process_->terminate();
    stop_.store(true);
    channel_.close_with_error(process_->name() + " execution cancelled");
}

std::string AgentStream::error() const { return channel_.error().value_or(""); }

bool AgentStream::timed_out() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return timed_out_;
}

bool AgentStream::cancelled() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cancelled_;
}

bool AgentStream::finished() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return finished_;
}

long long AgentStream::remaining_ms() const {
    if (!timeout_) {
        return -1;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
    return left.count() > 0 ? left.count() : 0;
}

void AgentStream::drain_stdout() {
    LineSplitter splitter;
    drain_pipe(process_->pipes(), StdioPipes::Channel::STDOUT, stop_, [this, &splitter](const std::string &chunk) {
        for (auto &line : splitter.feed(chunk)) {
            LOG_DEBUG("[Stream] stdout: " << line);
            channel_.push(std::move(line));
        }
    });
    for (auto &line : splitter.flush()) {
        channel_.push(std::move(line));
    }
    on_pipe_closed();
}

void AgentStream::drain_stderr() {
    LineSplitter splitter;
    drain_pipe(process_->pipes(), StdioPipes::Channel::STDERR, stop_, [this, &splitter](const std::string &chunk) {
        for (const auto &line : splitter.feed(chunk)) {
            LOG_WARN("[Stream] " << process_->name() << " stderr: " << line);
        }
    });
    for (const auto &line : splitter.flush()) {
        LOG_WARN("[Stream] " << process_->name() << " stderr: " << line);
    }
    on_pipe_closed();
}

void AgentStream::on_pipe_closed() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_pipes_--;
    }
    state_cv_.notify_all();
}

void AgentStream::finish_with_timeout() {
    std::string error = process_->name() + " execution timed out after " + std::to_string(timeout_->count()) + "ms";
    LOG_ERROR("[Stream] " << error);
    process_->terminate();
    stop_.store(true);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished_ = true;
    }
    channel_.close_with_error(error);
}

void AgentStream::watch() {
    // The agent reads the whole prompt before producing output
    auto &pipes = process_->pipes();
    if (!pipes.write_all(prompt_, static_cast<int>(remaining_ms()))) {
        LOG_WARN("[Stream] Prompt delivery incomplete: " << pipes.last_error());
    }
    pipes.close_stdin();

    bool timed_out = false;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        auto done = [this] { return open_pipes_ == 0 || cancelled_; };
        if (timeout_) {
            if (!state_cv_.wait_until(lock, deadline_, done)) {
                timed_out_ = true;
                timed_out = true;
            }
        } else {
            state_cv_.wait(lock, done);
        }
        if (cancelled_) {
            return;  // cancel() already terminated the process and closed the channel
        }
    }

    if (timed_out) {
        finish_with_timeout();
        return;
    }

    // Output closed; collect the exit status within what is left of the deadline
    if (!process_->wait_for_exit(static_cast<int>(remaining_ms()))) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (cancelled_) {
                return;
            }
            if (timeout_) {
                timed_out_ = true;
            }
        }
        if (timeout_) {
            finish_with_timeout();
        } else {
            // Only reachable when waitpid itself fails
            std::string error = process_->name() + " exit status unavailable";
            LOG_ERROR("[Stream] " << error);
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                finished_ = true;
            }
            channel_.close_with_error(error);
        }
        return;
    }

    // Finished before the consumer can observe the terminal status
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished_ = true;
    }

    auto code = process_->exit_code();
    if (code && *code == 0) {
        LOG_INFO("[Stream] " << process_->name() << " streaming execution completed successfully");
        channel_.close();
    } else {
        std::string error = process_->name() + " " + process_->exit_description();
        LOG_ERROR("[Stream] Streaming execution failed: " << error);
        channel_.close_with_error(error);
    }
}

}  // namespace agent
}  // namespace agentgate
