#include "agent_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <thread>

#include "agent_command.hpp"
#include "agent_process.hpp"
#include "agent_stream.hpp"
#include "logging/logger.hpp"

namespace agentgate {
namespace agent {

namespace {

// Output shared between the two drain threads and the waiting caller
struct OutputBuffer {
    std::mutex mutex;
    std::condition_variable cv;
    std::string data;
    int open_pipes = 2;

    void append(const std::string &chunk) {
        std::lock_guard<std::mutex> lock(mutex);
        data += chunk;
    }

    void pipe_closed() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open_pipes--;
        }
        cv.notify_all();
    }

    std::string snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return data;
    }
};

}  // namespace

AgentSupervisor::AgentSupervisor(AgentSettings settings) : settings_(std::move(settings)) {}

std::string AgentSupervisor::executable() {
    std::lock_guard<std::mutex> lock(executable_mutex_);
    if (cached_executable_) {
        return *cached_executable_;
    }

    std::string resolved = resolve_executable(settings_);
    if (resolved == settings_.install_path) {
        cached_executable_ = resolved;
    }
    return resolved;
}

std::unique_ptr<AgentProcess> AgentSupervisor::make_process(const AgentExecutionRequest &request) {
    auto args = build_agent_args(settings_, request);
    std::string exe = executable();
    LOG_DEBUG("[Agent] Command: " << exe << " " << describe_args(args));
    return std::make_unique<AgentProcess>(settings_.name, exe, args, request.working_directory);
}

AgentExecutionResult AgentSupervisor::execute(const AgentExecutionRequest &request) {
    if (request.prompt.empty()) {
        return AgentExecutionResult::failure(ErrorKind::INVALID_REQUEST, "Prompt must not be empty");
    }

    LOG_INFO("[Agent] Executing " << settings_.name << " with prompt (" << request.prompt.size() << " chars) in "
                                  << request.working_directory);

    auto process = make_process(request);
    if (!process->spawn()) {
        std::string error = "Failed to spawn " + settings_.name + ": " + process->last_error();
        LOG_ERROR("[Agent] " << error);
        return AgentExecutionResult::failure(ErrorKind::SPAWN_FAILED, error);
    }

    const auto deadline = request.timeout ? std::chrono::steady_clock::now() + *request.timeout
                                          : std::chrono::steady_clock::time_point::max();
    auto remaining_ms = [&]() -> int {
        if (!request.timeout) {
            return -1;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };

    OutputBuffer output;
    std::atomic<bool> stop{false};
    auto &pipes = process->pipes();

    std::thread stdout_thread([&]() {
        drain_pipe(pipes, StdioPipes::Channel::STDOUT, stop, [&](const std::string &chunk) { output.append(chunk); });
        output.pipe_closed();
    });
    std::thread stderr_thread([&]() {
        drain_pipe(pipes, StdioPipes::Channel::STDERR, stop, [&](const std::string &chunk) {
            LOG_WARN("[Agent] " << settings_.name << " stderr: " << chunk);
            output.append(chunk);
        });
        output.pipe_closed();
    });

    if (!pipes.write_all(request.prompt, remaining_ms())) {
        // Exit status decides the outcome
        LOG_WARN("[Agent] Prompt delivery incomplete: " << pipes.last_error());
    }
    pipes.close_stdin();

    bool drained;
    {
        std::unique_lock<std::mutex> lock(output.mutex);
        auto done = [&output] { return output.open_pipes == 0; };
        if (request.timeout) {
            drained = output.cv.wait_until(lock, deadline, done);
        } else {
            output.cv.wait(lock, done);
            drained = true;
        }
    }

    bool exited = drained && process->wait_for_exit(remaining_ms());
    if (!exited && !request.timeout) {
        // Only reachable when waitpid itself fails
        std::string error = settings_.name + " exit status unavailable";
        LOG_ERROR("[Agent] " << error);
        stop.store(true);
        stdout_thread.join();
        stderr_thread.join();
        auto result = AgentExecutionResult::failure(ErrorKind::NONZERO_EXIT, error, output.snapshot());
        process->reap(settings_.terminate_grace_ms);
        return result;
    }
    if (!exited) {
        std::string error =
            settings_.name + " execution timed out after " + std::to_string(request.timeout->count()) + "ms";
        LOG_ERROR("[Agent] " << error);

        process->terminate();
        stop.store(true);
        stdout_thread.join();
        stderr_thread.join();

        auto result = AgentExecutionResult::failure(ErrorKind::TIMED_OUT, error, output.snapshot());
        process->reap(settings_.terminate_grace_ms);
        return result;
    }

    stdout_thread.join();
    stderr_thread.join();

    auto code = process->exit_code();
    if (code && *code == 0) {
        LOG_INFO("[Agent] " << settings_.name << " execution completed successfully");
        return AgentExecutionResult::ok(output.snapshot());
    }

    std::string error = settings_.name + " " + process->exit_description();
    LOG_ERROR("[Agent] Execution failed: " << error);
    return AgentExecutionResult::failure(ErrorKind::NONZERO_EXIT, error, output.snapshot());
}

std::unique_ptr<ILineStream> AgentSupervisor::execute_streaming(const AgentExecutionRequest &request) {
    if (request.prompt.empty()) {
        // Reported through the stream like any other failure
        return std::make_unique<FailedLineStream>("Prompt must not be empty");
    }

    auto stream = std::make_unique<AgentStream>(make_process(request), request.prompt, request.timeout,
                                                settings_.terminate_grace_ms);
    stream->start();
    return stream;
}

}  // namespace agent
}  // namespace agentgate
