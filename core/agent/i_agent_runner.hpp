#pragma once

#include <memory>
#include <string>

#include "agent_settings.hpp"
#include "agent_types.hpp"

namespace agentgate {
namespace agent {

// Lazily produced, cancellable sequence of raw agent stdout lines
class ILineStream {
public:
    enum class Status {
        LINE,     // `line` holds the next line
        PENDING,  // Nothing arrived within timeout_ms; call again
        END,      // Agent exited 0; no more lines
        FAILED    // Terminated with an error (see error())
    };

    virtual ~ILineStream() = default;

    // timeout_ms < 0 waits until a line or the end of the stream
    virtual Status next(std::string &line, int timeout_ms) = 0;

    // Stop consuming: terminates the agent and disarms its deadline.
    // No-op once the stream has already finished.
    virtual void cancel() = 0;

    // Error text after FAILED (empty otherwise)
    virtual std::string error() const = 0;
};

// Executes agent requests. Implemented by AgentSupervisor; mocked in HTTP tests.
class IAgentRunner {
public:
    virtual ~IAgentRunner() = default;

    // Buffered execution. Never throws; every failure is reported in the result.
    // A timed-out call returns once the agent is gone: within timeout + terminate_grace_ms
    // of the spawn, plus one drain poll interval.
    virtual AgentExecutionResult execute(const AgentExecutionRequest &request) = 0;

    // Streaming execution. Spawn failures surface as a stream that ends FAILED.
    virtual std::unique_ptr<ILineStream> execute_streaming(const AgentExecutionRequest &request) = 0;

    virtual const AgentSettings &settings() const = 0;
};

}  // namespace agent
}  // namespace agentgate
