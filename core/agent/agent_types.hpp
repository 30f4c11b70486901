#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace agentgate {
namespace agent {

// Why an execution did not succeed
enum class ErrorKind {
    NONE,
    INVALID_REQUEST,  // Rejected before spawning (e.g. empty prompt)
    SPAWN_FAILED,     // Executable missing/unusable, bad working directory
    TIMED_OUT,        // Deadline elapsed, process terminated
    NONZERO_EXIT      // Agent exited non-zero or was killed by a signal
};

inline const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorKind::SPAWN_FAILED: return "SPAWN_FAILED";
        case ErrorKind::TIMED_OUT: return "TIMED_OUT";
        case ErrorKind::NONZERO_EXIT: return "NONZERO_EXIT";
        default: return "NONE";
    }
}

// One agent invocation. Built once per inbound call, never modified afterwards.
struct AgentExecutionRequest {
    std::string prompt;
    std::string working_directory;
    std::optional<std::chrono::milliseconds> timeout;  // nullopt = unbounded
    bool use_mcps = true;                              // Let the agent approve its own MCP integrations
};

// Terminal outcome of a buffered execution
struct AgentExecutionResult {
    bool success = false;
    std::string raw_output;  // stdout + stderr in arrival order
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::NONE;

    static AgentExecutionResult ok(std::string output) {
        AgentExecutionResult result;
        result.success = true;
        result.raw_output = std::move(output);
        return result;
    }

    static AgentExecutionResult failure(ErrorKind kind, std::string message, std::string output = "") {
        AgentExecutionResult result;
        result.success = false;
        result.error_kind = kind;
        result.error = std::move(message);
        result.raw_output = std::move(output);
        return result;
    }
};

}  // namespace agent
}  // namespace agentgate
