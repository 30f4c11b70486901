#pragma once

#include <string>
#include <vector>

#include "agent_settings.hpp"
#include "agent_types.hpp"

namespace agentgate {
namespace agent {

// Pick the executable to spawn: install_path when it exists and is executable,
// otherwise the bare command name (left for execvp to search on PATH).
std::string resolve_executable(const AgentSettings &settings);

// Build the agent argv (without argv[0]) for one request
std::vector<std::string> build_agent_args(const AgentSettings &settings, const AgentExecutionRequest &request);

// Render argv for logging with the credential masked
std::string describe_args(const std::vector<std::string> &args);

}  // namespace agent
}  // namespace agentgate
