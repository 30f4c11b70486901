#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "agent_settings.hpp"
#include "agent_types.hpp"
#include "i_agent_runner.hpp"

namespace agentgate {
namespace agent {

class AgentProcess;

/**
 * @brief Runs one agent process per request
 *
 * execute() blocks the calling thread until the agent exits or the request
 * deadline passes and always returns exactly one result. execute_streaming()
 * returns immediately with a stream that owns the process.
 *
 * Settings are fixed at construction; the only mutable shared state is the
 * resolved executable path.
 */
class AgentSupervisor : public IAgentRunner {
public:
    explicit AgentSupervisor(AgentSettings settings);

    AgentExecutionResult execute(const AgentExecutionRequest &request) override;
    std::unique_ptr<ILineStream> execute_streaming(const AgentExecutionRequest &request) override;

    const AgentSettings &settings() const override { return settings_; }

    // Executable that the next spawn will use
    std::string executable();

private:
    std::unique_ptr<AgentProcess> make_process(const AgentExecutionRequest &request);

    AgentSettings settings_;

    std::mutex executable_mutex_;
    std::optional<std::string> cached_executable_;
};

}  // namespace agent
}  // namespace agentgate
