#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "agent/agent_supervisor.hpp"
#include "config.hpp"
#include "http/server.hpp"

namespace agentgate {
namespace runtime {

/**
 * @brief Gateway process lifetime
 *
 * Owns the agent supervisor and the HTTP server built on top of it. The
 * server is stopped before the supervisor is released, so no handler can
 * reach a destroyed runner.
 */
class Runtime {
public:
    explicit Runtime(const GatewayConfig &config);
    ~Runtime();

    // Create the agent supervisor and start the HTTP server
    bool initialize(std::string &error);

    // Blocks until SIGINT/SIGTERM or stop(), then shuts down
    void run();

    void stop() { running_ = false; }

    // Stop accepting requests and cancel open streams. Safe to call twice.
    void shutdown();

    agent::AgentSupervisor &get_supervisor() { return *supervisor_; }

    // Null before initialize() and after shutdown()
    http::HttpServer *get_http_server() { return http_server_.get(); }

private:
    GatewayConfig config_;

    std::unique_ptr<agent::AgentSupervisor> supervisor_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace agentgate
