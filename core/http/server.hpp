#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "agent/i_agent_runner.hpp"
#include "runtime/config.hpp"

namespace agentgate {
namespace protocol {
class IStreamEnvelope;
}
namespace workspace {
class TempWorkspace;
}
}  // namespace agentgate

namespace agentgate {
namespace http {

/**
 * @brief HTTP server exposing the agent over OpenAI-compatible endpoints
 *
 * The HTTP server is an adapter layer: it validates requests, renders them
 * into a prompt, provisions a working directory and delegates execution to
 * the agent runner. Encoding of results (buffered JSON or SSE) is done by
 * the protocol module.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - A streaming response holds its worker for the lifetime of the stream
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown, cancels open streams and joins server thread
 */
class HttpServer {
public:
    /**
     * @brief Construct HTTP server
     *
     * @param config Gateway configuration (HTTP, workspace, request timeout)
     * @param runner Agent runner used by every execution endpoint
     */
    HttpServer(const runtime::GatewayConfig &config, agent::IAgentRunner &runner);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Get the port server is listening on
     *
     * When configured with port 0 this is the port picked by the OS.
     */
    int get_port() const { return port_; }

    int active_streams() const { return stream_count_.load(); }

private:
    runtime::GatewayConfig config_;
    int port_ = 0;

    agent::IAgentRunner &runner_;

    std::atomic<int> stream_count_{0};

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Execution request with the configured deadline
    agent::AgentExecutionRequest make_execution_request(std::string prompt, std::string working_directory) const;

    // Route handlers (implemented in handlers/*.cpp)
    void handle_post_chat_completions(const httplib::Request &req, httplib::Response &res);
    void handle_post_responses(const httplib::Request &req, httplib::Response &res);
    void handle_get_models(const httplib::Request &req, httplib::Response &res);
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_post_prompt(const httplib::Request &req, httplib::Response &res);

    /**
     * @brief Run the request as a streaming execution and answer with SSE
     *
     * The workspace and the line stream are owned by the chunked content
     * provider and released (agent cancelled, directory removed) when the
     * response completes or the client goes away.
     */
    void stream_response(httplib::Response &res, agent::AgentExecutionRequest request,
                         std::unique_ptr<workspace::TempWorkspace> workspace,
                         std::unique_ptr<protocol::IStreamEnvelope> envelope);
};

}  // namespace http
}  // namespace agentgate
