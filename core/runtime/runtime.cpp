#include "runtime.hpp"

#include <signal.h>

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace agentgate {
namespace runtime {

namespace {
constexpr int kLoopIntervalMs = 100;

const char *signal_name(int signal) {
    switch (signal) {
        case SIGINT: return "SIGINT";
        case SIGTERM: return "SIGTERM";
        default: return "signal";
    }
}
}  // namespace

Runtime::Runtime(const GatewayConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing agentgate");

    supervisor_ = std::make_unique<agent::AgentSupervisor>(config_.agent);
    LOG_INFO("[Runtime] " << config_.agent.name << " resolved to " << supervisor_->executable());
    if (!config_.agent.api_key) {
        LOG_WARN("[Runtime] CURSOR_API_KEY is not set; " << config_.agent.name << " must already be logged in");
    }

    http_server_ = std::make_unique<http::HttpServer>(config_, *supervisor_);
    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        http_server_.reset();
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

void Runtime::run() {
    running_ = true;
    LOG_INFO("[Runtime] Serving on port " << http_server_->get_port() << ", press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kLoopIntervalMs));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] " << signal_name(SignalHandler::received_signal()) << " received, stopping...");
            running_ = false;
        }
    }

    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        int open_streams = http_server_->active_streams();
        if (open_streams > 0) {
            LOG_INFO("[Runtime] Cancelling " << open_streams << " open stream(s)");
        }
        http_server_->stop();
        http_server_.reset();
    }

    supervisor_.reset();
}

}  // namespace runtime
}  // namespace agentgate
