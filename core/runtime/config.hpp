#pragma once

#include <string>
#include <vector>

#include "agent/agent_settings.hpp"
#include "workspace/temp_workspace.hpp"

namespace agentgate {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 8085;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 16;                           // Worker thread pool size
    int max_streams = 32;                                // Concurrent SSE streams (each holds a worker)
};

struct GatewayConfig {
    HttpConfig http;
    agent::AgentSettings agent;
    int request_timeout_ms = 3600000;  // Per-execution deadline (0 = unbounded)
    workspace::WorkspaceSettings workspace;
    LoggingConfig logging;
};

// Loads configuration from a YAML file (fields not present keep their defaults)
bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error);

// Applies PORT, WORKSPACE_ROOT, USE_WORKSPACE_AS_TEMP, CURSOR_API_KEY and LOG_LEVEL
bool apply_env_overrides(GatewayConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const GatewayConfig &config, std::string &error);

// One-line summaries of the effective configuration
void log_config(const GatewayConfig &config);

}  // namespace runtime
}  // namespace agentgate
