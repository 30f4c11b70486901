#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

#include "logging/logger.hpp"

namespace agentgate {
namespace runtime {

namespace {

const char *env_value(const char *name) {
    const char *value = std::getenv(name);
    return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

}  // namespace

bool validate_config(const GatewayConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.max_streams < 1) {
        error = "HTTP max_streams must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate agent settings
    if (config.agent.command.empty()) {
        error = "agent.command must not be empty";
        return false;
    }
    if (config.agent.model.empty()) {
        error = "agent.model must not be empty";
        return false;
    }
    if (config.request_timeout_ms < 0) {
        error = "agent.request_timeout_ms must be >= 0 (0 = unbounded)";
        return false;
    }
    if (config.agent.terminate_grace_ms < 100) {
        error = "agent.terminate_grace_ms must be >= 100ms";
        return false;
    }

    // Validate workspace settings
    if (config.workspace.root.empty()) {
        error = "workspace.root must not be empty";
        return false;
    }
    if (config.workspace.temp_prefix.find('/') != std::string::npos) {
        error = "workspace.temp_prefix must not contain '/'";
        return false;
    }

    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!yaml.IsMap()) {
            if (yaml.IsNull()) {
                return true;  // Empty file: defaults
            }
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "agent", "workspace", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
            if (http["max_streams"]) {
                config.http.max_streams = http["max_streams"].as<int>();
            }
        }

        // Load agent config
        if (yaml["agent"]) {
            const auto &agent = yaml["agent"];
            if (agent["name"]) {
                config.agent.name = agent["name"].as<std::string>();
            }
            if (agent["command"]) {
                config.agent.command = agent["command"].as<std::string>();
            }
            if (agent["install_path"]) {
                config.agent.install_path = agent["install_path"].as<std::string>();
            }
            if (agent["model"]) {
                config.agent.model = agent["model"].as<std::string>();
            }
            if (agent["http_version"]) {
                config.agent.http_version = agent["http_version"].as<std::string>();
            }
            if (agent["insecure"]) {
                config.agent.insecure = agent["insecure"].as<bool>();
            }
            if (agent["request_timeout_ms"]) {
                config.request_timeout_ms = agent["request_timeout_ms"].as<int>();
            }
            if (agent["terminate_grace_ms"]) {
                config.agent.terminate_grace_ms = agent["terminate_grace_ms"].as<int>();
            }
            if (agent["api_key"]) {
                LOG_WARN("[Config] agent.api_key is ignored; set CURSOR_API_KEY in the environment instead");
            }
        }

        // Load workspace config
        if (yaml["workspace"]) {
            const auto &ws = yaml["workspace"];
            if (ws["root"]) {
                config.workspace.root = ws["root"].as<std::string>();
            }
            if (ws["use_workspace_as_temp"]) {
                config.workspace.use_workspace_as_temp = ws["use_workspace_as_temp"].as<bool>();
            }
            if (ws["temp_prefix"]) {
                config.workspace.temp_prefix = ws["temp_prefix"].as<std::string>();
            }
            if (ws["temp_base"]) {
                config.workspace.temp_base = ws["temp_base"].as<std::string>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config_path);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool apply_env_overrides(GatewayConfig &config, std::string &error) {
    if (const char *port = env_value("PORT")) {
        char *end = nullptr;
        long value = std::strtol(port, &end, 10);
        if (end == port || *end != '\0' || value < 1 || value > 65535) {
            error = "PORT must be a number between 1 and 65535 (got '" + std::string(port) + "')";
            return false;
        }
        config.http.port = static_cast<int>(value);
    }

    if (const char *root = env_value("WORKSPACE_ROOT")) {
        config.workspace.root = root;
    }

    if (const char *use_ws = env_value("USE_WORKSPACE_AS_TEMP")) {
        config.workspace.use_workspace_as_temp = std::string(use_ws) == "true";
    }

    if (const char *key = env_value("CURSOR_API_KEY")) {
        config.agent.api_key = std::string(key);
    }

    if (const char *level = env_value("LOG_LEVEL")) {
        config.logging.level = level;
    }
    return true;
}

void log_config(const GatewayConfig &config) {
    LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " (threads: "
                               << config.http.thread_pool_size << ", max streams: " << config.http.max_streams << ")");

    std::stringstream agent_msg;
    agent_msg << "[Config] Agent: " << config.agent.name << " (model: " << config.agent.model << ", timeout: ";
    if (config.request_timeout_ms > 0) {
        agent_msg << config.request_timeout_ms << "ms";
    } else {
        agent_msg << "none";
    }
    agent_msg << ", api key: " << (config.agent.api_key ? "set" : "not set") << ")";
    LOG_INFO(agent_msg.str());

    LOG_INFO("[Config] Workspace: " << config.workspace.root
                                    << (config.workspace.use_workspace_as_temp ? " (used as temp dir)" : ""));
    LOG_INFO("[Config] Log level: " << config.logging.level);
}

}  // namespace runtime
}  // namespace agentgate
