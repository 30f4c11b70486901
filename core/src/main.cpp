// agentgate
// OpenAI-compatible gateway in front of a command-line coding agent

#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path;  // Empty: built-in defaults

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: agentgate [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to YAML config file (default: built-in defaults)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  PORT, WORKSPACE_ROOT, USE_WORKSPACE_AS_TEMP, CURSOR_API_KEY, LOG_LEVEL\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    LOG_INFO("agentgate starting...");

    agentgate::runtime::GatewayConfig config;
    std::string error;

    if (!config_path.empty()) {
        LOG_INFO("Loading config: " << config_path);
        if (!agentgate::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    if (!agentgate::runtime::apply_env_overrides(config, error)) {
        LOG_ERROR("Invalid environment: " << error);
        return 1;
    }

    if (!agentgate::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }

    agentgate::logging::Logger::set_level(agentgate::logging::string_to_level(config.logging.level));
    agentgate::runtime::log_config(config);

    // Install before the server starts so an early Ctrl+C is not lost
    if (!agentgate::runtime::SignalHandler::install()) {
        LOG_ERROR("Failed to install signal handlers");
        return 1;
    }

    agentgate::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Gateway Ready");
    LOG_INFO("  Model: " << config.agent.model);
    LOG_INFO("  Listening: " << config.http.bind << ":" << config.http.port);

    // Run main loop (blocking)
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
