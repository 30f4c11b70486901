#include "agent_command.hpp"

#include <unistd.h>

#include <filesystem>
#include <system_error>

#include "logging/logger.hpp"

namespace agentgate {
namespace agent {

std::string resolve_executable(const AgentSettings &settings) {
    if (!settings.install_path.empty()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(settings.install_path, ec) &&
            access(settings.install_path.c_str(), X_OK) == 0) {
            LOG_DEBUG("[Agent] Found " << settings.name << " at " << settings.install_path);
            return settings.install_path;
        }
    }
    return settings.command;
}

std::vector<std::string> build_agent_args(const AgentSettings &settings, const AgentExecutionRequest &request) {
    std::vector<std::string> args = {
        "--print",
        "--output-format", "stream-json",
        "--disable-indexing",
    };

    if (!settings.http_version.empty()) {
        args.push_back("--http-version");
        args.push_back(settings.http_version);
    }
    if (settings.insecure) {
        args.push_back("--insecure");
    }

    args.push_back("--force");
    args.push_back("--model");
    args.push_back(settings.model);
    args.push_back("--workspace");
    args.push_back(request.working_directory);

    if (request.use_mcps) {
        args.push_back("--approve-mcps");
    }

    if (settings.api_key && !settings.api_key->empty()) {
        args.push_back("--api-key");
        args.push_back(*settings.api_key);
    }

    return args;
}

std::string describe_args(const std::vector<std::string> &args) {
    std::string out;
    bool mask_next = false;
    for (const auto &arg : args) {
        if (!out.empty()) {
            out += ' ';
        }
        out += mask_next ? "****" : arg;
        mask_next = (arg == "--api-key");
    }
    return out;
}

}  // namespace agent
}  // namespace agentgate
