#pragma once

#include <optional>
#include <string>

namespace agentgate {
namespace agent {

// Process-wide agent configuration. Sourced once at startup (config file + environment)
// and passed by value into the supervisor, so executions never read the environment.
struct AgentSettings {
    std::string name = "cursor-agent";                          // Used in log lines and error messages
    std::string command = "cursor-agent";                       // Bare command, resolved on PATH
    std::string install_path = "/root/.local/bin/cursor-agent";  // Preferred when present (empty = skip)
    std::string model = "grok-code-fast-1";                     // Pinned --model value
    std::string http_version = "2";                             // --http-version value (empty = omit)
    bool insecure = true;                                       // Pass --insecure
    std::optional<std::string> api_key;                         // Forwarded as --api-key when set
    int terminate_grace_ms = 2000;                              // SIGTERM -> SIGKILL escalation window
};

}  // namespace agent
}  // namespace agentgate
