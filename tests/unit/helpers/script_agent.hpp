#pragma once

#include <stdlib.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "agent/agent_settings.hpp"

namespace agentgate::tests {

/**
 * Scratch directory holding shell scripts that stand in for the agent.
 *
 * The scripts receive the real agent argv (ignored) and the prompt on stdin.
 * Everything is removed when the object goes out of scope.
 */
class ScriptAgentDir {
public:
    ScriptAgentDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "agentgate-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) != nullptr) {
            path_ = buffer.data();
        }
    }

    ~ScriptAgentDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScriptAgentDir(const ScriptAgentDir &) = delete;
    ScriptAgentDir &operator=(const ScriptAgentDir &) = delete;

    const std::string &path() const { return path_; }

    std::string file(const std::string &name) const { return (std::filesystem::path(path_) / name).string(); }

    // Write an executable #!/bin/bash script and return its path
    std::string write_script(const std::string &name, const std::string &body) const {
        std::string script_path = file(name);
        std::ofstream out(script_path);
        out << "#!/bin/bash\n" << body;
        out.close();

        std::filesystem::permissions(script_path,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
        return script_path;
    }

    // Settings that make the supervisor spawn `script` directly
    agent::AgentSettings settings_for(const std::string &script) const {
        agent::AgentSettings settings;
        settings.name = "test-agent";
        settings.command = script;
        settings.install_path = "";
        settings.terminate_grace_ms = 500;
        return settings;
    }

    // Contents of a file written by a script ("" if missing)
    std::string read_file(const std::string &name) const {
        std::ifstream in(file(name));
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Number of lines in a marker file written by a script
    int count_lines(const std::string &name) const {
        std::ifstream in(file(name));
        std::string line;
        int count = 0;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                count++;
            }
        }
        return count;
    }

    // Poll until the marker file exists (scripts write it once their trap is installed)
    bool wait_for_file(const std::string &name, int timeout_ms) const {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (std::filesystem::exists(file(name))) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

private:
    std::string path_;
};

}  // namespace agentgate::tests
