#pragma once

#include <memory>
#include <string>

namespace agentgate {
namespace workspace {

struct WorkspaceSettings {
    std::string root = "/workspace";   // Default root for /api/prompt; per-request dir when use_workspace_as_temp
    bool use_workspace_as_temp = false;
    std::string temp_prefix = "agentgate-";
    std::string temp_base;  // Parent of per-request dirs (empty = system temp dir)
};

/**
 * @brief Working directory of one request
 *
 * Either a fresh mkdtemp() directory that is removed recursively on
 * destruction, or the shared workspace root (use_workspace_as_temp), which is
 * never removed. Removal failures are logged, never thrown.
 */
class TempWorkspace {
public:
    ~TempWorkspace();

    TempWorkspace(const TempWorkspace &) = delete;
    TempWorkspace &operator=(const TempWorkspace &) = delete;

    // Returns nullptr on failure (sets error)
    static std::unique_ptr<TempWorkspace> create(const WorkspaceSettings &settings, std::string &error);

    const std::string &path() const { return path_; }

    // True when the directory is removed on destruction
    bool owned() const { return owned_; }

private:
    TempWorkspace(std::string path, bool owned);

    std::string path_;
    bool owned_;
};

}  // namespace workspace
}  // namespace agentgate
