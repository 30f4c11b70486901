#include "temp_workspace.hpp"

#include <stdlib.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include "logging/logger.hpp"

namespace agentgate {
namespace workspace {

TempWorkspace::TempWorkspace(std::string path, bool owned) : path_(std::move(path)), owned_(owned) {}

TempWorkspace::~TempWorkspace() {
    if (!owned_) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_ERROR("[Workspace] Failed to clean up " << path_ << ": " << ec.message());
    } else {
        LOG_DEBUG("[Workspace] Cleaned up " << path_);
    }
}

std::unique_ptr<TempWorkspace> TempWorkspace::create(const WorkspaceSettings &settings, std::string &error) {
    if (settings.use_workspace_as_temp) {
        std::error_code ec;
        if (!std::filesystem::is_directory(settings.root, ec)) {
            error = "Workspace root does not exist: " + settings.root;
            return nullptr;
        }
        return std::unique_ptr<TempWorkspace>(new TempWorkspace(settings.root, false));
    }

    std::filesystem::path base;
    if (settings.temp_base.empty()) {
        std::error_code ec;
        base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            base = "/tmp";
        }
    } else {
        base = settings.temp_base;
    }

    std::string pattern = (base / (settings.temp_prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        error = "Failed to create temporary directory under " + base.string() + ": " + std::strerror(errno);
        LOG_ERROR("[Workspace] " << error);
        return nullptr;
    }

    std::string path(buffer.data());
    LOG_DEBUG("[Workspace] Created " << path);
    return std::unique_ptr<TempWorkspace>(new TempWorkspace(path, true));
}

}  // namespace workspace
}  // namespace agentgate
