#include "extension/extension_installer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <sys/wait.h>

namespace litereplica {

CommandExtensionInstaller::CommandExtensionInstaller(std::string command)
    : command_(std::move(command)) {}

std::string CommandExtensionInstaller::render_command(const std::string& target_path) const {
    static constexpr std::string_view kPlaceholder = "{path}";
    std::string rendered = command_;
    size_t pos = 0;
    while ((pos = rendered.find(kPlaceholder, pos)) != std::string::npos) {
        rendered.replace(pos, kPlaceholder.size(), target_path);
        pos += target_path.size();
    }
    return rendered;
}

void CommandExtensionInstaller::install(const std::string& target_path) {
    namespace fs = std::filesystem;

    const fs::path parent = fs::path(target_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw ExtensionLoadError(std::format(
                "Cannot create extension directory {}: {}", parent.string(), ec.message()));
        }
    }

    const std::string cmd = render_command(target_path);
    utils::log::info(std::format("Installing extension: {}", cmd));

    const int status = std::system(cmd.c_str());
    if (status == -1) {
        throw ExtensionLoadError(std::format("Failed to run extension installer: {}", cmd));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw ExtensionLoadError(std::format(
            "Extension installer exited with status {}: {}",
            WIFEXITED(status) ? WEXITSTATUS(status) : status, cmd));
    }
}

} // namespace litereplica
