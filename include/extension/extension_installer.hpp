#pragma once

#include <string>

namespace litereplica {

/**
 * @brief External collaborator that places the extension binary on disk
 *
 * The loader only requires that, after install() returns, the target path
 * exists and is loadable. How the binary is obtained is up to the
 * implementation.
 */
class IExtensionInstaller {
public:
    virtual ~IExtensionInstaller() = default;

    /**
     * @brief Install the extension at target_path
     * @throws ExtensionLoadError on failure
     */
    virtual void install(const std::string& target_path) = 0;
};

/**
 * @brief Runs a configured shell command to install the extension
 *
 * Every "{path}" in the command is replaced with the target path, and the
 * target directory is created first. A non-zero exit status is a failure.
 */
class CommandExtensionInstaller : public IExtensionInstaller {
public:
    explicit CommandExtensionInstaller(std::string command);

    void install(const std::string& target_path) override;

    [[nodiscard]] std::string render_command(const std::string& target_path) const;

private:
    std::string command_;
};

} // namespace litereplica
