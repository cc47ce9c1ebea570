#pragma once

#include "config/config_types.hpp"
#include "extension/extension_installer.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace litereplica {

/**
 * @brief Platform tag used in the extension file name
 *
 * "linux-amd64", "linux-arm64", "darwin-amd64" or "darwin-arm64".
 * @throws ConfigurationError on any other platform
 */
[[nodiscard]] std::string platform_tag();

/**
 * @brief Registers the read-access extension in the process exactly once
 *
 * One instance is created at startup and lives for the rest of the process;
 * there is no unload or reset. ensure_loaded() is safe to call from any
 * number of threads: the already-loaded case is a single atomic load, the
 * first load runs under a mutex with a re-check so racing callers never
 * load twice.
 *
 * A failed attempt (missing binary, install failure, load error) leaves the
 * loader unloaded so the next call starts over.
 */
class ExtensionLoader {
public:
    /// Loads the shared object at path; used only for its registration side effect.
    using LoadFn = std::function<void(const std::string& path, const std::string& entry_point)>;

    explicit ExtensionLoader(ExtensionConfig config,
                             std::shared_ptr<IExtensionInstaller> installer = nullptr,
                             LoadFn load_fn = nullptr);

    ExtensionLoader(const ExtensionLoader&) = delete;
    ExtensionLoader& operator=(const ExtensionLoader&) = delete;

    /**
     * @brief Make sure the extension is registered before a replica is opened
     * @throws ConfigurationError binary missing and no installer, unsupported platform
     * @throws ExtensionLoadError install or load failed
     */
    void ensure_loaded();

    [[nodiscard]] bool is_loaded() const {
        return loaded_.load(std::memory_order_acquire);
    }

    /// Number of times the load step actually ran (successful or not).
    [[nodiscard]] uint64_t load_attempts() const {
        return load_attempts_.load(std::memory_order_relaxed);
    }

    /// Configured path, or <data_dir>/litestream-vfs-<platform>.<ext>
    [[nodiscard]] std::string resolve_path() const;

private:
    void load_locked();

    const ExtensionConfig config_;
    std::shared_ptr<IExtensionInstaller> installer_;
    LoadFn load_fn_;

    std::atomic<bool> loaded_{false};
    std::mutex load_mutex_;
    std::atomic<uint64_t> load_attempts_{0};
};

} // namespace litereplica
