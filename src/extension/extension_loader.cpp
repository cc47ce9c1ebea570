#include "extension/extension_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/sqlite/sqlite_connection.hpp"

#include <filesystem>
#include <format>

namespace litereplica {

std::string platform_tag() {
#if defined(__linux__)
    constexpr const char* os = "linux";
#elif defined(__APPLE__)
    constexpr const char* os = "darwin";
#else
    constexpr const char* os = nullptr;
#endif

#if defined(__x86_64__) || defined(_M_X64)
    constexpr const char* arch = "amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    constexpr const char* arch = "arm64";
#else
    constexpr const char* arch = nullptr;
#endif

    if (!os || !arch) {
        throw ConfigurationError(
            "The read-access extension is not available for this platform "
            "(supported: linux and darwin on amd64 or arm64)");
    }
    return std::format("{}-{}", os, arch);
}

ExtensionLoader::ExtensionLoader(ExtensionConfig config,
                                 std::shared_ptr<IExtensionInstaller> installer,
                                 LoadFn load_fn)
    : config_(std::move(config)),
      installer_(std::move(installer)),
      load_fn_(load_fn ? std::move(load_fn) : LoadFn(sqlite_load_extension)) {}

std::string ExtensionLoader::resolve_path() const {
    if (!config_.path.empty()) return config_.path;

#if defined(__APPLE__)
    constexpr const char* suffix = "dylib";
#else
    constexpr const char* suffix = "so";
#endif
    const auto file = std::format("litestream-vfs-{}.{}", platform_tag(), suffix);
    return (std::filesystem::path(config_.data_dir) / file).string();
}

void ExtensionLoader::ensure_loaded() {
    if (loaded_.load(std::memory_order_acquire)) return;

    std::lock_guard<std::mutex> lock(load_mutex_);
    if (loaded_.load(std::memory_order_relaxed)) return;

    load_locked();
    loaded_.store(true, std::memory_order_release);
}

void ExtensionLoader::load_locked() {
    const std::string path = resolve_path();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!installer_) {
            throw ConfigurationError(std::format(
                "Extension not installed for platform {}: {} does not exist "
                "and no extension.install_command is configured",
                platform_tag(), path));
        }
        installer_->install(path);
        if (!std::filesystem::exists(path, ec)) {
            throw ExtensionLoadError(std::format(
                "Extension installer finished but {} still does not exist", path));
        }
    }

    load_attempts_.fetch_add(1, std::memory_order_relaxed);
    utils::Timer timer;
    load_fn_(path, config_.entry_point);
    utils::log::info(std::format("Extension loaded: {} (vfs={}, {}ms)",
        path, config_.vfs_name, timer.elapsed_ms().count()));
}

} // namespace litereplica
