#pragma once

#include "config/config_types.hpp"
#include "replica/replica_status.hpp"

#include <memory>
#include <string>

namespace litereplica {

// Forward declarations
class IConnectionFactory;
class ConnectionRegistry;
class ExtensionLoader;
class IExtensionInstaller;
class StatusProber;
class HealthEvaluator;
class ReplicaRouter;
class RouterChain;

/**
 * @brief Optional overrides for the components ReplicaContext builds
 *
 * nullptr = build the default from configuration (SQLite factory,
 * command installer when extension.install_command is set).
 */
struct ReplicaComponents {
    std::shared_ptr<IConnectionFactory> factory;
    std::shared_ptr<IExtensionInstaller> installer;
    std::shared_ptr<ExtensionLoader> extension_loader;
};

/**
 * @brief Process-lifetime wiring of the replica subsystem
 *
 * Registers the primary and one descriptor per configured replica, and
 * builds the loader → registry → prober → evaluator → router stack.
 * Create one per process at startup.
 */
class ReplicaContext {
public:
    explicit ReplicaContext(AppConfig config, ReplicaComponents components = {});
    ~ReplicaContext();

    ReplicaContext(const ReplicaContext&) = delete;
    ReplicaContext& operator=(const ReplicaContext&) = delete;

    /**
     * @brief Load the extension eagerly when replicas are configured
     *
     * A failure is logged and swallowed; the next replica connection retries
     * and reports the error where the replica is actually needed.
     * @return true if the extension is loaded (or not needed)
     */
    bool startup();

    /// Close every open connection.
    void shutdown();

    /// @throws ConfigurationError alias unknown or not a replica
    [[nodiscard]] ReplicaStatusReport get_status(const std::string& alias);

    [[nodiscard]] const AppConfig& config() const { return config_; }
    [[nodiscard]] ConnectionRegistry& registry() { return *registry_; }
    [[nodiscard]] ExtensionLoader& extension_loader() { return *extension_loader_; }
    [[nodiscard]] StatusProber& prober() { return *prober_; }
    [[nodiscard]] ReplicaRouter& router() { return *router_; }
    [[nodiscard]] RouterChain& router_chain() { return *router_chain_; }

private:
    AppConfig config_;
    std::shared_ptr<ExtensionLoader> extension_loader_;
    std::shared_ptr<ConnectionRegistry> registry_;
    std::shared_ptr<StatusProber> prober_;
    std::shared_ptr<HealthEvaluator> evaluator_;
    std::shared_ptr<ReplicaRouter> router_;
    std::unique_ptr<RouterChain> router_chain_;
};

} // namespace litereplica
