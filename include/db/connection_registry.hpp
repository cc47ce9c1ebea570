#pragma once

#include "config/config_types.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace litereplica {

class ExtensionLoader;

/**
 * @brief Alias → descriptor and alias → open connection
 *
 * Descriptors are registered from configuration at startup; time-travel
 * sessions add and remove ephemeral ones at runtime. Connections are opened
 * lazily on first use and shared by all callers of the same alias.
 *
 * Before any replica connection is opened the extension loader runs, so the
 * VFS is registered in the process by the time SQLite resolves it.
 *
 * Thread-safe via shared_mutex (read-heavy: lookups >> registrations).
 * Opening happens outside the lock.
 */
class ConnectionRegistry {
public:
    ConnectionRegistry(std::shared_ptr<IConnectionFactory> factory,
                       std::shared_ptr<ExtensionLoader> extension_loader = nullptr);

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// Register a descriptor; returns false if the alias is already taken.
    [[nodiscard]] bool register_database(DatabaseConfig config);

    /// Remove a descriptor and close its connection; returns false if absent.
    bool unregister_database(const std::string& alias);

    [[nodiscard]] bool has_database(const std::string& alias) const;
    [[nodiscard]] std::optional<DatabaseConfig> database_config(const std::string& alias) const;

    /// All registered aliases, sorted.
    [[nodiscard]] std::vector<std::string> database_aliases() const;

    /// Replica aliases from configuration, sorted. Ephemeral registrations are excluded.
    [[nodiscard]] std::vector<std::string> replica_aliases() const;

    /**
     * @brief Connection for alias, opening it on first use
     * @throws ConfigurationError alias not registered, or open failed
     * @throws ExtensionLoadError replica requested and the extension cannot load
     */
    [[nodiscard]] std::shared_ptr<IDbConnection> connection(const std::string& alias);

    [[nodiscard]] bool has_connection(const std::string& alias) const;

    /// Close and forget the open connection for alias (descriptor stays).
    bool close_connection(const std::string& alias);

    /// Close every open connection.
    void close_all();

private:
    std::shared_ptr<IConnectionFactory> factory_;
    std::shared_ptr<ExtensionLoader> extension_loader_;

    std::map<std::string, DatabaseConfig> databases_;
    std::map<std::string, std::shared_ptr<IDbConnection>> connections_;
    mutable std::shared_mutex mutex_;
};

} // namespace litereplica
