#include "db/connection_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "extension/extension_loader.hpp"

#include <format>
#include <mutex>

namespace litereplica {

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<IConnectionFactory> factory,
                                       std::shared_ptr<ExtensionLoader> extension_loader)
    : factory_(std::move(factory)),
      extension_loader_(std::move(extension_loader)) {}

bool ConnectionRegistry::register_database(DatabaseConfig config) {
    std::unique_lock lock(mutex_);
    const std::string alias = config.alias;
    return databases_.try_emplace(alias, std::move(config)).second;
}

bool ConnectionRegistry::unregister_database(const std::string& alias) {
    std::shared_ptr<IDbConnection> conn;
    {
        std::unique_lock lock(mutex_);
        if (databases_.erase(alias) == 0) return false;
        const auto it = connections_.find(alias);
        if (it != connections_.end()) {
            conn = std::move(it->second);
            connections_.erase(it);
        }
    }
    if (conn) conn->close();
    return true;
}

bool ConnectionRegistry::has_database(const std::string& alias) const {
    std::shared_lock lock(mutex_);
    return databases_.contains(alias);
}

std::optional<DatabaseConfig> ConnectionRegistry::database_config(const std::string& alias) const {
    std::shared_lock lock(mutex_);
    const auto it = databases_.find(alias);
    if (it != databases_.end()) return it->second;
    return std::nullopt;
}

std::vector<std::string> ConnectionRegistry::database_aliases() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> aliases;
    aliases.reserve(databases_.size());
    for (const auto& [alias, _] : databases_) {
        aliases.push_back(alias);
    }
    return aliases;
}

std::vector<std::string> ConnectionRegistry::replica_aliases() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> aliases;
    for (const auto& [alias, cfg] : databases_) {
        if (cfg.is_replica() && !cfg.ephemeral) {
            aliases.push_back(alias);
        }
    }
    return aliases;
}

std::shared_ptr<IDbConnection> ConnectionRegistry::connection(const std::string& alias) {
    DatabaseConfig config;
    {
        std::shared_lock lock(mutex_);
        const auto conn_it = connections_.find(alias);
        if (conn_it != connections_.end()) return conn_it->second;

        const auto db_it = databases_.find(alias);
        if (db_it == databases_.end()) {
            throw ConfigurationError(std::format("Database '{}' is not registered", alias));
        }
        config = db_it->second;
    }

    if (config.is_replica() && extension_loader_) {
        extension_loader_->ensure_loaded();
    }

    auto created = factory_->create(config);
    if (created.is_error()) {
        throw ConfigurationError(created.error_message());
    }
    std::shared_ptr<IDbConnection> conn = std::move(created.value());

    std::shared_ptr<IDbConnection> existing;
    {
        std::unique_lock lock(mutex_);
        if (!databases_.contains(alias)) {
            // Unregistered while we were opening
            lock.unlock();
            conn->close();
            throw ConfigurationError(std::format("Database '{}' is not registered", alias));
        }
        const auto [it, inserted] = connections_.try_emplace(alias, conn);
        if (!inserted) existing = it->second;
    }

    if (existing) {
        // Lost the race to another opener; keep theirs
        conn->close();
        return existing;
    }
    return conn;
}

bool ConnectionRegistry::has_connection(const std::string& alias) const {
    std::shared_lock lock(mutex_);
    return connections_.contains(alias);
}

bool ConnectionRegistry::close_connection(const std::string& alias) {
    std::shared_ptr<IDbConnection> conn;
    {
        std::unique_lock lock(mutex_);
        const auto it = connections_.find(alias);
        if (it == connections_.end()) return false;
        conn = std::move(it->second);
        connections_.erase(it);
    }
    conn->close();
    return true;
}

void ConnectionRegistry::close_all() {
    std::map<std::string, std::shared_ptr<IDbConnection>> closing;
    {
        std::unique_lock lock(mutex_);
        closing.swap(connections_);
    }
    for (auto& [alias, conn] : closing) {
        conn->close();
        utils::log::debug(std::format("Closed connection '{}'", alias));
    }
}

} // namespace litereplica
