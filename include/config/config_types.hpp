#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace litereplica {

// ============================================================================
// Configuration Types
// ============================================================================

/// Prefix reserved for time-travel session aliases.
inline constexpr const char* kTimeTravelAliasPrefix = "_litereplica_timetravel_";

inline constexpr double kDefaultMaxLagSeconds = 60.0;

struct LoggingConfig {
    std::string level = "info";
};

struct ExtensionConfig {
    std::string path;                   // Resolved shared object path (empty = default location)
    std::string data_dir = ".";         // Directory for the default location
    std::string vfs_name = "litestream";
    std::string entry_point;            // Empty = SQLite derives it from the file name
    std::string install_command;        // External installer, "{path}" is substituted
};

enum class DatabaseEngine {
    SQLITE,          // Primary: plain read-write SQLite file
    SQLITE_REPLICA   // Read-only replica served through the extension VFS
};

/**
 * @brief Connection descriptor registered under an alias
 *
 * Replica descriptors are generated from ReplicaEndpoint entries by
 * make_replica_database().
 */
struct DatabaseConfig {
    std::string alias;
    DatabaseEngine engine = DatabaseEngine::SQLITE;
    std::string name;                   // File path or SQLite URI
    bool uri = false;
    bool read_only = false;
    std::string replica_url;            // Object storage URL the VFS reads from
    std::chrono::milliseconds busy_timeout{5000};
    bool ephemeral = false;             // Registered by a scoped session, not configuration

    [[nodiscard]] bool is_replica() const { return engine == DatabaseEngine::SQLITE_REPLICA; }
};

/// One configured replica. Immutable after startup.
struct ReplicaEndpoint {
    std::string alias;
    std::string source_url;
    double max_lag_seconds = kDefaultMaxLagSeconds;
};

struct AppConfig {
    LoggingConfig logging;
    ExtensionConfig extension;
    DatabaseConfig primary;
    double max_lag_seconds = kDefaultMaxLagSeconds;
    std::vector<ReplicaEndpoint> replicas;

    AppConfig() {
        primary.alias = "default";
    }
};

} // namespace litereplica
