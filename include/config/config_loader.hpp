#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace litereplica {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads litereplica.toml into an AppConfig
 *
 * Sections: [logging], [extension], [primary], [replication], [replicas].
 * String values support ${ENV_VAR} substitution. Each section is read by
 * its own extractor; nothing is looked up dynamically after loading.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to litereplica.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, returns one message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static ExtensionConfig extract_extension(const toml::table& root);
    static DatabaseConfig extract_primary(const toml::table& root);
    static double extract_max_lag(const toml::table& root);
    static std::vector<ReplicaEndpoint> extract_replicas(const toml::table& root, double default_max_lag);

    static AppConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(AppConfig config);
};

/**
 * @brief Build the connection descriptor for a replica endpoint
 *
 * The database is opened read-only through the extension VFS:
 * file:<alias>.db?vfs=<vfs_name>&mode=ro
 */
[[nodiscard]] DatabaseConfig make_replica_database(const ReplicaEndpoint& endpoint,
                                                   const std::string& vfs_name);

/// Descriptors for every configured replica, in alias order.
[[nodiscard]] std::vector<DatabaseConfig> make_replica_databases(const AppConfig& config);

} // namespace litereplica
