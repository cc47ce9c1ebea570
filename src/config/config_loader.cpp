#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace litereplica {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ExtensionConfig ConfigLoader::extract_extension(const toml::table& root) {
    ExtensionConfig cfg;
    const auto* ext = root["extension"].as_table();
    if (!ext) return cfg;
    const auto& e = *ext;

    cfg.path = e["path"].value_or(""s);
    cfg.data_dir = e["data_dir"].value_or(cfg.data_dir);
    cfg.vfs_name = e["vfs_name"].value_or(cfg.vfs_name);
    cfg.entry_point = e["entry_point"].value_or(""s);
    cfg.install_command = e["install_command"].value_or(""s);
    return cfg;
}

DatabaseConfig ConfigLoader::extract_primary(const toml::table& root) {
    DatabaseConfig cfg;
    cfg.alias = "default";
    const auto* primary = root["primary"].as_table();
    if (!primary) return cfg;
    const auto& p = *primary;

    cfg.alias = p["alias"].value_or(cfg.alias);
    cfg.name = p["path"].value_or(""s);
    cfg.uri = p["uri"].value_or(false);
    cfg.busy_timeout = std::chrono::milliseconds(p["busy_timeout_ms"].value_or(5000));
    return cfg;
}

double ConfigLoader::extract_max_lag(const toml::table& root) {
    if (const auto* repl = root["replication"].as_table()) {
        if (auto v = (*repl)["max_lag_seconds"].value<double>()) {
            return *v;
        }
    }
    // Accepted inside [replicas] as well, next to the replica URLs
    if (const auto* replicas = root["replicas"].as_table()) {
        if (auto v = (*replicas)["max_lag_seconds"].value<double>()) {
            return *v;
        }
    }
    return kDefaultMaxLagSeconds;
}

std::vector<ReplicaEndpoint> ConfigLoader::extract_replicas(const toml::table& root,
                                                            double default_max_lag) {
    std::vector<ReplicaEndpoint> result;
    const auto* replicas = root["replicas"].as_table();
    if (!replicas) return result;
    result.reserve(replicas->size());

    for (const auto& [key, val] : *replicas) {
        ReplicaEndpoint endpoint;
        endpoint.alias = std::string(key.str());
        endpoint.max_lag_seconds = default_max_lag;

        if (const auto* url = val.as_string()) {
            endpoint.source_url = url->get();
        } else if (const auto* t = val.as_table()) {
            endpoint.source_url = (*t)["url"].value_or(""s);
            endpoint.max_lag_seconds = (*t)["max_lag_seconds"].value_or(default_max_lag);
        } else {
            // Non-replica keys such as max_lag_seconds
            continue;
        }
        result.emplace_back(std::move(endpoint));
    }
    return result;
}

// ---- Shared extraction + validation ----------------------------------------

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.logging = extract_logging(tbl);
    config.extension = extract_extension(tbl);
    config.primary = extract_primary(tbl);
    config.max_lag_seconds = extract_max_lag(tbl);
    config.replicas = extract_replicas(tbl, config.max_lag_seconds);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

namespace {

// Replica aliases become part of a SQLite URI path: file:<alias>.db?...
bool is_uri_safe_alias(const std::string& alias) {
    for (const char c : alias) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
            || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

} // anonymous namespace

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;
    const std::string reserved = kTimeTravelAliasPrefix;

    if (config.primary.alias.empty()) {
        errors.emplace_back("primary.alias must not be empty");
    }
    if (config.primary.name.empty()) {
        errors.emplace_back("primary.path is required");
    }
    if (config.max_lag_seconds <= 0.0) {
        errors.emplace_back(std::format(
            "replication.max_lag_seconds must be positive (got {})", config.max_lag_seconds));
    }
    if (config.primary.alias.starts_with(reserved)) {
        errors.emplace_back(std::format(
            "primary.alias '{}' uses the reserved prefix '{}'", config.primary.alias, reserved));
    }

    std::unordered_set<std::string> seen;
    for (const auto& r : config.replicas) {
        if (r.alias == config.primary.alias) {
            errors.emplace_back(std::format(
                "replicas.{} collides with the primary alias", r.alias));
        }
        if (!seen.insert(r.alias).second) {
            errors.emplace_back(std::format("replicas.{} is defined twice", r.alias));
        }
        if (r.alias.empty() || !is_uri_safe_alias(r.alias)) {
            errors.emplace_back(std::format(
                "replicas.{} must contain only letters, digits, '_' or '-'", r.alias));
        }
        if (r.alias.starts_with(reserved)) {
            errors.emplace_back(std::format(
                "replicas.{} uses the reserved prefix '{}'", r.alias, reserved));
        }
        if (r.source_url.empty()) {
            errors.emplace_back(std::format("replicas.{}: url must not be empty", r.alias));
        }
        if (r.max_lag_seconds <= 0.0) {
            errors.emplace_back(std::format(
                "replicas.{}: max_lag_seconds must be positive (got {})",
                r.alias, r.max_lag_seconds));
        }
    }

    if (!config.replicas.empty() && config.extension.vfs_name.empty()) {
        errors.emplace_back("extension.vfs_name must not be empty when replicas are configured");
    }

    return errors;
}

// ============================================================================
// Replica descriptors
// ============================================================================

DatabaseConfig make_replica_database(const ReplicaEndpoint& endpoint,
                                     const std::string& vfs_name) {
    DatabaseConfig db;
    db.alias = endpoint.alias;
    db.engine = DatabaseEngine::SQLITE_REPLICA;
    db.name = std::format("file:{}.db?vfs={}&mode=ro", endpoint.alias, vfs_name);
    db.uri = true;
    db.read_only = true;
    db.replica_url = endpoint.source_url;
    return db;
}

std::vector<DatabaseConfig> make_replica_databases(const AppConfig& config) {
    std::vector<DatabaseConfig> result;
    result.reserve(config.replicas.size());
    for (const auto& endpoint : config.replicas) {
        result.push_back(make_replica_database(endpoint, config.extension.vfs_name));
    }
    return result;
}

} // namespace litereplica
