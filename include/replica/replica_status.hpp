#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace litereplica {

/**
 * @brief One probe of a replica, consumed immediately and never cached
 *
 * A field is std::nullopt when its status query failed or returned no row.
 */
struct ReplicaStatus {
    std::string alias;
    std::optional<std::string> txid;
    std::optional<double> lag_seconds;
    std::chrono::system_clock::time_point probed_at;
};

/**
 * @brief Status report exposed to callers of get_status()
 */
struct ReplicaStatusReport {
    std::string alias;
    bool is_replica = true;
    std::string source_url;
    std::optional<std::string> txid;
    std::optional<double> lag_seconds;
};

// Unknown fields serialize as null
inline void to_json(nlohmann::json& j, const ReplicaStatusReport& report) {
    j = nlohmann::json{
        {"alias", report.alias},
        {"is_replica", report.is_replica},
        {"source_url", report.source_url},
        {"txid", report.txid ? nlohmann::json(*report.txid) : nlohmann::json(nullptr)},
        {"lag_seconds", report.lag_seconds ? nlohmann::json(*report.lag_seconds)
                                           : nlohmann::json(nullptr)},
    };
}

} // namespace litereplica
