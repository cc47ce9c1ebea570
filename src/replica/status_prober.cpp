#include "replica/status_prober.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"

#include <format>

namespace litereplica {

StatusProber::StatusProber(ConnectionRegistry& registry)
    : registry_(registry) {}

ReplicaStatus StatusProber::probe(const std::string& alias) {
    ReplicaStatus status;
    status.alias = alias;
    status.probed_at = utils::now();

    std::shared_ptr<IDbConnection> conn;
    try {
        conn = registry_.connection(alias);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Replica '{}': status probe could not connect: {}",
            alias, e.what()));
        return status;
    }

    status.txid = query_txid(*conn, alias);
    status.lag_seconds = query_lag(*conn, alias);
    return status;
}

namespace {

// Single-value status query; nullopt on error, no row, or NULL/empty value
std::optional<std::string> query_single_value(IDbConnection& conn, const char* sql,
                                              const std::string& alias) {
    DbResultSet rs;
    try {
        rs = conn.execute(sql);
    } catch (const std::exception& e) {
        utils::log::debug(std::format("Replica '{}': {} threw: {}", alias, sql, e.what()));
        return std::nullopt;
    }
    if (!rs.success) {
        utils::log::debug(std::format("Replica '{}': {} failed: {}",
            alias, sql, rs.error_message));
        return std::nullopt;
    }
    if (rs.rows.empty() || rs.rows.front().empty() || rs.rows.front().front().empty()) {
        return std::nullopt;
    }
    return rs.rows.front().front();
}

} // anonymous namespace

std::optional<std::string> StatusProber::query_txid(IDbConnection& conn,
                                                    const std::string& alias) {
    return query_single_value(conn, kTxidQuery, alias);
}

std::optional<double> StatusProber::query_lag(IDbConnection& conn,
                                              const std::string& alias) {
    const auto value = query_single_value(conn, kLagQuery, alias);
    if (!value) return std::nullopt;

    const auto lag = utils::try_parse_double(*value);
    if (!lag || *lag < 0.0) {
        utils::log::debug(std::format("Replica '{}': unusable lag value '{}'", alias, *value));
        return std::nullopt;
    }
    return lag;
}

ReplicaStatusReport StatusProber::get_status(const std::string& alias) {
    const auto config = registry_.database_config(alias);
    if (!config) {
        throw ConfigurationError(std::format("Database '{}' not found", alias));
    }
    if (!config->is_replica()) {
        throw ConfigurationError(std::format(
            "Database '{}' is not a replica. Status checking only works with replicas.", alias));
    }

    const auto status = probe(alias);

    ReplicaStatusReport report;
    report.alias = alias;
    report.is_replica = true;
    report.source_url = config->replica_url.empty() ? "unknown" : config->replica_url;
    report.txid = status.txid;
    report.lag_seconds = status.lag_seconds;
    return report;
}

} // namespace litereplica
