#pragma once

#include "replica/replica_status.hpp"

#include <string>

namespace litereplica {

class ConnectionRegistry;
class IDbConnection;

/**
 * @brief Source of replica status, the seam the health evaluator probes through
 */
class IStatusProber {
public:
    virtual ~IStatusProber() = default;

    /// Probe alias; failures degrade individual fields to unknown.
    [[nodiscard]] virtual ReplicaStatus probe(const std::string& alias) = 0;
};

/**
 * @brief Queries replica status pragmas over the registry's connections
 *
 * The transaction id and the lag are fetched by two independent queries;
 * a failure of one never hides the other. No retries at this layer.
 */
class StatusProber : public IStatusProber {
public:
    static constexpr const char* kTxidQuery = "PRAGMA litestream_txid";
    static constexpr const char* kLagQuery = "PRAGMA litestream_lag";

    explicit StatusProber(ConnectionRegistry& registry);

    [[nodiscard]] ReplicaStatus probe(const std::string& alias) override;

    /**
     * @brief Status of a configured replica
     * @throws ConfigurationError alias not registered or not a replica
     */
    [[nodiscard]] ReplicaStatusReport get_status(const std::string& alias);

private:
    [[nodiscard]] static std::optional<std::string> query_txid(IDbConnection& conn,
                                                                const std::string& alias);
    [[nodiscard]] static std::optional<double> query_lag(IDbConnection& conn,
                                                         const std::string& alias);

    ConnectionRegistry& registry_;
};

} // namespace litereplica
