#pragma once

#include "config/config_types.hpp"
#include "replica/status_prober.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace litereplica {

/**
 * @brief Replica set and staleness threshold a router evaluates against
 */
struct RouterState {
    std::vector<std::string> known_replica_aliases;
    double max_lag_seconds = kDefaultMaxLagSeconds;
};

/**
 * @brief Classifies replicas as healthy by measured lag
 *
 * A replica is healthy iff its lag is known and lag <= threshold. The
 * threshold is the replica's own max_lag_seconds when one was configured,
 * otherwise the router's. Unknown lag is always unhealthy.
 *
 * Nothing is cached: every call probes every replica again.
 */
class HealthEvaluator {
public:
    explicit HealthEvaluator(std::shared_ptr<IStatusProber> prober,
                             std::unordered_map<std::string, double> replica_max_lag = {});

    /// Healthy aliases, in the order of state.known_replica_aliases.
    [[nodiscard]] std::vector<std::string> healthy_replicas(const RouterState& state) const;

    [[nodiscard]] double threshold_for(const std::string& alias, double router_max_lag) const;

    [[nodiscard]] static bool is_healthy(const ReplicaStatus& status, double max_lag_seconds) {
        return status.lag_seconds.has_value() && *status.lag_seconds <= max_lag_seconds;
    }

private:
    std::shared_ptr<IStatusProber> prober_;
    std::unordered_map<std::string, double> replica_max_lag_;
};

} // namespace litereplica
