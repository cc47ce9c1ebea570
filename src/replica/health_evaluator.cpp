#include "replica/health_evaluator.hpp"
#include "core/utils.hpp"

#include <format>

namespace litereplica {

HealthEvaluator::HealthEvaluator(std::shared_ptr<IStatusProber> prober,
                                 std::unordered_map<std::string, double> replica_max_lag)
    : prober_(std::move(prober)),
      replica_max_lag_(std::move(replica_max_lag)) {}

double HealthEvaluator::threshold_for(const std::string& alias, double router_max_lag) const {
    const auto it = replica_max_lag_.find(alias);
    return (it != replica_max_lag_.end()) ? it->second : router_max_lag;
}

std::vector<std::string> HealthEvaluator::healthy_replicas(const RouterState& state) const {
    std::vector<std::string> healthy;
    healthy.reserve(state.known_replica_aliases.size());

    for (const auto& alias : state.known_replica_aliases) {
        try {
            const auto status = prober_->probe(alias);
            const double threshold = threshold_for(alias, state.max_lag_seconds);
            if (is_healthy(status, threshold)) {
                healthy.push_back(alias);
            } else if (status.lag_seconds) {
                utils::log::debug(std::format("Replica '{}' is stale: lag {:.3f}s > {}s",
                    alias, *status.lag_seconds, threshold));
            } else {
                utils::log::debug(std::format("Replica '{}' lag unknown, excluded", alias));
            }
        } catch (const std::exception& e) {
            // One bad replica must not stop evaluation of the others
            utils::log::warn(std::format("Replica '{}' health probe failed: {}", alias, e.what()));
        }
    }
    return healthy;
}

} // namespace litereplica
