#pragma once

#include "replica/health_evaluator.hpp"
#include "router/idatabase_router.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litereplica {

/**
 * @brief Sends reads to a random healthy replica and everything else to the primary
 *
 * Reads: the health evaluator re-probes every known replica and one healthy
 * alias is picked uniformly at random; with none healthy (or on any error
 * while evaluating) the read goes to the primary.
 * Writes and schema migrations: primary only.
 *
 * The replica alias list is read once, on first use, and kept for the life
 * of the router. Replicas registered afterwards are not seen.
 *
 * Thread-safe: atomic counters, double-checked lazy alias discovery,
 * thread-local RNG.
 */
class ReplicaRouter : public IDatabaseRouter {
public:
    using AliasSource = std::function<std::vector<std::string>()>;

    struct Config {
        std::string primary_alias = "default";
        double max_lag_seconds = kDefaultMaxLagSeconds;
    };

    ReplicaRouter(Config config, AliasSource replica_source,
                  std::shared_ptr<HealthEvaluator> evaluator);

    /// Healthy replica chosen at random, or the primary alias.
    [[nodiscard]] std::string route_for_read();

    /// Always the primary alias.
    [[nodiscard]] std::string route_for_write();

    [[nodiscard]] std::optional<std::string> db_for_read() override { return route_for_read(); }
    [[nodiscard]] std::optional<std::string> db_for_write() override { return route_for_write(); }

    /// Replicas are logically consistent copies, so any relation is allowed.
    [[nodiscard]] std::optional<bool> allow_relation(
        const std::string& db1, const std::string& db2) override;

    /// true for the primary, false for a known replica, nullopt otherwise.
    [[nodiscard]] std::optional<bool> allow_migrate(const std::string& db) override;

    /// Replica aliases discovered on first use.
    [[nodiscard]] const std::vector<std::string>& known_replicas();

    [[nodiscard]] const std::string& primary_alias() const { return config_.primary_alias; }
    [[nodiscard]] double max_lag_seconds() const { return config_.max_lag_seconds; }

    struct Stats {
        uint64_t replica_reads;
        uint64_t primary_reads;
        uint64_t writes;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] std::vector<std::string> healthy_replicas();

    const Config config_;
    AliasSource replica_source_;
    std::shared_ptr<HealthEvaluator> evaluator_;

    std::vector<std::string> replica_aliases_;
    std::atomic<bool> aliases_ready_{false};
    std::mutex aliases_mutex_;

    std::atomic<uint64_t> replica_reads_{0};
    std::atomic<uint64_t> primary_reads_{0};
    std::atomic<uint64_t> writes_{0};
};

} // namespace litereplica
