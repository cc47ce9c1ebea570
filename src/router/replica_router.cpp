#include "router/replica_router.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <random>

namespace litereplica {

ReplicaRouter::ReplicaRouter(Config config, AliasSource replica_source,
                             std::shared_ptr<HealthEvaluator> evaluator)
    : config_(std::move(config)),
      replica_source_(std::move(replica_source)),
      evaluator_(std::move(evaluator)) {}

const std::vector<std::string>& ReplicaRouter::known_replicas() {
    if (aliases_ready_.load(std::memory_order_acquire)) return replica_aliases_;

    std::lock_guard<std::mutex> lock(aliases_mutex_);
    if (!aliases_ready_.load(std::memory_order_relaxed)) {
        replica_aliases_ = replica_source_();
        aliases_ready_.store(true, std::memory_order_release);
        utils::log::debug(std::format("Router: {} replica(s) known", replica_aliases_.size()));
    }
    return replica_aliases_;
}

std::vector<std::string> ReplicaRouter::healthy_replicas() {
    try {
        RouterState state;
        state.known_replica_aliases = known_replicas();
        state.max_lag_seconds = config_.max_lag_seconds;
        return evaluator_->healthy_replicas(state);
    } catch (const std::exception& e) {
        // Never fail toward an unverified replica
        utils::log::warn(std::format("Router: replica health evaluation failed: {}", e.what()));
        return {};
    }
}

std::string ReplicaRouter::route_for_read() {
    const auto healthy = healthy_replicas();
    if (healthy.empty()) {
        primary_reads_.fetch_add(1, std::memory_order_relaxed);
        return config_.primary_alias;
    }

    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, healthy.size() - 1);

    replica_reads_.fetch_add(1, std::memory_order_relaxed);
    return healthy[dist(rng)];
}

std::string ReplicaRouter::route_for_write() {
    writes_.fetch_add(1, std::memory_order_relaxed);
    return config_.primary_alias;
}

std::optional<bool> ReplicaRouter::allow_relation(const std::string& /*db1*/,
                                                  const std::string& /*db2*/) {
    return true;
}

std::optional<bool> ReplicaRouter::allow_migrate(const std::string& db) {
    if (db == config_.primary_alias) return true;

    const auto& replicas = known_replicas();
    if (std::find(replicas.begin(), replicas.end(), db) != replicas.end()) {
        return false;
    }
    return std::nullopt;
}

ReplicaRouter::Stats ReplicaRouter::get_stats() const {
    return {
        .replica_reads = replica_reads_.load(std::memory_order_relaxed),
        .primary_reads = primary_reads_.load(std::memory_order_relaxed),
        .writes = writes_.load(std::memory_order_relaxed),
    };
}

} // namespace litereplica
