#include "core/replica_context.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "extension/extension_loader.hpp"
#include "replica/health_evaluator.hpp"
#include "replica/status_prober.hpp"
#include "router/replica_router.hpp"
#include "router/router_chain.hpp"

#include <format>
#include <unordered_map>

namespace litereplica {

ReplicaContext::ReplicaContext(AppConfig config, ReplicaComponents components)
    : config_(std::move(config)) {

    utils::log::set_level(utils::log::parse_level(config_.logging.level));

    auto factory = components.factory
        ? std::move(components.factory)
        : std::make_shared<SqliteConnectionFactory>();

    extension_loader_ = std::move(components.extension_loader);
    if (!extension_loader_) {
        auto installer = std::move(components.installer);
        if (!installer && !config_.extension.install_command.empty()) {
            installer = std::make_shared<CommandExtensionInstaller>(
                config_.extension.install_command);
        }
        extension_loader_ = std::make_shared<ExtensionLoader>(
            config_.extension, std::move(installer));
    }

    registry_ = std::make_shared<ConnectionRegistry>(std::move(factory), extension_loader_);

    if (!registry_->register_database(config_.primary)) {
        throw ConfigurationError(std::format(
            "Primary alias '{}' registered twice", config_.primary.alias));
    }
    std::unordered_map<std::string, double> replica_max_lag;
    for (const auto& endpoint : config_.replicas) {
        if (!registry_->register_database(
                make_replica_database(endpoint, config_.extension.vfs_name))) {
            throw ConfigurationError(std::format(
                "Replica alias '{}' is already registered", endpoint.alias));
        }
        replica_max_lag.emplace(endpoint.alias, endpoint.max_lag_seconds);
    }

    prober_ = std::make_shared<StatusProber>(*registry_);
    evaluator_ = std::make_shared<HealthEvaluator>(prober_, std::move(replica_max_lag));

    ReplicaRouter::Config router_cfg;
    router_cfg.primary_alias = config_.primary.alias;
    router_cfg.max_lag_seconds = config_.max_lag_seconds;
    router_ = std::make_shared<ReplicaRouter>(
        router_cfg,
        [registry = registry_] { return registry->replica_aliases(); },
        evaluator_);

    router_chain_ = std::make_unique<RouterChain>(config_.primary.alias);
    router_chain_->add_router(router_);

    utils::log::info(std::format("Replica context ready: primary='{}', {} replica(s), max_lag={}s",
        config_.primary.alias, config_.replicas.size(), config_.max_lag_seconds));
}

ReplicaContext::~ReplicaContext() {
    shutdown();
}

bool ReplicaContext::startup() {
    if (config_.replicas.empty()) return true;

    try {
        extension_loader_->ensure_loaded();
        return true;
    } catch (const std::exception& e) {
        utils::log::warn(std::format(
            "Extension not loaded at startup, retrying on first replica use: {}", e.what()));
        return false;
    }
}

void ReplicaContext::shutdown() {
    registry_->close_all();
}

ReplicaStatusReport ReplicaContext::get_status(const std::string& alias) {
    return prober_->get_status(alias);
}

} // namespace litereplica
