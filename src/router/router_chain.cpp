#include "router/router_chain.hpp"

namespace litereplica {

RouterChain::RouterChain(std::string default_alias)
    : default_alias_(std::move(default_alias)) {}

void RouterChain::add_router(std::shared_ptr<IDatabaseRouter> router) {
    routers_.push_back(std::move(router));
}

std::string RouterChain::db_for_read() const {
    for (const auto& router : routers_) {
        if (auto db = router->db_for_read()) return *db;
    }
    return default_alias_;
}

std::string RouterChain::db_for_write() const {
    for (const auto& router : routers_) {
        if (auto db = router->db_for_write()) return *db;
    }
    return default_alias_;
}

bool RouterChain::allow_relation(const std::string& db1, const std::string& db2) const {
    for (const auto& router : routers_) {
        if (auto allowed = router->allow_relation(db1, db2)) return *allowed;
    }
    return db1 == db2;
}

bool RouterChain::allow_migrate(const std::string& db) const {
    for (const auto& router : routers_) {
        if (auto allowed = router->allow_migrate(db)) return *allowed;
    }
    return true;
}

} // namespace litereplica
