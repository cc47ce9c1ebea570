#pragma once

#include "router/idatabase_router.hpp"

#include <memory>
#include <string>
#include <vector>

namespace litereplica {

/**
 * @brief Ordered chain of routers consulted by the data access layer
 *
 * Each decision goes to the routers in order; the first one with an opinion
 * wins. When every router abstains: reads and writes use the default alias,
 * relations are allowed only within one database, migrations are allowed.
 */
class RouterChain {
public:
    explicit RouterChain(std::string default_alias = "default");

    void add_router(std::shared_ptr<IDatabaseRouter> router);

    [[nodiscard]] std::string db_for_read() const;
    [[nodiscard]] std::string db_for_write() const;
    [[nodiscard]] bool allow_relation(const std::string& db1, const std::string& db2) const;
    [[nodiscard]] bool allow_migrate(const std::string& db) const;

    [[nodiscard]] size_t router_count() const { return routers_.size(); }

private:
    std::string default_alias_;
    std::vector<std::shared_ptr<IDatabaseRouter>> routers_;
};

} // namespace litereplica
