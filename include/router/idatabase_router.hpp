#pragma once

#include <optional>
#include <string>

namespace litereplica {

/**
 * @brief Read/write/relation/migration routing decisions for one alias set
 *
 * Every method may abstain by returning std::nullopt, which lets the next
 * router in a RouterChain decide.
 */
class IDatabaseRouter {
public:
    virtual ~IDatabaseRouter() = default;

    [[nodiscard]] virtual std::optional<std::string> db_for_read() = 0;
    [[nodiscard]] virtual std::optional<std::string> db_for_write() = 0;

    [[nodiscard]] virtual std::optional<bool> allow_relation(
        const std::string& db1, const std::string& db2) = 0;

    [[nodiscard]] virtual std::optional<bool> allow_migrate(const std::string& db) = 0;
};

} // namespace litereplica
