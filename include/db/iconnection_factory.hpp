#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>

namespace litereplica {

/**
 * @brief Abstract factory for creating database connections
 *
 * Wraps the native open call. Open failures are an expected outcome
 * (unreachable replica, missing VFS) and come back as an error Result.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new connection for a registered descriptor
     * @param config Descriptor (path/URI, flags, replica URL)
     * @return Open connection, or error with the native message
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const DatabaseConfig& config) = 0;
};

} // namespace litereplica
