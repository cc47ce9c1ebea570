#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <shared_mutex>
#include <string>

namespace litereplica {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* opened in serialized mode, so a single handle may be
 * shared by concurrent readers. close() may race with execute() from other
 * threads: it waits for in-flight statements, and later calls see a closed
 * connection. All SQLite C API calls for statement execution are
 * encapsulated here.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    void close() override;

private:
    sqlite3* db_;
    mutable std::shared_mutex handle_mutex_;  // Guards db_ against close()
};

/**
 * @brief SQLite connection factory
 *
 * Opens primaries read-write and replicas read-only through the VFS named
 * in the descriptor URI. The replica URL is handed to the VFS through the
 * LITESTREAM_REPLICA_URL environment variable, which the VFS reads while
 * opening; a process-wide lock keeps concurrent opens from interleaving.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    static constexpr const char* kReplicaUrlEnv = "LITESTREAM_REPLICA_URL";

    Result<std::unique_ptr<IDbConnection>> create(const DatabaseConfig& config) override;
};

/**
 * @brief Load a SQLite extension into a throwaway in-memory connection
 *
 * Loading is only needed for its side effect: the extension registers its
 * VFS globally for the process. The connection is closed before returning.
 *
 * @param path Shared object path
 * @param entry_point Init symbol (empty = derived by SQLite from the file name)
 * @throws ExtensionLoadError with the SQLite message on failure
 */
void sqlite_load_extension(const std::string& path, const std::string& entry_point);

} // namespace litereplica
