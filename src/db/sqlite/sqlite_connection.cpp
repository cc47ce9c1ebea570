#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <mutex>
#include <shared_mutex>

namespace litereplica {

namespace {

// Guards the VFS environment handoff between setenv() and sqlite3_open_v2().
std::mutex& replica_open_mutex() {
    static std::mutex m;
    return m;
}

DbResultSet error_result(std::string message) {
    DbResultSet result;
    result.success = false;
    result.error_message = std::move(message);
    return result;
}

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    // Shared: concurrent executes serialize on the SQLite handle mutex below
    std::shared_lock handle_lock(handle_mutex_);
    if (!db_) {
        return error_result("Connection is closed");
    }

    // Hold the handle mutex so sqlite3_errmsg() reports our own failure
    sqlite3_mutex* mtx = sqlite3_db_mutex(db_);
    sqlite3_mutex_enter(mtx);

    DbResultSet result;
    result.success = true;

    const char* tail = sql.c_str();
    while (tail && *tail) {
        sqlite3_stmt* stmt = nullptr;
        const char* next = nullptr;
        int rc = sqlite3_prepare_v2(db_, tail, -1, &stmt, &next);
        if (rc != SQLITE_OK) {
            result = error_result(sqlite3_errmsg(db_));
            break;
        }
        tail = next;
        if (!stmt) continue;  // Whitespace or comment

        const int ncols = sqlite3_column_count(stmt);
        if (ncols > 0) {
            result.has_rows = true;
            result.column_names.clear();
            result.rows.clear();
            for (int i = 0; i < ncols; ++i) {
                const char* name = sqlite3_column_name(stmt, i);
                result.column_names.emplace_back(name ? name : "");
            }
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            std::vector<std::string> row;
            row.reserve(ncols);
            for (int i = 0; i < ncols; ++i) {
                const auto* text = sqlite3_column_text(stmt, i);
                row.emplace_back(text ? reinterpret_cast<const char*>(text) : "");
            }
            result.rows.push_back(std::move(row));
        }

        if (rc != SQLITE_DONE) {
            const std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            result = error_result(error);
            break;
        }

        if (ncols == 0) {
            result.affected_rows += static_cast<uint64_t>(sqlite3_changes(db_));
        }
        sqlite3_finalize(stmt);
    }

    sqlite3_mutex_leave(mtx);
    return result;
}

bool SqliteConnection::is_connected() const {
    std::shared_lock lock(handle_mutex_);
    return db_ != nullptr;
}

void SqliteConnection::close() {
    // Exclusive: waits for in-flight executes before freeing the handle
    std::unique_lock lock(handle_mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> SqliteConnectionFactory::create(
    const DatabaseConfig& config) {

    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= config.read_only ? SQLITE_OPEN_READONLY
                              : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (config.uri) flags |= SQLITE_OPEN_URI;

    sqlite3* db = nullptr;
    int rc = SQLITE_OK;
    if (config.is_replica()) {
        std::lock_guard<std::mutex> lock(replica_open_mutex());
        ::setenv(kReplicaUrlEnv, config.replica_url.c_str(), 1);
        rc = sqlite3_open_v2(config.name.c_str(), &db, flags, nullptr);
    } else {
        rc = sqlite3_open_v2(config.name.c_str(), &db, flags, nullptr);
    }

    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        utils::log::error(std::format("Failed to open '{}' [{}]: {}",
            config.alias, config.name, error));
        return Result<std::unique_ptr<IDbConnection>>::error(
            ErrorCategory::CONFIGURATION_ERROR,
            std::format("Failed to open database '{}': {}", config.alias, error));
    }

    sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));
    utils::log::debug(std::format("Opened database '{}' [{}]", config.alias, config.name));
    return Result<std::unique_ptr<IDbConnection>>::ok(std::make_unique<SqliteConnection>(db));
}

// ============================================================================
// Extension loading
// ============================================================================

void sqlite_load_extension(const std::string& path, const std::string& entry_point) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(":memory:", &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        throw ExtensionLoadError(std::format(
            "Failed to open in-memory database for extension load: {}", error));
    }

    rc = sqlite3_db_config(db, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 1, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db);
        sqlite3_close_v2(db);
        throw ExtensionLoadError(std::format("Extension loading is disabled: {}", error));
    }

    char* err = nullptr;
    rc = sqlite3_load_extension(db, path.c_str(),
        entry_point.empty() ? nullptr : entry_point.c_str(), &err);
    if (rc != SQLITE_OK) {
        std::string error = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        sqlite3_close_v2(db);
        throw ExtensionLoadError(std::format(
            "Failed to load extension from {}. Error: {}", path, error));
    }

    sqlite3_close_v2(db);
}

} // namespace litereplica
