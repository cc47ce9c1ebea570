#pragma once

#include "db/idb_connection.hpp"

#include <memory>
#include <string>
#include <utility>

namespace litereplica {

class ConnectionRegistry;

/**
 * @brief Scoped view of a replica pinned to a point in time
 *
 * Construction registers a clone of the replica's descriptor under
 * _litereplica_timetravel_<base>, opens it and issues
 * PRAGMA litestream_time='<time_point>'. The time point is passed through
 * as written: absolute timestamps ("2024-12-20 14:00:00") and relative
 * expressions ("1 hour ago") are interpreted by the extension.
 *
 * Destruction closes the connection and removes the registration. The same
 * cleanup runs when construction fails after registering, so no temporary
 * alias or handle outlives the scope on any path.
 *
 * Two overlapping sessions on the same base alias are rejected: the second
 * finds the temporary alias taken.
 */
class TimeTravelSession {
public:
    static constexpr const char* kTimePragma = "litestream_time";

    /**
     * @throws ConfigurationError base alias unknown, not a replica, or already in a session
     * @throws TimeTravelError the extension rejected the time point
     * @throws ExtensionLoadError the extension could not be loaded
     */
    TimeTravelSession(ConnectionRegistry& registry, const std::string& base_alias,
                      std::string time_point);
    ~TimeTravelSession();

    TimeTravelSession(const TimeTravelSession&) = delete;
    TimeTravelSession& operator=(const TimeTravelSession&) = delete;
    TimeTravelSession(TimeTravelSession&&) = delete;
    TimeTravelSession& operator=(TimeTravelSession&&) = delete;

    /// Temporary alias to run queries against for the life of the session.
    [[nodiscard]] const std::string& alias() const { return temp_alias_; }
    [[nodiscard]] const std::string& base_alias() const { return base_alias_; }
    [[nodiscard]] const std::string& time_point() const { return time_point_; }

    [[nodiscard]] std::shared_ptr<IDbConnection> connection() const { return connection_; }

    [[nodiscard]] static std::string temp_alias_for(const std::string& base_alias);

    /// PRAGMA text for time_point, single quotes doubled.
    [[nodiscard]] static std::string directive_for(const std::string& time_point);

private:
    void cleanup() noexcept;

    ConnectionRegistry& registry_;
    std::string base_alias_;
    std::string temp_alias_;
    std::string time_point_;
    std::shared_ptr<IDbConnection> connection_;
};

/// Open a time-travel session on alias (see TimeTravelSession).
[[nodiscard]] inline TimeTravelSession open_session(ConnectionRegistry& registry,
                                                    const std::string& alias,
                                                    const std::string& time_point) {
    return TimeTravelSession(registry, alias, time_point);
}

/**
 * @brief Run fn(temp_alias) inside a time-travel session
 *
 * The session is torn down when fn returns or throws.
 */
template<typename Fn>
auto with_time_travel(ConnectionRegistry& registry, const std::string& alias,
                      const std::string& time_point, Fn&& fn) {
    TimeTravelSession session(registry, alias, time_point);
    return std::forward<Fn>(fn)(session.alias());
}

} // namespace litereplica
