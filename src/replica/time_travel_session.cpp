#include "replica/time_travel_session.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"

#include <format>

namespace litereplica {

std::string TimeTravelSession::temp_alias_for(const std::string& base_alias) {
    return std::string(kTimeTravelAliasPrefix) + base_alias;
}

std::string TimeTravelSession::directive_for(const std::string& time_point) {
    std::string quoted;
    quoted.reserve(time_point.size() + 2);
    for (const char c : time_point) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    return std::format("PRAGMA {}='{}'", kTimePragma, quoted);
}

TimeTravelSession::TimeTravelSession(ConnectionRegistry& registry,
                                     const std::string& base_alias,
                                     std::string time_point)
    : registry_(registry),
      base_alias_(base_alias),
      temp_alias_(temp_alias_for(base_alias)),
      time_point_(std::move(time_point)) {

    const auto base = registry_.database_config(base_alias_);
    if (!base) {
        throw ConfigurationError(std::format(
            "Database '{}' not found. Time-travel needs a configured replica.", base_alias_));
    }
    if (!base->is_replica()) {
        throw ConfigurationError(std::format(
            "Database '{}' is not a replica. Time-travel only works with replicas.", base_alias_));
    }

    DatabaseConfig temp = *base;
    temp.alias = temp_alias_;
    temp.ephemeral = true;
    if (!registry_.register_database(std::move(temp))) {
        throw ConfigurationError(std::format(
            "Alias '{}' is already registered; a time-travel session on '{}' is still open",
            temp_alias_, base_alias_));
    }

    try {
        connection_ = registry_.connection(temp_alias_);
        const auto rs = connection_->execute(directive_for(time_point_));
        if (!rs.success) {
            throw TimeTravelError(std::format(
                "Failed to set time-travel to '{}'. Make sure the extension supports "
                "time-travel and the time point is valid. Error: {}",
                time_point_, rs.error_message));
        }
    } catch (...) {
        cleanup();
        throw;
    }

    utils::log::debug(std::format("Time-travel session '{}' opened at '{}'",
        temp_alias_, time_point_));
}

TimeTravelSession::~TimeTravelSession() {
    cleanup();
}

void TimeTravelSession::cleanup() noexcept {
    connection_.reset();
    try {
        registry_.close_connection(temp_alias_);
        registry_.unregister_database(temp_alias_);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Time-travel session '{}' cleanup failed: {}",
            temp_alias_, e.what()));
    }
}

} // namespace litereplica
