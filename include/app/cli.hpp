#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace litereplica::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitUsage = 2;

void print_usage(const std::string& prog, std::ostream& err);

/**
 * @brief Run one CLI command
 *
 * args: <config.toml> <command> [command args...]
 *   status [alias...]                    replica status as JSON
 *   route read|write                     routed alias
 *   time-travel <alias> <time_point> <sql>  rows as JSON
 *
 * Results go to out; errors are logged.
 * @return kExitOk, kExitError, or kExitUsage for malformed arguments
 */
[[nodiscard]] int run(const std::vector<std::string>& args, std::ostream& out);

} // namespace litereplica::app
