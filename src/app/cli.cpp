#include "app/cli.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/replica_context.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"
#include "replica/time_travel_session.hpp"
#include "router/replica_router.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace litereplica::app {

namespace {

constexpr int kBadArgs = -1;

int cmd_status(ReplicaContext& ctx, const std::vector<std::string>& args, std::ostream& out) {
    std::vector<std::string> aliases;
    if (args.empty()) {
        for (const auto& endpoint : ctx.config().replicas) aliases.push_back(endpoint.alias);
    } else {
        aliases = args;
    }

    nlohmann::json report = nlohmann::json::array();
    for (const auto& alias : aliases) {
        report.push_back(nlohmann::json(ctx.get_status(alias)));
    }
    out << report.dump(2) << '\n';
    return kExitOk;
}

int cmd_route(ReplicaContext& ctx, const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() != 1 || (args[0] != "read" && args[0] != "write")) {
        return kBadArgs;
    }
    auto& router = ctx.router();
    out << (args[0] == "read" ? router.route_for_read() : router.route_for_write()) << '\n';
    return kExitOk;
}

int cmd_time_travel(ReplicaContext& ctx, const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() != 3) return kBadArgs;

    return with_time_travel(ctx.registry(), args[0], args[1], [&](const std::string& alias) {
        const auto rs = ctx.registry().connection(alias)->execute(args[2]);
        if (!rs.success) {
            utils::log::error(std::format("Query failed on '{}': {}", alias, rs.error_message));
            return kExitError;
        }
        nlohmann::json rows;
        rows["alias"] = alias;
        rows["columns"] = rs.column_names;
        rows["rows"] = rs.rows;
        out << rows.dump(2) << '\n';
        return kExitOk;
    });
}

} // anonymous namespace

void print_usage(const std::string& prog, std::ostream& err) {
    err << "Usage:\n"
        << "  " << prog << " <config.toml> status [alias]\n"
        << "  " << prog << " <config.toml> route read|write\n"
        << "  " << prog << " <config.toml> time-travel <alias> <time_point> <sql>\n";
}

int run(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) return kExitUsage;

    const std::string& config_file = args[0];
    const std::string& command = args[1];
    const std::vector<std::string> command_args(args.begin() + 2, args.end());

    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitError;
    }

    try {
        ReplicaContext ctx(std::move(config_result.config));
        ctx.startup();

        int rc = kBadArgs;
        if (command == "status") {
            rc = cmd_status(ctx, command_args, out);
        } else if (command == "route") {
            rc = cmd_route(ctx, command_args, out);
        } else if (command == "time-travel") {
            rc = cmd_time_travel(ctx, command_args, out);
        }
        return rc == kBadArgs ? kExitUsage : rc;
    } catch (const ConfigurationError& e) {
        utils::log::error(std::format("Configuration error: {}", e.what()));
    } catch (const ExtensionLoadError& e) {
        utils::log::error(std::format("Extension error: {}", e.what()));
    } catch (const TimeTravelError& e) {
        utils::log::error(std::format("Time-travel error: {}", e.what()));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
    }
    return kExitError;
}

} // namespace litereplica::app
