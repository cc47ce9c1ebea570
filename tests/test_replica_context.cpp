#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/replica_context.hpp"
#include "db/connection_registry.hpp"
#include "extension/extension_loader.hpp"
#include "replica/status_prober.hpp"
#include "router/replica_router.hpp"
#include "router/router_chain.hpp"
#include "mocks/mock_connection.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>

using namespace litereplica;
using namespace litereplica::testing;

namespace {

AppConfig two_replica_config() {
    AppConfig cfg;
    cfg.primary.alias = "default";
    cfg.primary.name = "db.sqlite3";
    cfg.max_lag_seconds = 60.0;
    cfg.replicas.push_back({"r1", "s3://bucket/r1", 60.0});
    cfg.replicas.push_back({"r2", "s3://bucket/r2", 5.0});
    return cfg;
}

struct ContextFixture {
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>();
    std::atomic<int> loads{0};
    bool fail_load = false;

    ReplicaComponents components() {
        const auto path = std::filesystem::temp_directory_path() / "litereplica_context_ext.so";
        std::ofstream(path) << "stub";
        ExtensionConfig ext;
        ext.path = path.string();

        ReplicaComponents c;
        c.factory = factory;
        c.extension_loader = std::make_shared<ExtensionLoader>(ext, nullptr,
            [this](const std::string&, const std::string&) {
                loads.fetch_add(1);
                if (fail_load) throw ExtensionLoadError("VFS registration failed");
            });
        return c;
    }
};

} // anonymous namespace

TEST_CASE("ReplicaContext: registers primary and replicas", "[context]") {
    ContextFixture f;
    ReplicaContext ctx(two_replica_config(), f.components());

    CHECK(ctx.registry().database_aliases() == std::vector<std::string>{"default", "r1", "r2"});
    CHECK(ctx.registry().replica_aliases() == std::vector<std::string>{"r1", "r2"});
    CHECK(ctx.router().primary_alias() == "default");
    CHECK(ctx.router_chain().router_count() == 1);
    CHECK(f.factory->open_count() == 0);
}

TEST_CASE("ReplicaContext: startup loads the extension once", "[context]") {
    ContextFixture f;
    ReplicaContext ctx(two_replica_config(), f.components());

    CHECK(ctx.startup());
    CHECK(ctx.extension_loader().is_loaded());
    (void)ctx.registry().connection("r1");
    CHECK(f.loads.load() == 1);
}

TEST_CASE("ReplicaContext: startup failure is not fatal", "[context]") {
    ContextFixture f;
    f.fail_load = true;
    ReplicaContext ctx(two_replica_config(), f.components());

    bool loaded = true;
    REQUIRE_NOTHROW(loaded = ctx.startup());
    CHECK_FALSE(loaded);
    CHECK_FALSE(ctx.extension_loader().is_loaded());

    // Reads still work, from the primary
    CHECK(ctx.router_chain().db_for_read() == "default");

    // The error surfaces where a replica is needed
    CHECK_THROWS_AS(ctx.registry().connection("r1"), ExtensionLoadError);

    f.fail_load = false;
    CHECK_NOTHROW(ctx.registry().connection("r1"));
    CHECK(ctx.extension_loader().is_loaded());
}

TEST_CASE("ReplicaContext: no replicas needs no extension", "[context]") {
    ContextFixture f;
    AppConfig cfg;
    cfg.primary.name = "db.sqlite3";
    ReplicaContext ctx(cfg, f.components());

    CHECK(ctx.startup());
    CHECK(f.loads.load() == 0);
    CHECK(ctx.router().route_for_read() == "default");
}

TEST_CASE("ReplicaContext: routes reads by probed lag", "[context]") {
    ContextFixture f;
    f.factory->respond("r1", StatusProber::kLagQuery, single_value("10"));
    f.factory->respond("r2", StatusProber::kLagQuery, single_value("10"));
    ReplicaContext ctx(two_replica_config(), f.components());

    // r2 allows only 5s of lag
    for (int i = 0; i < 20; ++i) {
        CHECK(ctx.router_chain().db_for_read() == "r1");
    }
    CHECK(ctx.router_chain().db_for_write() == "default");
    CHECK_FALSE(ctx.router_chain().allow_migrate("r1"));
    CHECK(ctx.router_chain().allow_migrate("default"));
}

TEST_CASE("ReplicaContext: status report", "[context]") {
    ContextFixture f;
    f.factory->respond("r1", StatusProber::kTxidQuery, single_value("00000000000000ff"));
    f.factory->respond("r1", StatusProber::kLagQuery, single_value("0.25"));
    ReplicaContext ctx(two_replica_config(), f.components());

    const auto report = ctx.get_status("r1");
    CHECK(report.source_url == "s3://bucket/r1");
    CHECK(report.txid == std::optional<std::string>("00000000000000ff"));
    CHECK(report.lag_seconds == std::optional<double>(0.25));

    CHECK_THROWS_AS(ctx.get_status("default"), ConfigurationError);
}

TEST_CASE("ReplicaContext: shutdown closes connections", "[context]") {
    ContextFixture f;
    ReplicaContext ctx(two_replica_config(), f.components());
    (void)ctx.registry().connection("default");
    (void)ctx.registry().connection("r1");

    ctx.shutdown();
    CHECK(f.factory->last_state("default")->closed.load());
    CHECK(f.factory->last_state("r1")->closed.load());
    CHECK_FALSE(ctx.registry().has_connection("r1"));
}

TEST_CASE("ReplicaContext: duplicate replica alias is rejected", "[context]") {
    ContextFixture f;
    auto cfg = two_replica_config();
    cfg.replicas.push_back({"r1", "s3://bucket/again", 60.0});
    CHECK_THROWS_AS(ReplicaContext(cfg, f.components()), ConfigurationError);
}
