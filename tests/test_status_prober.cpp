#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "db/connection_registry.hpp"
#include "replica/status_prober.hpp"
#include "mocks/mock_connection.hpp"

#include <nlohmann/json.hpp>

using namespace litereplica;
using namespace litereplica::testing;

namespace {

struct ProberFixture {
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>();
    ConnectionRegistry registry{factory};
    StatusProber prober{registry};

    ProberFixture() {
        DatabaseConfig primary;
        primary.alias = "default";
        primary.name = "db.sqlite3";
        (void)registry.register_database(primary);
        (void)registry.register_database(make_replica_database({"r1", "s3://bucket/db.sqlite3", 60.0}, "litestream"));
    }
};

} // anonymous namespace

TEST_CASE("StatusProber: reports txid and lag", "[prober]") {
    ProberFixture f;
    f.factory->respond("r1", StatusProber::kTxidQuery, single_value("00000000000000a1"));
    f.factory->respond("r1", StatusProber::kLagQuery, single_value("10.5"));

    const auto status = f.prober.probe("r1");
    CHECK(status.alias == "r1");
    REQUIRE(status.txid.has_value());
    CHECK(*status.txid == "00000000000000a1");
    REQUIRE(status.lag_seconds.has_value());
    CHECK(*status.lag_seconds == 10.5);
}

TEST_CASE("StatusProber: lag failure keeps txid", "[prober]") {
    ProberFixture f;
    f.factory->respond("r1", StatusProber::kTxidQuery, single_value("42"));
    f.factory->respond("r1", StatusProber::kLagQuery, failure("no such pragma"));

    const auto status = f.prober.probe("r1");
    REQUIRE(status.txid.has_value());
    CHECK(*status.txid == "42");
    CHECK_FALSE(status.lag_seconds.has_value());
}

TEST_CASE("StatusProber: txid failure keeps lag", "[prober]") {
    ProberFixture f;
    f.factory->respond("r1", StatusProber::kTxidQuery, failure("busy"));
    f.factory->respond("r1", StatusProber::kLagQuery, single_value("3"));

    const auto status = f.prober.probe("r1");
    CHECK_FALSE(status.txid.has_value());
    REQUIRE(status.lag_seconds.has_value());
    CHECK(*status.lag_seconds == 3.0);
}

TEST_CASE("StatusProber: absent rows and garbage lag are unknown", "[prober]") {
    ProberFixture f;
    // No scripted txid: the mock answers with an empty result set
    f.factory->respond("r1", StatusProber::kLagQuery, single_value("soon"));

    const auto status = f.prober.probe("r1");
    CHECK_FALSE(status.txid.has_value());
    CHECK_FALSE(status.lag_seconds.has_value());
}

TEST_CASE("StatusProber: negative lag is unknown", "[prober]") {
    ProberFixture f;
    f.factory->respond("r1", StatusProber::kLagQuery, single_value("-1"));

    CHECK_FALSE(f.prober.probe("r1").lag_seconds.has_value());
}

TEST_CASE("StatusProber: connection failure degrades both fields", "[prober]") {
    ProberFixture f;
    f.factory->fail_open("r1");

    ReplicaStatus status;
    REQUIRE_NOTHROW(status = f.prober.probe("r1"));
    CHECK_FALSE(status.txid.has_value());
    CHECK_FALSE(status.lag_seconds.has_value());
}

TEST_CASE("StatusProber: reuses the open connection", "[prober]") {
    ProberFixture f;
    (void)f.prober.probe("r1");
    (void)f.prober.probe("r1");
    CHECK(f.factory->open_count() == 1);

    const auto executed = f.factory->last_state("r1")->executed_copy();
    CHECK(executed.size() == 4);
}

TEST_CASE("StatusProber: get_status builds the report", "[prober]") {
    ProberFixture f;
    f.factory->respond("r1", StatusProber::kTxidQuery, single_value("7"));
    f.factory->respond("r1", StatusProber::kLagQuery, single_value("1.25"));

    const auto report = f.prober.get_status("r1");
    CHECK(report.alias == "r1");
    CHECK(report.is_replica);
    CHECK(report.source_url == "s3://bucket/db.sqlite3");
    CHECK(report.txid == std::optional<std::string>("7"));
    CHECK(report.lag_seconds == std::optional<double>(1.25));

    const nlohmann::json j = report;
    CHECK(j["alias"].get<std::string>() == "r1");
    CHECK(j["lag_seconds"].get<double>() == 1.25);
}

TEST_CASE("StatusProber: unknown fields serialize as null", "[prober]") {
    ProberFixture f;
    const nlohmann::json j = f.prober.get_status("r1");
    CHECK(j["txid"].is_null());
    CHECK(j["lag_seconds"].is_null());
    CHECK(j["is_replica"].get<bool>());
}

TEST_CASE("StatusProber: get_status rejects unknown and non-replica aliases", "[prober]") {
    ProberFixture f;
    CHECK_THROWS_AS(f.prober.get_status("missing"), ConfigurationError);
    CHECK_THROWS_AS(f.prober.get_status("default"), ConfigurationError);
}
