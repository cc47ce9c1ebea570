#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace litereplica;

namespace {

bool has_error(const std::string& message, const std::string& needle) {
    return message.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: full config", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[extension]
data_dir = "/var/lib/app"
vfs_name = "litestream"
install_command = "fetch-vfs --out {path}"

[primary]
alias = "main"
path = "/var/lib/app/db.sqlite3"
busy_timeout_ms = 2500

[replication]
max_lag_seconds = 30

[replicas]
replica_1 = "s3://bucket/db.sqlite3"
replica_2 = { url = "gs://other/db.sqlite3", max_lag_seconds = 5.5 }
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.extension.data_dir == "/var/lib/app");
    CHECK(cfg.extension.install_command == "fetch-vfs --out {path}");
    CHECK(cfg.primary.alias == "main");
    CHECK(cfg.primary.name == "/var/lib/app/db.sqlite3");
    CHECK(cfg.primary.busy_timeout == std::chrono::milliseconds(2500));
    CHECK_FALSE(cfg.primary.is_replica());
    CHECK(cfg.max_lag_seconds == 30.0);

    REQUIRE(cfg.replicas.size() == 2);
    CHECK(cfg.replicas[0].alias == "replica_1");
    CHECK(cfg.replicas[0].source_url == "s3://bucket/db.sqlite3");
    CHECK(cfg.replicas[0].max_lag_seconds == 30.0);
    CHECK(cfg.replicas[1].alias == "replica_2");
    CHECK(cfg.replicas[1].source_url == "gs://other/db.sqlite3");
    CHECK(cfg.replicas[1].max_lag_seconds == 5.5);
}

TEST_CASE("ConfigLoader: defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "info");
    CHECK(cfg.extension.path.empty());
    CHECK(cfg.extension.data_dir == ".");
    CHECK(cfg.extension.vfs_name == "litestream");
    CHECK(cfg.primary.alias == "default");
    CHECK(cfg.primary.busy_timeout == std::chrono::milliseconds(5000));
    CHECK(cfg.max_lag_seconds == kDefaultMaxLagSeconds);
    CHECK(cfg.replicas.empty());
}

TEST_CASE("ConfigLoader: max_lag_seconds inside [replicas]", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"

[replicas]
max_lag_seconds = 12
r1 = "s3://bucket/db"
)");
    REQUIRE(result.success);
    CHECK(result.config.max_lag_seconds == 12.0);
    REQUIRE(result.config.replicas.size() == 1);
    CHECK(result.config.replicas[0].alias == "r1");
    CHECK(result.config.replicas[0].max_lag_seconds == 12.0);
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("LITEREPLICA_TEST_BUCKET", "my-bucket", 1);
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"

[replicas]
r1 = "s3://${LITEREPLICA_TEST_BUCKET}/db.sqlite3"
r2 = { url = "s3://${LITEREPLICA_TEST_BUCKET}/other" }
)");
    REQUIRE(result.success);
    CHECK(result.config.replicas[0].source_url == "s3://my-bucket/db.sqlite3");
    CHECK(result.config.replicas[1].source_url == "s3://my-bucket/other");
}

TEST_CASE("ConfigLoader: unclosed substitution is a parse error", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "${UNCLOSED"
)");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    const auto result = ConfigLoader::load_from_string("[primary\npath = ");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/litereplica.toml");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "Failed to load config"));
}

TEST_CASE("ConfigLoader: loads from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "litereplica_test_config.toml";
    std::ofstream(path) << "[primary]\npath = \"app.db\"\n[replicas]\nr1 = \"s3://b/app.db\"\n";

    const auto result = ConfigLoader::load_from_file(path.string());
    REQUIRE(result.success);
    CHECK(result.config.primary.name == "app.db");
    CHECK(result.config.replicas.size() == 1);
}

TEST_CASE("ConfigLoader: validation errors", "[config]") {
    SECTION("primary path required") {
        const auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"warn\"\n");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result.error_message, "Config validation failed"));
        CHECK(has_error(result.error_message, "primary.path is required"));
    }

    SECTION("non-positive lag") {
        const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"
[replication]
max_lag_seconds = 0
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result.error_message, "replication.max_lag_seconds must be positive"));
    }

    SECTION("replica alias collides with primary") {
        const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"
[replicas]
default = "s3://bucket/db"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result.error_message, "replicas.default collides with the primary alias"));
    }

    SECTION("reserved prefix") {
        const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"
[replicas]
_litereplica_timetravel_r1 = "s3://bucket/db"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result.error_message, "uses the reserved prefix"));
    }

    SECTION("empty url and bad per-replica lag") {
        const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"
[replicas]
r1 = ""
r2 = { url = "s3://bucket/db", max_lag_seconds = -1 }
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result.error_message, "replicas.r1: url must not be empty"));
        CHECK(has_error(result.error_message, "replicas.r2: max_lag_seconds must be positive"));
    }

    SECTION("replica alias must be safe inside a URI") {
        const auto result = ConfigLoader::load_from_string(R"(
[primary]
path = "db.sqlite3"
[replicas]
"eu west" = "s3://bucket/db"
"r1?vfs=unix" = "s3://bucket/db"
"r2#x" = "s3://bucket/db"
"r3&mode=rw" = "s3://bucket/db"
"r4%20" = "s3://bucket/db"
ok-replica_2 = "s3://bucket/db"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result.error_message,
            "replicas.eu west must contain only letters, digits, '_' or '-'"));
        CHECK(has_error(result.error_message, "replicas.r1?vfs=unix must contain only"));
        CHECK(has_error(result.error_message, "replicas.r2#x must contain only"));
        CHECK(has_error(result.error_message, "replicas.r3&mode=rw must contain only"));
        CHECK(has_error(result.error_message, "replicas.r4%20 must contain only"));
        CHECK_FALSE(has_error(result.error_message, "replicas.ok-replica_2"));
    }

    SECTION("vfs name required with replicas") {
        const auto result = ConfigLoader::load_from_string(R"(
[extension]
vfs_name = ""
[primary]
path = "db.sqlite3"
[replicas]
r1 = "s3://bucket/db"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result.error_message, "extension.vfs_name must not be empty"));
    }
}

TEST_CASE("ConfigLoader: validate_config reports duplicates", "[config]") {
    AppConfig cfg;
    cfg.primary.name = "db.sqlite3";
    cfg.replicas.push_back({"r1", "s3://a", 60.0});
    cfg.replicas.push_back({"r1", "s3://b", 60.0});

    const auto errors = ConfigLoader::validate_config(cfg);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == "replicas.r1 is defined twice");
}

TEST_CASE("make_replica_database: read-only VFS descriptor", "[config]") {
    const auto db = make_replica_database({"replica_1", "s3://bucket/db.sqlite3", 60.0}, "litestream");

    CHECK(db.alias == "replica_1");
    CHECK(db.is_replica());
    CHECK(db.name == "file:replica_1.db?vfs=litestream&mode=ro");
    CHECK(db.uri);
    CHECK(db.read_only);
    CHECK_FALSE(db.ephemeral);
    CHECK(db.replica_url == "s3://bucket/db.sqlite3");

    AppConfig cfg;
    cfg.replicas.push_back({"a", "s3://a", 60.0});
    cfg.replicas.push_back({"b", "s3://b", 60.0});
    const auto all = make_replica_databases(cfg);
    REQUIRE(all.size() == 2);
    CHECK(all[1].name == "file:b.db?vfs=litestream&mode=ro");
}
