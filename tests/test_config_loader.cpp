#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace tenantcore;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "tenantcore_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

bool has_error(const ConfigLoader::LoadResult& r, const std::string& fragment) {
    return !r.success && r.error_message.find(fragment) != std::string::npos;
}

} // namespace

TEST_CASE("ConfigLoader: empty document keeps defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.cluster.coordinates.host == "localhost");
    CHECK(cfg.cluster.coordinates.port == 5432);
    CHECK(cfg.cluster.admin_database == "postgres");
    CHECK(cfg.cluster.main_database == "tenantcore");
    CHECK(cfg.pools.registry.max_connections_per_pool == 5);
    CHECK_FALSE(cfg.schema_repair.reactive_enabled);
    CHECK(cfg.provisioning.orchestrator.default_plan == "professional");
    CHECK(cfg.sessions.governor.defaults.max_concurrent_sessions == 5);
    CHECK(cfg.sessions.tenants.empty());
}

TEST_CASE("ConfigLoader: sections map onto typed config", "[config]") {
    const std::string toml = R"(
[cluster]
host = "db.internal"
port = 6543
user = "tenantcore_admin"
main_database = "control"

[pools]
max_connections_per_pool = 8
min_connections = 0
max_pools = 200
acquire_timeout_ms = 750
idle_pool_timeout_seconds = 600

[provisioning]
admin_statement_timeout_ms = 90000
required_tables = ["users", "profiles"]
default_plan = "enterprise"

[schema_repair]
reactive_enabled = true
cooldown_seconds = 10
lock_wait_attempts = 3

[sessions]
max_concurrent_sessions = 2
idle_timeout_seconds = 900
cache_enabled = false
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.cluster.coordinates.host == "db.internal");
    CHECK(cfg.cluster.coordinates.port == 6543);
    CHECK(cfg.cluster.coordinates.user == "tenantcore_admin");
    CHECK(cfg.cluster.main_database == "control");

    CHECK(cfg.pools.registry.max_connections_per_pool == 8);
    CHECK(cfg.pools.registry.min_connections == 0);
    CHECK(cfg.pools.registry.max_pools == 200);
    CHECK(cfg.pools.registry.acquire_timeout == std::chrono::milliseconds{750});
    CHECK(cfg.pools.registry.idle_pool_timeout == std::chrono::seconds{600});

    CHECK(cfg.provisioning.admin_statement_timeout_ms == 90000);
    CHECK(cfg.provisioning.orchestrator.required_tables == std::vector<std::string>{"users", "profiles"});
    CHECK(cfg.provisioning.orchestrator.default_plan == "enterprise");

    CHECK(cfg.schema_repair.reactive_enabled);
    CHECK(cfg.schema_repair.cooldown == std::chrono::seconds{10});
    CHECK(cfg.schema_repair.lock_wait_attempts == 3);

    CHECK(cfg.sessions.governor.defaults.max_concurrent_sessions == 2);
    CHECK(cfg.sessions.governor.defaults.idle_timeout == std::chrono::seconds{900});
    CHECK_FALSE(cfg.sessions.governor.cache.enabled);
}

TEST_CASE("ConfigLoader: per-tenant session policies inherit defaults", "[config][sessions]") {
    const std::string toml = R"(
[sessions]
max_concurrent_sessions = 4
idle_timeout_seconds = 1200

[[sessions.tenants]]
database = "agency_acme_1a2b3c4d"
max_concurrent_sessions = 1
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    REQUIRE(result.config.sessions.tenants.size() == 1);

    const auto& t = result.config.sessions.tenants[0];
    CHECK(t.database == "agency_acme_1a2b3c4d");
    CHECK(t.policy.max_concurrent_sessions == 1);
    CHECK(t.policy.idle_timeout == std::chrono::seconds{1200});
}

TEST_CASE("ConfigLoader: ${VAR} expands from the environment", "[config][env]") {
    ::setenv("TENANTCORE_TEST_DB_PASSWORD", "s3cret", 1);
    ::unsetenv("TENANTCORE_TEST_UNSET_12345");

    const std::string toml = R"(
[cluster]
password = "${TENANTCORE_TEST_DB_PASSWORD}"
application_name = "tc-${TENANTCORE_TEST_UNSET_12345}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.cluster.coordinates.password == "s3cret");
    CHECK(result.config.cluster.coordinates.application_name == "tc-");

    ::unsetenv("TENANTCORE_TEST_DB_PASSWORD");
}

TEST_CASE("ConfigLoader: unclosed ${ is a parse error", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
[cluster]
password = "${UNCLOSED"
)");
    CHECK(has_error(result, "Unclosed env var"));
}

TEST_CASE("ConfigLoader: included files sit underneath the main file", "[config][include]") {
    TmpDir tmp;
    tmp.file("pools.toml", R"(
[pools]
max_pools = 10
max_connections_per_pool = 3
)");
    tmp.file("sessions.toml", R"(
[[sessions.tenants]]
database = "agency_beta_00000001"
max_concurrent_sessions = 2
)");
    const auto main_path = tmp.file("main.toml", R"(
include = ["pools.toml", "sessions.toml"]

[pools]
max_pools = 25

[[sessions.tenants]]
database = "agency_alpha_00000002"
max_concurrent_sessions = 3
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.pools.registry.max_pools == 25);
    CHECK(result.config.pools.registry.max_connections_per_pool == 3);
    CHECK(result.config.sessions.tenants.size() == 2);
}

TEST_CASE("ConfigLoader: circular includes are rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    CHECK(has_error(result, "Circular config include"));
}

TEST_CASE("ConfigLoader: missing file is an error", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/tenantcore.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

TEST_CASE("ConfigLoader: validation reports every problem", "[config][validation]") {
    const std::string toml = R"(
[cluster]
host = ""
port = 0
main_database = "Bad Name"

[pools]
max_connections_per_pool = 2
min_connections = 4
max_pools = 0

[provisioning]
required_tables = []
default_plan = "gold"

[schema_repair]
lock_wait_attempts = 0

[sessions]
max_concurrent_sessions = 0

[[sessions.tenants]]
database = "agency_acme_1a2b3c4d"
idle_timeout_seconds = 0
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.starts_with("Config validation failed:"));
    CHECK(msg.find("cluster.host must not be empty") != std::string::npos);
    CHECK(msg.find("cluster.port must be 1-65535") != std::string::npos);
    CHECK(msg.find("cluster.main_database 'Bad Name'") != std::string::npos);
    CHECK(msg.find("pools.min_connections (4) > max_connections_per_pool (2)") != std::string::npos);
    CHECK(msg.find("pools.max_pools must be > 0") != std::string::npos);
    CHECK(msg.find("provisioning.required_tables must not be empty") != std::string::npos);
    CHECK(msg.find("provisioning.default_plan 'gold'") != std::string::npos);
    CHECK(msg.find("schema_repair.lock_wait_attempts must be > 0") != std::string::npos);
    CHECK(msg.find("sessions.max_concurrent_sessions must be > 0") != std::string::npos);
    CHECK(msg.find("sessions.tenants[0].idle_timeout_seconds must be > 0") != std::string::npos);
}

TEST_CASE("ConfigLoader: validate_config on a default config is clean", "[config][validation]") {
    CHECK(ConfigLoader::validate_config(TenantCoreConfig{}).empty());
}
