#include <catch2/catch_test_macros.hpp>
#include "tenant/provisioning_orchestrator.hpp"
#include "core/utils.hpp"
#include "mocks/tenant_harness.hpp"

#include <set>
#include <thread>
#include <vector>

using namespace tenantcore;
using tenantcore::testing::TenantHarness;

// ---------------------------------------------------------------------------
// Success
// ---------------------------------------------------------------------------

TEST_CASE("Provisioning: create_tenant builds database, schema, admin and record",
          "[provisioning]") {
    TenantHarness h;
    auto req = TenantHarness::request("Acme.example.com");
    req.subscription_plan = "starter";
    req.metadata.address_text = "12 Main St, Springfield, IL 62701, USA";
    req.metadata.page_ids = {"p1", "p2"};

    auto r = h.orchestrator->create_tenant(req);
    REQUIRE(r.is_ok());
    const auto& t = r.value();

    CHECK_FALSE(t.reused_existing);
    CHECK(t.database_name.starts_with("agency_acme_"));
    CHECK(t.database_name.ends_with(utils::to_lower(t.tenant_id.substr(0, 8))));
    CHECK(t.subscription_plan == "starter");
    CHECK(t.max_users == 5);

    CHECK(h.cluster->has_database(t.database_name));
    CHECK(h.cluster->has_table(t.database_name, "users"));
    CHECK(h.cluster->has_table(t.database_name, "attendance"));
    CHECK(h.cluster->count_statements("INSERT INTO public.agency_settings", t.database_name) == 1);
    CHECK(h.cluster->count_statements("INSERT INTO public.users", t.database_name) == 1);
    CHECK(h.cluster->count_statements("INSERT INTO public.user_roles", t.database_name) == 1);
    CHECK(h.cluster->count_statements("COMMIT", t.database_name) == 1);

    const auto tenants = h.directory->tenants();
    REQUIRE(tenants.size() == 1);
    CHECK(tenants[0].id == t.tenant_id);
    CHECK(tenants[0].domain == "acme.example.com");
    CHECK(tenants[0].owner_user_id == t.admin_user_id);
    CHECK(h.directory->page_assignment_calls() == 1);

    // dedicated and admin connections are all closed
    CHECK(h.cluster->open_connections() == 0);
    CHECK(h.orchestrator->get_stats().succeeded == 1);
}

TEST_CASE("Provisioning: seeded settings carry parsed address parts", "[provisioning]") {
    TenantHarness h;
    auto req = TenantHarness::request("acme.example.com");
    req.metadata.address_text = "12 Main St, Springfield, IL 62701, USA";

    auto r = h.orchestrator->create_tenant(req);
    REQUIRE(r.is_ok());

    bool found = false;
    for (const auto& s : h.cluster->statements()) {
        if (s.sql.starts_with("INSERT INTO public.agency_settings")) {
            found = true;
            REQUIRE(s.params.size() >= 8);
            CHECK(s.params[3] == std::optional<std::string>("12 Main St"));
            CHECK(s.params[4] == std::optional<std::string>("Springfield"));
            CHECK(s.params[6] == std::optional<std::string>("62701"));
        }
    }
    CHECK(found);
}

TEST_CASE("Provisioning: page assignment failure does not fail the tenant", "[provisioning]") {
    TenantHarness h;
    h.directory->set_fail_pages(true);

    auto r = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(r.is_ok());
    CHECK(h.cluster->has_database(r.value().database_name));
    CHECK(h.directory->tenants().size() == 1);
}

TEST_CASE("Provisioning: stale database with the derived name is replaced", "[provisioning]") {
    TenantHarness h;
    // The first existence check sees a leftover database
    h.cluster->add_rule({
        .sql_contains = "FROM pg_database",
        .param_contains = {},
        .database = {},
        .response = DbResultSet{.success = true, .rows = {{"t"}}, .has_rows = true},
        .remaining = 1,
    });

    auto r = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(r.is_ok());
    CHECK(h.cluster->count_statements("DROP DATABASE IF EXISTS", "postgres") == 1);
    CHECK(h.cluster->count_statements("CREATE DATABASE", "postgres") == 1);
    CHECK(h.cluster->has_database(r.value().database_name));
}

// ---------------------------------------------------------------------------
// Validation and reuse
// ---------------------------------------------------------------------------

TEST_CASE("Provisioning: missing fields are rejected before any work", "[provisioning]") {
    TenantHarness h;
    auto req = TenantHarness::request("acme.example.com");
    req.admin_email = "  ";

    auto r = h.orchestrator->create_tenant(req);
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(h.cluster->statements().empty());
}

TEST_CASE("Provisioning: an existing domain is reused, not duplicated", "[provisioning]") {
    TenantHarness h;
    auto first = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(first.is_ok());

    auto second = h.orchestrator->create_tenant(TenantHarness::request("ACME.example.com "));
    REQUIRE(second.is_ok());
    CHECK(second.value().reused_existing);
    CHECK_FALSE(second.value().domain_conflict_resolved);
    CHECK(second.value().tenant_id == first.value().tenant_id);
    CHECK(second.value().database_name == first.value().database_name);
    CHECK(h.cluster->tenant_databases().size() == 1);
    CHECK(h.orchestrator->get_stats().reused_existing == 1);
}

TEST_CASE("Provisioning: a bare prefix and a full domain are one tenant", "[provisioning]") {
    TenantHarness h;
    auto first = h.orchestrator->create_tenant(TenantHarness::request("acme"));
    REQUIRE(first.is_ok());

    auto second = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(second.is_ok());
    CHECK(second.value().reused_existing);
    CHECK(second.value().tenant_id == first.value().tenant_id);
    CHECK(h.directory->tenants().size() == 1);
    CHECK(h.cluster->tenant_databases().size() == 1);
    CHECK_FALSE(h.orchestrator->check_domain_available("acme.other.org").value());
}

TEST_CASE("Provisioning: check_domain_available", "[provisioning]") {
    TenantHarness h;
    CHECK(h.orchestrator->check_domain_available("acme.example.com").value());
    REQUIRE(h.orchestrator->create_tenant(TenantHarness::request("acme.example.com")).is_ok());
    CHECK_FALSE(h.orchestrator->check_domain_available(" Acme.Example.com").value());
    // same subdomain under another parent is taken too
    CHECK_FALSE(h.orchestrator->check_domain_available("acme.other.org").value());
    CHECK(h.orchestrator->check_domain_available("globex.example.com").value());

    auto empty = h.orchestrator->check_domain_available("  ");
    REQUIRE(empty.is_error());
    CHECK(empty.error_code() == ErrorCode::INVALID_ARGUMENT);
}

// ---------------------------------------------------------------------------
// Failure and compensation
// ---------------------------------------------------------------------------

TEST_CASE("Provisioning: schema failure drops the database and names the phase",
          "[provisioning][compensation]") {
    TenantHarness h;
    h.cluster->fail_when("CREATE TABLE IF NOT EXISTS public.attendance", "53100", "disk full");

    auto r = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::PROVISIONING_PHASE_FAILED);
    CHECK(r.error_context() == "CreatingSchema");
    CHECK(r.error_message().find("disk full") != std::string::npos);

    CHECK(h.cluster->tenant_databases().empty());
    CHECK(h.directory->tenants().empty());
    CHECK(h.cluster->open_connections() == 0);

    const auto stats = h.orchestrator->get_stats();
    CHECK(stats.compensations_run == 1);
    CHECK(stats.compensations_failed == 0);
    CHECK(stats.failures_by_phase.at("CreatingSchema") == 1);
}

TEST_CASE("Provisioning: each phase failure reports its own phase", "[provisioning][compensation]") {
    struct Case {
        const char* pattern;
        const char* phase;
    };
    const std::vector<Case> cases = {
        {"CREATE DATABASE", "CreatingDatabase"},
        {"FROM public.agency_settings", "SeedingSettings"},
        {"INSERT INTO public.users", "CreatingAdmin"},
        {"INSERT INTO public.user_roles", "CreatingAdmin"},
    };

    for (const auto& c : cases) {
        DYNAMIC_SECTION(c.phase << " via " << c.pattern) {
            TenantHarness h;
            h.cluster->fail_when(c.pattern, "XX000", "boom");

            auto r = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
            REQUIRE(r.is_error());
            CHECK(r.error_context() == c.phase);
            CHECK(h.cluster->tenant_databases().empty());
            CHECK(h.directory->tenants().empty());
        }
    }
}

TEST_CASE("Provisioning: admin creation failure rolls back before the drop",
          "[provisioning][compensation]") {
    TenantHarness h;
    h.cluster->fail_when("INSERT INTO public.profiles", "23502", "null value");

    auto r = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(r.is_error());
    CHECK(r.error_context() == "CreatingAdmin");

    const auto log = h.cluster->statements();
    size_t rollback_at = log.size();
    size_t drop_at = log.size();
    for (size_t i = 0; i < log.size(); ++i) {
        if (log[i].sql == "ROLLBACK" && rollback_at == log.size()) rollback_at = i;
        if (log[i].sql.starts_with("DROP DATABASE") && drop_at == log.size()) drop_at = i;
    }
    REQUIRE(rollback_at < log.size());
    REQUIRE(drop_at < log.size());
    CHECK(rollback_at < drop_at);
}

TEST_CASE("Provisioning: directory failure in the commit phase compensates",
          "[provisioning][compensation]") {
    TenantHarness h;
    h.directory->set_fail_commit(true);

    auto r = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(r.is_error());
    CHECK(r.error_context() == "CommittingMainRecord");
    CHECK(h.cluster->tenant_databases().empty());
}

TEST_CASE("Provisioning: failed compensation is counted", "[provisioning][compensation]") {
    TenantHarness h;
    h.cluster->fail_when("CREATE TABLE IF NOT EXISTS public.users", "53100", "disk full");
    h.cluster->fail_when("DROP DATABASE", "55006", "database is being accessed by other users");

    auto r = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(r.is_error());
    CHECK(r.error_context() == "CreatingSchema");
    CHECK(h.orchestrator->get_stats().compensations_failed == 1);
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

TEST_CASE("Provisioning: concurrent requests for one domain converge on one tenant",
          "[provisioning][concurrency]") {
    TenantHarness h;
    constexpr int kThreads = 4;

    std::vector<Result<ProvisionedTenant>> results(kThreads,
        Result<ProvisionedTenant>::error(ErrorCode::INTERNAL_ERROR, "not run"));
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            results[i] = h.orchestrator->create_tenant(TenantHarness::request("race.example.com"));
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> tenant_ids;
    std::set<std::string> databases;
    for (const auto& r : results) {
        REQUIRE(r.is_ok());
        tenant_ids.insert(r.value().tenant_id);
        databases.insert(r.value().database_name);
    }
    CHECK(tenant_ids.size() == 1);
    CHECK(databases.size() == 1);
    CHECK(h.directory->tenants().size() == 1);
    REQUIRE(h.cluster->tenant_databases().size() == 1);
    CHECK(h.cluster->tenant_databases().front() == *databases.begin());
}

TEST_CASE("Provisioning: different domains provision independently", "[provisioning][concurrency]") {
    TenantHarness h;
    std::vector<std::thread> threads;
    for (const auto* domain : {"alpha.example.com", "beta.example.com", "gamma.example.com"}) {
        threads.emplace_back([&h, domain] {
            auto r = h.orchestrator->create_tenant(TenantHarness::request(domain));
            CHECK(r.is_ok());
        });
    }
    for (auto& t : threads) t.join();

    CHECK(h.directory->tenants().size() == 3);
    CHECK(h.cluster->tenant_databases().size() == 3);
}

// ---------------------------------------------------------------------------
// Deletion and repair
// ---------------------------------------------------------------------------

TEST_CASE("Provisioning: delete_tenant removes pool, database and record", "[provisioning]") {
    TenantHarness h;
    auto created = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(created.is_ok());
    const auto db = created.value().database_name;

    REQUIRE(h.registry->acquire(db).is_ok());
    CHECK(h.registry->contains(db));

    REQUIRE(h.orchestrator->delete_tenant(db).is_ok());
    CHECK_FALSE(h.registry->contains(db));
    CHECK_FALSE(h.cluster->has_database(db));
    CHECK(h.directory->tenants().empty());
    CHECK(h.cluster->count_statements("pg_terminate_backend", "postgres") >= 1);
}

TEST_CASE("Provisioning: delete_tenant of an unknown or invalid name", "[provisioning]") {
    TenantHarness h;
    auto unknown = h.orchestrator->delete_tenant("agency_none_00000000");
    REQUIRE(unknown.is_error());
    CHECK(unknown.error_code() == ErrorCode::NOT_FOUND);

    auto invalid = h.orchestrator->delete_tenant("x; DROP DATABASE y");
    REQUIRE(invalid.is_error());
    CHECK(invalid.error_code() == ErrorCode::INVALID_IDENTIFIER);
}

TEST_CASE("Provisioning: repair_tenant_schema restores dropped tables", "[provisioning]") {
    TenantHarness h;
    auto created = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(created.is_ok());
    const auto db = created.value().database_name;

    h.cluster->drop_table(db, "attendance");
    auto report = h.orchestrator->repair_tenant_schema(db);
    REQUIRE(report.is_ok());
    CHECK(report.value().tables_added == std::vector<std::string>{"attendance"});
    CHECK(h.cluster->has_table(db, "attendance"));
}
