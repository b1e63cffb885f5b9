#include <catch2/catch_test_macros.hpp>
#include "tenant/tenant_directory.hpp"
#include "tenant/provisioning_orchestrator.hpp"
#include "mocks/tenant_harness.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace tenantcore;
using namespace tenantcore::testing;

namespace {

constexpr const char* kMainDb = "tenantcore";
constexpr const char* kTenantId = "0f0e0d0c-0b0a-4908-8706-050403020100";
constexpr const char* kPageA = "aaaaaaaa-0000-4000-8000-000000000001";
constexpr const char* kPageB = "aaaaaaaa-0000-4000-8000-000000000002";

struct DirectoryFixture {
    TenantHarness h;
    std::shared_ptr<PgTenantDirectory> directory =
        std::make_shared<PgTenantDirectory>(h.registry, kMainDb);
};

TenantRecord acme_record() {
    return TenantRecord{
        .id = kTenantId,
        .name = "Acme Studio",
        .domain = "acme.example.com",
        .database_name = "agency_acme_0f0e0d0c",
        .owner_user_id = "",
        .subscription_plan = "starter",
        .max_users = 5,
        .is_active = true,
        .created_at = {},
    };
}

std::optional<FakeCluster::Statement> last_statement(const FakeCluster& cluster,
                                                     const std::string& sql_contains) {
    std::optional<FakeCluster::Statement> found;
    for (const auto& s : cluster.statements()) {
        if (s.sql.find(sql_contains) != std::string::npos) found = s;
    }
    return found;
}

} // namespace

// ---------------------------------------------------------------------------
// Central schema
// ---------------------------------------------------------------------------

TEST_CASE("PgTenantDirectory: first call creates the central tables once", "[directory]") {
    DirectoryFixture f;
    f.h.cluster->set_strict_tables(kMainDb, true);

    REQUIRE(f.directory->find_by_domain("acme.example.com").is_ok());
    REQUIRE(f.directory->find_by_database_name("agency_acme_0f0e0d0c").is_ok());

    for (const char* table : {"agencies", "agency_settings", "page_catalog", "agency_page_assignments"}) {
        INFO("table: " << table);
        CHECK(f.h.cluster->has_table(kMainDb, table));
    }
    CHECK(f.h.cluster->count_statements("CREATE TABLE IF NOT EXISTS public.agencies", kMainDb) == 1);
    CHECK(f.h.cluster->count_statements("ADD CONSTRAINT agencies_domain_key UNIQUE (domain)", kMainDb) == 1);
}

TEST_CASE("PgTenantDirectory: a failed central schema is retried on the next call", "[directory]") {
    DirectoryFixture f;
    f.h.cluster->fail_when("CREATE TABLE IF NOT EXISTS public.agencies", "42501", "permission denied", 1);

    auto first = f.directory->find_by_domain("acme.example.com");
    REQUIRE(first.is_error());
    CHECK(first.error_code() == ErrorCode::QUERY_FAILED);
    CHECK(first.error_context() == "42501");
    CHECK(f.h.cluster->count_statements("WHERE domain = $1", kMainDb) == 0);

    REQUIRE(f.directory->find_by_domain("acme.example.com").is_ok());
    CHECK(f.h.cluster->count_statements("CREATE TABLE IF NOT EXISTS public.agencies", kMainDb) == 2);
}

// ---------------------------------------------------------------------------
// Lookups
// ---------------------------------------------------------------------------

TEST_CASE("PgTenantDirectory: domain lookup binds the subdomain prefix", "[directory]") {
    DirectoryFixture f;
    REQUIRE(f.directory->find_by_domain("acme.example.com").is_ok());

    const auto lookup = last_statement(*f.h.cluster, "WHERE domain = $1");
    REQUIRE(lookup.has_value());
    REQUIRE(lookup->params.size() == 2);
    CHECK(lookup->params[0] == std::optional<std::string>("acme"));
    CHECK(lookup->params[1] == std::optional<std::string>("acme.%"));
}

TEST_CASE("PgTenantDirectory: LIKE wildcards in the prefix are escaped", "[directory]") {
    DirectoryFixture f;
    REQUIRE(f.directory->find_by_domain("my_co.example.com").is_ok());

    const auto lookup = last_statement(*f.h.cluster, "WHERE domain = $1");
    REQUIRE(lookup.has_value());
    CHECK(lookup->params[0] == std::optional<std::string>("my_co"));
    CHECK(lookup->params[1] == std::optional<std::string>("my\\_co.%"));
}

TEST_CASE("PgTenantDirectory: rows map onto TenantRecord", "[directory]") {
    DirectoryFixture f;
    f.h.cluster->respond_when("WHERE domain = $1", {{
        kTenantId, "Acme Studio", "acme", "agency_acme_0f0e0d0c",
        "11111111-2222-4333-8444-555555555555", "enterprise", "100", "t", "2024-01-01 00:00:00+00",
    }});

    auto found = f.directory->find_by_domain("acme.example.com");
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    const auto& t = *found.value();
    CHECK(t.id == kTenantId);
    CHECK(t.domain == "acme");
    CHECK(t.database_name == "agency_acme_0f0e0d0c");
    CHECK(t.subscription_plan == "enterprise");
    CHECK(t.max_users == 100);
    CHECK(t.is_active);
}

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

TEST_CASE("PgTenantDirectory: commit writes the record and mirrored settings in one transaction",
          "[directory]") {
    DirectoryFixture f;
    f.h.cluster->set_strict_tables(kMainDb, true);

    OnboardingMetadata meta;
    meta.industry = "design";
    meta.enable_gst = true;
    meta.address_text = "12 Main St, Springfield, IL 62701, USA";

    REQUIRE(f.directory->commit_tenant(acme_record(), meta).is_ok());

    const auto agency = last_statement(*f.h.cluster, "INSERT INTO public.agencies");
    REQUIRE(agency.has_value());
    CHECK(agency->params[2] == std::optional<std::string>("acme.example.com"));
    // empty owner goes out as NULL
    CHECK_FALSE(agency->params[4].has_value());
    CHECK(agency->params[6] == std::optional<std::string>("5"));

    const auto settings = last_statement(*f.h.cluster, "INSERT INTO public.agency_settings");
    REQUIRE(settings.has_value());
    REQUIRE(settings->params.size() == 13);
    CHECK(settings->params[0] == std::optional<std::string>(kTenantId));
    CHECK(settings->params[3] == std::optional<std::string>("true"));
    CHECK(settings->params[4]->find("\"industry\":\"design\"") != std::string::npos);
    CHECK(settings->params[8] == std::optional<std::string>("Springfield"));

    CHECK(f.h.cluster->count_statements("COMMIT", kMainDb) == 1);
    CHECK(f.h.cluster->count_statements("ROLLBACK", kMainDb) == 0);
}

TEST_CASE("PgTenantDirectory: a taken domain is DOMAIN_CONFLICT and nothing is written",
          "[directory]") {
    DirectoryFixture f;
    f.h.cluster->fail_when("INSERT INTO public.agencies", "23505",
        "duplicate key value violates unique constraint \"agencies_domain_key\"");

    auto r = f.directory->commit_tenant(acme_record(), OnboardingMetadata{});
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::DOMAIN_CONFLICT);
    CHECK(f.h.cluster->count_statements("INSERT INTO public.agency_settings", kMainDb) == 0);
    CHECK(f.h.cluster->count_statements("ROLLBACK", kMainDb) == 1);
    CHECK(f.h.cluster->count_statements("COMMIT", kMainDb) == 0);
}

TEST_CASE("PgTenantDirectory: other unique violations stay query failures", "[directory]") {
    DirectoryFixture f;
    f.h.cluster->fail_when("INSERT INTO public.agencies", "23505",
        "duplicate key value violates unique constraint \"agencies_database_name_key\"");

    auto r = f.directory->commit_tenant(acme_record(), OnboardingMetadata{});
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::QUERY_FAILED);
    CHECK(r.error_context() == "23505");
}

// ---------------------------------------------------------------------------
// Pages and delete
// ---------------------------------------------------------------------------

TEST_CASE("PgTenantDirectory: explicit page ids are filtered before the catalog query",
          "[directory]") {
    DirectoryFixture f;
    f.h.cluster->respond_when("FROM public.page_catalog WHERE id = ANY", {{kPageA}, {kPageB}});

    auto assigned = f.directory->assign_default_pages(kTenantId, {kPageA, "'; DROP TABLE x; --", kPageB});
    REQUIRE(assigned.is_ok());
    CHECK(assigned.value() == 2);

    const auto catalog = last_statement(*f.h.cluster, "FROM public.page_catalog");
    REQUIRE(catalog.has_value());
    CHECK(catalog->params[0] == std::optional<std::string>(std::string("{") + kPageA + "," + kPageB + "}"));
    CHECK(f.h.cluster->count_statements("INSERT INTO public.agency_page_assignments", kMainDb) == 2);
}

TEST_CASE("PgTenantDirectory: only malformed page ids assign nothing", "[directory]") {
    DirectoryFixture f;
    auto assigned = f.directory->assign_default_pages(kTenantId, {"home", "42"});
    REQUIRE(assigned.is_ok());
    CHECK(assigned.value() == 0);
    CHECK(f.h.cluster->count_statements("FROM public.page_catalog", kMainDb) == 0);
}

TEST_CASE("PgTenantDirectory: no page ids means every active page", "[directory]") {
    DirectoryFixture f;
    f.h.cluster->respond_when("FROM public.page_catalog WHERE is_active = true", {{kPageA}, {kPageB}});

    auto assigned = f.directory->assign_default_pages(kTenantId, {});
    REQUIRE(assigned.is_ok());
    CHECK(assigned.value() == 2);
}

TEST_CASE("PgTenantDirectory: delete removes dependants before the record", "[directory]") {
    DirectoryFixture f;
    REQUIRE(f.directory->delete_tenant_record(kTenantId).is_ok());

    std::vector<std::string> deletes;
    for (const auto& s : f.h.cluster->statements()) {
        if (s.sql.starts_with("DELETE FROM public.")) {
            REQUIRE(s.params.size() == 1);
            CHECK(s.params[0] == std::optional<std::string>(kTenantId));
            deletes.push_back(s.sql);
        }
    }
    REQUIRE(deletes.size() == 3);
    CHECK(deletes.back().starts_with("DELETE FROM public.agencies "));
    CHECK(f.h.cluster->count_statements("COMMIT", kMainDb) == 1);
}

TEST_CASE("PgTenantDirectory: deleting an unknown tenant is NOT_FOUND", "[directory]") {
    DirectoryFixture f;
    DbResultSet none;
    none.success = true;
    none.affected_rows = 0;
    f.h.cluster->add_rule(FakeCluster::Rule{
        .sql_contains = "DELETE FROM public.agencies ",
        .param_contains = {},
        .database = kMainDb,
        .response = none,
        .remaining = -1,
    });

    auto r = f.directory->delete_tenant_record(kTenantId);
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::NOT_FOUND);
    CHECK(f.h.cluster->count_statements("ROLLBACK", kMainDb) == 1);
}

// ---------------------------------------------------------------------------
// With the orchestrator
// ---------------------------------------------------------------------------

TEST_CASE("PgTenantDirectory: provisioning works on an empty central database", "[directory]") {
    DirectoryFixture f;
    f.h.cluster->set_strict_tables(kMainDb, true);
    ProvisioningOrchestrator orchestrator(ProvisioningOrchestrator::Config{},
        f.h.admin, f.h.registry, f.h.engine, f.directory);

    auto r = orchestrator.create_tenant(TenantHarness::request("acme.example.com"));
    REQUIRE(r.is_ok());
    CHECK_FALSE(r.value().reused_existing);
    CHECK(f.h.cluster->has_table(kMainDb, "agencies"));
    CHECK(f.h.cluster->has_database(r.value().database_name));
}
