#include <catch2/catch_test_macros.hpp>
#include "tenant/tenant_record.hpp"

using namespace tenantcore;

TEST_CASE("TenantRecord: parse_address with zip and country", "[tenant][address]") {
    const auto a = parse_address("12 Main St, Springfield, IL 62701, USA");
    CHECK(a.street == "12 Main St");
    CHECK(a.city == "Springfield");
    CHECK(a.state == "IL");
    CHECK(a.zip == "62701");
    CHECK(a.country == "USA");
}

TEST_CASE("TenantRecord: parse_address without zip", "[tenant][address]") {
    const auto a = parse_address("4 Park Road, Pune, Maharashtra, India");
    CHECK(a.street == "4 Park Road");
    CHECK(a.city == "Pune");
    CHECK(a.state == "Maharashtra");
    CHECK_FALSE(a.zip.has_value());
    CHECK(a.country == "India");
}

TEST_CASE("TenantRecord: unstructured address becomes the street", "[tenant][address]") {
    const auto a = parse_address("  Somewhere near the river ");
    CHECK(a.street == "Somewhere near the river");
    CHECK_FALSE(a.city.has_value());

    const auto blank = parse_address("   ");
    CHECK_FALSE(blank.street.has_value());
}

TEST_CASE("TenantRecord: structured address wins over text", "[tenant][address]") {
    OnboardingMetadata m;
    m.address_text = "1 A St, B, C";
    CHECK(m.resolved_address().city == "B");

    m.address = Address{.street = "Given", .city = "Town", .state = {}, .zip = {}, .country = {}};
    CHECK(m.resolved_address().street == "Given");
    CHECK(m.resolved_address().city == "Town");
}

TEST_CASE("TenantRecord: plan ceilings", "[tenant]") {
    CHECK(max_users_for_plan("starter") == 5);
    CHECK(max_users_for_plan("Professional") == 25);
    CHECK(max_users_for_plan("enterprise") == 1000);
    CHECK(max_users_for_plan("custom") == 25);
}

TEST_CASE("TenantRecord: from_existing marks reuse", "[tenant]") {
    TenantRecord r;
    r.id = "t-1";
    r.database_name = "agency_acme_1a2b3c4d";
    r.owner_user_id = "u-1";
    r.subscription_plan = "starter";
    r.max_users = 5;

    const auto p = ProvisionedTenant::from_existing(r, true);
    CHECK(p.tenant_id == "t-1");
    CHECK(p.admin_user_id == "u-1");
    CHECK(p.reused_existing);
    CHECK(p.domain_conflict_resolved);
    CHECK(p.max_users == 5);
}
