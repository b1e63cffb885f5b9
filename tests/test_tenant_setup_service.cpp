#include <catch2/catch_test_macros.hpp>
#include "tenant/tenant_setup_service.hpp"
#include "mocks/tenant_harness.hpp"

#include <nlohmann/json.hpp>

using namespace tenantcore;
using tenantcore::testing::TenantHarness;

namespace {

/**
 * @brief Deterministic hasher so tests do not pay for PBKDF2 rounds
 */
class PlainHasher : public IPasswordHasher {
public:
    Result<std::string> hash(std::string_view password) override {
        ++calls;
        return Result<std::string>::ok("plain$" + std::string(password));
    }
    int calls = 0;
};

struct SetupFixture {
    TenantHarness h;
    std::shared_ptr<PlainHasher> hasher = std::make_shared<PlainHasher>();
    TenantSetupService service{h.registry, h.directory, h.engine, hasher};
    std::string database;

    SetupFixture() {
        auto created = h.orchestrator->create_tenant(TenantHarness::request("acme.example.com"));
        REQUIRE(created.is_ok());
        database = created.value().database_name;
    }
};

TeamMemberSpec member(const std::string& name, const std::string& email,
                      std::optional<std::string> department = std::nullopt) {
    return TeamMemberSpec{
        .name = name,
        .email = email,
        .phone = std::nullopt,
        .department = std::move(department),
        .title = std::string("Designer"),
    };
}

} // namespace

// ---------------------------------------------------------------------------
// complete_tenant_setup
// ---------------------------------------------------------------------------

TEST_CASE("TenantSetup: settings, departments and members commit together", "[setup]") {
    SetupFixture f;
    ExtendedSettings s;
    s.company_name = "Acme Studio Pvt Ltd";
    s.enable_gst = true;
    s.departments = {{"Design", "Visual work"}, {"Ops", ""}};
    s.team_members = {member("Grace Hopper", "Grace@Acme.example.com", "Design"),
                      member("Alan Turing", "alan@acme.example.com")};

    auto r = f.service.complete_tenant_setup(f.database, s);
    REQUIRE(r.is_ok());
    const auto& manifest = r.value();

    REQUIRE(manifest.created.size() == 2);
    CHECK(manifest.failed.empty());
    CHECK(manifest.skipped.empty());
    CHECK(manifest.created[0].email == "grace@acme.example.com");
    CHECK(manifest.created[0].role == TenantSetupService::kMemberRole);
    CHECK(manifest.created[0].employee_id == "EMP-0001");
    CHECK(manifest.created[1].employee_id == "EMP-0002");
    CHECK(manifest.created[0].temporary_password.size() == Credentials::kTemporaryPasswordLength);
    CHECK(f.hasher->calls == 2);

    CHECK(f.h.cluster->count_statements("INSERT INTO public.departments", f.database) == 2);
    CHECK(f.h.cluster->count_statements("setup_complete = true", f.database) == 1);
    CHECK(f.h.cluster->count_statements("RELEASE SAVEPOINT", f.database) == 2);

    // the hash, never the password, reaches the database
    for (const auto& st : f.h.cluster->statements()) {
        for (const auto& p : st.params) {
            if (p) CHECK(*p != manifest.created[0].temporary_password);
        }
    }
}

TEST_CASE("TenantSetup: one failing member is rolled back and reported", "[setup]") {
    SetupFixture f;
    f.h.cluster->fail_when("INSERT INTO public.users", "23505",
                           "duplicate key value violates unique constraint", -1, "bob@");

    ExtendedSettings s;
    s.team_members = {member("Ann Lee", "ann@acme.example.com"),
                      member("Bob Ray", "bob@acme.example.com"),
                      member("Cid Moe", "cid@acme.example.com")};

    auto r = f.service.complete_tenant_setup(f.database, s);
    REQUIRE(r.is_ok());
    const auto& manifest = r.value();

    REQUIRE(manifest.created.size() == 2);
    REQUIRE(manifest.failed.size() == 1);
    CHECK(manifest.failed[0].email == "bob@acme.example.com");
    CHECK(manifest.failed[0].code == ErrorCode::PARTIAL_TEAM_MEMBER_FAILURE);
    CHECK(manifest.failed[0].message.find("duplicate key") != std::string::npos);

    // numbers are not burned by the failed member
    CHECK(manifest.created[0].employee_id == "EMP-0001");
    CHECK(manifest.created[1].employee_id == "EMP-0002");

    CHECK(f.h.cluster->count_statements("ROLLBACK TO SAVEPOINT \"team_member_1\"", f.database) == 1);
    CHECK(f.h.cluster->count_statements("COMMIT", f.database) == 2);  // provisioning + setup
}

TEST_CASE("TenantSetup: existing accounts are skipped", "[setup]") {
    SetupFixture f;
    f.h.cluster->respond_when("FROM public.users WHERE lower(email)",
                              {{"00000000-0000-4000-8000-000000000001"}}, "dup@");

    ExtendedSettings s;
    s.team_members = {member("Dup User", "DUP@acme.example.com"),
                      member("New User", "new@acme.example.com")};

    auto r = f.service.complete_tenant_setup(f.database, s);
    REQUIRE(r.is_ok());
    CHECK(r.value().skipped == std::vector<std::string>{"dup@acme.example.com"});
    CHECK(r.value().created.size() == 1);
}

TEST_CASE("TenantSetup: members without name or email fail validation", "[setup]") {
    SetupFixture f;
    ExtendedSettings s;
    s.team_members = {member("", "nobody@acme.example.com"), member("No Mail", "  ")};

    auto r = f.service.complete_tenant_setup(f.database, s);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().failed.size() == 2);
    CHECK(r.value().failed[0].code == ErrorCode::INVALID_ARGUMENT);
    CHECK(f.h.cluster->count_statements("SAVEPOINT", f.database) == 0);
}

TEST_CASE("TenantSetup: taken employee numbers are skipped", "[setup]") {
    SetupFixture f;
    f.h.cluster->respond_when("WHERE employee_id = $1", {{"1"}}, "EMP-0001");

    ExtendedSettings s;
    s.team_members = {member("Ann Lee", "ann@acme.example.com")};

    auto r = f.service.complete_tenant_setup(f.database, s);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().created.size() == 1);
    CHECK(r.value().created[0].employee_id == "EMP-0002");
}

TEST_CASE("TenantSetup: member in a known department gets a team assignment", "[setup]") {
    SetupFixture f;
    f.h.cluster->respond_when("FROM public.departments WHERE name", {{"00000000-0000-4000-8000-0000000000d1"}},
                              "Design");

    ExtendedSettings s;
    s.team_members = {member("Ann Lee", "ann@acme.example.com", "Design"),
                      member("Bo Chen", "bo@acme.example.com", "Unknown")};

    auto r = f.service.complete_tenant_setup(f.database, s);
    REQUIRE(r.is_ok());
    CHECK(f.h.cluster->count_statements("INSERT INTO public.team_assignments", f.database) == 1);
}

TEST_CASE("TenantSetup: settings failure rolls back everything", "[setup]") {
    SetupFixture f;
    f.h.cluster->fail_when("UPDATE public.agency_settings", "22P02", "invalid input syntax");

    ExtendedSettings s;
    s.team_members = {member("Ann Lee", "ann@acme.example.com")};

    auto r = f.service.complete_tenant_setup(f.database, s);
    REQUIRE(r.is_error());
    CHECK(r.error_context() == "22P02");
    CHECK(f.h.cluster->count_statements("INSERT INTO public.users (email", f.database) == 0);
}

TEST_CASE("TenantSetup: unknown tenant database", "[setup]") {
    SetupFixture f;
    auto r = f.service.complete_tenant_setup("agency_other_00000000", {});
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::NOT_FOUND);

    auto bad = f.service.complete_tenant_setup("bad name", {});
    REQUIRE(bad.is_error());
    CHECK(bad.error_code() == ErrorCode::INVALID_IDENTIFIER);
}

TEST_CASE("TenantSetup: is_setup_complete reads the flag", "[setup]") {
    SetupFixture f;
    CHECK_FALSE(f.service.is_setup_complete(f.database).value());

    f.h.cluster->respond_when("bool_or(setup_complete)", {{"t"}});
    CHECK(f.service.is_setup_complete(f.database).value());
}

TEST_CASE("TenantSetup: missing settings table reads as incomplete", "[setup]") {
    SetupFixture f;
    f.h.cluster->fail_when("bool_or(setup_complete)", "42P01", "relation does not exist");
    auto r = f.service.is_setup_complete(f.database);
    REQUIRE(r.is_ok());
    CHECK_FALSE(r.value());
}

// ---------------------------------------------------------------------------
// Manifest and JSON
// ---------------------------------------------------------------------------

TEST_CASE("TenantSetup: credentials CSV quotes fields", "[setup][csv]") {
    TeamCredentialsManifest m;
    CHECK(m.to_csv().empty());

    m.created.push_back({"Lee, Ann", "ann@x.com", "admin", "Design", "EMP-0001", "pa\"ss"});
    const auto csv = m.to_csv();
    CHECK(csv.starts_with("Name,Email,Role,Department,Employee ID,Temporary Password\n"));
    CHECK(csv.find("\"Lee, Ann\"") != std::string::npos);
    CHECK(csv.find("\"pa\"\"ss\"") != std::string::npos);
}

TEST_CASE("TenantSetup: settings parse from JSON", "[setup][json]") {
    const auto j = nlohmann::json::parse(R"({
        "company_name": "Acme",
        "founded_year": 2019,
        "enable_gst": true,
        "address": {"street": "1 Main St", "city": "Pune", "zip": "411001"},
        "social_links": {"linkedin": "https://linkedin.com/acme", "x": ""},
        "departments": [{"name": "Design", "description": "Visual"}],
        "team_members": [{"name": "Ann", "email": "ann@acme.com", "department": "Design"}]
    })");

    auto r = extended_settings_from_json(j);
    REQUIRE(r.is_ok());
    const auto& s = r.value();
    CHECK(s.company_name == "Acme");
    CHECK(s.founded_year == "2019");
    CHECK(s.enable_gst == true);
    REQUIRE(s.address.has_value());
    CHECK(s.address->city == "Pune");
    CHECK(s.social_links.size() == 1);
    REQUIRE(s.departments.size() == 1);
    CHECK(s.departments[0].description == "Visual");
    REQUIRE(s.team_members.size() == 1);
    CHECK(s.team_members[0].department == "Design");
    CHECK_FALSE(s.team_members[0].phone.has_value());
}

TEST_CASE("TenantSetup: address text and non-object input", "[setup][json]") {
    auto text = extended_settings_from_json(nlohmann::json{{"address", "1 A St, B, C"}});
    REQUIRE(text.is_ok());
    CHECK(text.value().address_text == "1 A St, B, C");
    CHECK_FALSE(text.value().address.has_value());

    auto bad = extended_settings_from_json(nlohmann::json::array());
    REQUIRE(bad.is_error());
    CHECK(bad.error_code() == ErrorCode::INVALID_ARGUMENT);
}
