#include <catch2/catch_test_macros.hpp>
#include "schema/schema_module_registry.hpp"

#include <set>

using namespace tenantcore;

TEST_CASE("SchemaModuleRegistry: built-in modules map their tables", "[schema]") {
    const auto& registry = SchemaModuleRegistry::instance();

    CHECK(registry.module_for_table("users") == "auth");
    CHECK(registry.module_for_table("agency_settings") == "agencies");
    CHECK(registry.module_for_table("attendance") == "hr");
    CHECK(registry.module_for_table("user_sessions") == "session_management");
    CHECK(registry.module_for_table("clients") == "clients_financial");
}

TEST_CASE("SchemaModuleRegistry: lookups are exact after normalization", "[schema]") {
    const auto& registry = SchemaModuleRegistry::instance();

    CHECK(registry.module_for_table("public.users") == "auth");
    CHECK(registry.module_for_table("\"public\".\"USERS\"") == "auth");
    CHECK_FALSE(registry.module_for_table("user").has_value());
    CHECK_FALSE(registry.module_for_table("users_archive").has_value());
    CHECK_FALSE(registry.module_for_table("").has_value());
}

TEST_CASE("SchemaModuleRegistry: normalize_relation", "[schema]") {
    CHECK(SchemaModuleRegistry::normalize_relation(" Public.Clients ") == "clients");
    CHECK(SchemaModuleRegistry::normalize_relation("\"invoices\"") == "invoices");
    CHECK(SchemaModuleRegistry::normalize_relation("audit_logs") == "audit_logs");
}

TEST_CASE("SchemaModuleRegistry: module order starts with shared functions", "[schema]") {
    const auto& modules = SchemaModuleRegistry::instance().modules();
    REQUIRE(modules.size() >= 20);
    CHECK(modules.front().name == "shared_functions");
    CHECK(SchemaModuleRegistry::instance().find("versioning") != nullptr);
    CHECK(SchemaModuleRegistry::instance().find("nope") == nullptr);

    std::set<std::string> names;
    for (const auto& m : modules) {
        CHECK(names.insert(m.name).second);
        CHECK_FALSE(m.statements.empty());
    }
}

TEST_CASE("SchemaModuleRegistry: every statement is idempotent DDL", "[schema]") {
    for (const auto& m : SchemaModuleRegistry::instance().modules()) {
        for (const auto& sql : m.statements) {
            INFO(m.name << ": " << sql.substr(0, 80));
            const bool guarded = sql.find("IF NOT EXISTS") != std::string::npos ||
                                 sql.find("CREATE OR REPLACE") != std::string::npos ||
                                 sql.starts_with("DO $$");
            CHECK(guarded);
            CHECK(sql.find("DROP TABLE") == std::string::npos);
        }
    }
}

TEST_CASE("SchemaModuleRegistry: first module to declare a table owns it", "[schema]") {
    auto first = SchemaModuleBuilder("first", "")
        .raw_table("shared_thing", "id INT")
        .build();
    auto second = SchemaModuleBuilder("second", "")
        .raw_table("shared_thing", "id INT")
        .raw_table("own_thing", "id INT")
        .build();

    SchemaModuleRegistry registry({first, second});
    CHECK(registry.module_for_table("shared_thing") == "first");
    CHECK(registry.module_for_table("own_thing") == "second");

    const auto tables = registry.all_tables();
    REQUIRE(tables.size() == 2);
    CHECK(tables[0] == "shared_thing");
    CHECK(tables[1] == "own_thing");
}

TEST_CASE("SchemaModuleBuilder: table adds audit columns and trigger", "[schema]") {
    const auto module = SchemaModuleBuilder("demo", "Demo")
        .table("widgets", "name TEXT NOT NULL")
        .index("widgets", "name")
        .build();

    REQUIRE(module.tables == std::vector<std::string>{"widgets"});
    REQUIRE(module.statements.size() == 3);
    CHECK(module.statements[0].starts_with("CREATE TABLE IF NOT EXISTS public.widgets ("));
    CHECK(module.statements[0].find("updated_at") != std::string::npos);
    CHECK(module.statements[1].find("update_widgets_updated_at") != std::string::npos);
    CHECK(module.statements[2] == "CREATE INDEX IF NOT EXISTS idx_widgets_name ON public.widgets (name)");
}
