#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tenantcore {

/**
 * @brief One named, idempotent unit of tenant DDL
 *
 * Every statement is of the CREATE ... IF NOT EXISTS / ADD COLUMN IF NOT
 * EXISTS / guarded DO-block family: applying a module any number of times
 * converges to the same schema and never drops data.
 */
struct SchemaModule {
    std::string name;
    std::string description;
    std::vector<std::string> tables;       // tables this module guarantees
    std::vector<std::string> statements;   // applied in order
};

/**
 * @brief Builds a SchemaModule's statements with the conventions every
 *        tenant table shares (uuid id, created_at/updated_at, trigger)
 */
class SchemaModuleBuilder {
public:
    SchemaModuleBuilder(std::string name, std::string description);

    /**
     * @brief Table with id/created_at/updated_at added around body
     */
    SchemaModuleBuilder& table(std::string_view name, std::string_view body);

    /**
     * @brief Table whose full column list is given verbatim (no trigger)
     */
    SchemaModuleBuilder& raw_table(std::string_view name, std::string_view body);

    SchemaModuleBuilder& column(std::string_view table, std::string_view column,
                                std::string_view type);
    SchemaModuleBuilder& index(std::string_view table, std::string_view columns);
    SchemaModuleBuilder& unique_index(std::string_view table, std::string_view columns);
    SchemaModuleBuilder& updated_at_trigger(std::string_view table);
    SchemaModuleBuilder& statement(std::string sql);

    [[nodiscard]] SchemaModule build();

private:
    SchemaModule module_;
};

namespace schema_modules {

/// Version recorded in schema_info after a full ensure.
inline constexpr std::string_view kSchemaVersion = "1.0.0";

SchemaModule shared_functions();
SchemaModule versioning();
SchemaModule auth();
SchemaModule agencies();
SchemaModule departments();
SchemaModule hr();
SchemaModule clients_financial();
SchemaModule projects_tasks();
SchemaModule crm();
SchemaModule crm_enhancements();
SchemaModule gst();
SchemaModule reimbursement();
SchemaModule inventory();
SchemaModule procurement();
SchemaModule financial();
SchemaModule reporting();
SchemaModule webhooks();
SchemaModule project_enhancements();
SchemaModule sso();
SchemaModule session_management();
SchemaModule misc();
SchemaModule messaging();
SchemaModule slack();
SchemaModule asset_management();
SchemaModule workflow();
SchemaModule integration_hub();
SchemaModule indexes_and_fixes();

/**
 * @brief Every module, in dependency order
 */
std::vector<SchemaModule> all();

} // namespace schema_modules

} // namespace tenantcore
