#include "schema/schema_module.hpp"

#include <format>

namespace tenantcore {

namespace {

std::string index_suffix(std::string_view columns) {
    std::string out;
    for (const char c : columns) {
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_') {
            out += c;
        } else if (c == ',' && (out.empty() || out.back() != '_')) {
            out += '_';
        }
    }
    return out;
}

} // namespace

SchemaModuleBuilder::SchemaModuleBuilder(std::string name, std::string description) {
    module_.name = std::move(name);
    module_.description = std::move(description);
}

SchemaModuleBuilder& SchemaModuleBuilder::table(std::string_view name, std::string_view body) {
    module_.tables.emplace_back(name);
    module_.statements.push_back(std::format(
        "CREATE TABLE IF NOT EXISTS public.{} (\n"
        "  id UUID PRIMARY KEY DEFAULT uuid_generate_v4(),\n"
        "  {},\n"
        "  created_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),\n"
        "  updated_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()\n"
        ")", name, body));
    return updated_at_trigger(name);
}

SchemaModuleBuilder& SchemaModuleBuilder::raw_table(std::string_view name, std::string_view body) {
    module_.tables.emplace_back(name);
    module_.statements.push_back(std::format(
        "CREATE TABLE IF NOT EXISTS public.{} (\n  {}\n)", name, body));
    return *this;
}

SchemaModuleBuilder& SchemaModuleBuilder::column(std::string_view table, std::string_view column,
                                                 std::string_view type) {
    module_.statements.push_back(std::format(
        "ALTER TABLE public.{} ADD COLUMN IF NOT EXISTS {} {}", table, column, type));
    return *this;
}

SchemaModuleBuilder& SchemaModuleBuilder::index(std::string_view table, std::string_view columns) {
    module_.statements.push_back(std::format(
        "CREATE INDEX IF NOT EXISTS idx_{}_{} ON public.{} ({})",
        table, index_suffix(columns), table, columns));
    return *this;
}

SchemaModuleBuilder& SchemaModuleBuilder::unique_index(std::string_view table, std::string_view columns) {
    module_.statements.push_back(std::format(
        "CREATE UNIQUE INDEX IF NOT EXISTS uq_{}_{} ON public.{} ({})",
        table, index_suffix(columns), table, columns));
    return *this;
}

SchemaModuleBuilder& SchemaModuleBuilder::updated_at_trigger(std::string_view table) {
    module_.statements.push_back(std::format(
        "DO $$\n"
        "BEGIN\n"
        "  IF NOT EXISTS (SELECT 1 FROM pg_trigger WHERE tgname = 'update_{0}_updated_at') THEN\n"
        "    CREATE TRIGGER update_{0}_updated_at BEFORE UPDATE ON public.{0}\n"
        "      FOR EACH ROW EXECUTE FUNCTION public.update_updated_at_column();\n"
        "  END IF;\n"
        "END $$", table));
    return *this;
}

SchemaModuleBuilder& SchemaModuleBuilder::statement(std::string sql) {
    module_.statements.push_back(std::move(sql));
    return *this;
}

SchemaModule SchemaModuleBuilder::build() {
    return std::move(module_);
}

namespace schema_modules {

std::vector<SchemaModule> all() {
    std::vector<SchemaModule> modules;
    modules.reserve(27);
    modules.push_back(shared_functions());
    modules.push_back(versioning());
    modules.push_back(auth());
    modules.push_back(agencies());
    modules.push_back(departments());
    modules.push_back(hr());
    modules.push_back(clients_financial());
    modules.push_back(projects_tasks());
    modules.push_back(crm());
    modules.push_back(crm_enhancements());
    modules.push_back(gst());
    modules.push_back(reimbursement());
    modules.push_back(inventory());
    modules.push_back(procurement());
    modules.push_back(financial());
    modules.push_back(reporting());
    modules.push_back(webhooks());
    modules.push_back(project_enhancements());
    modules.push_back(sso());
    modules.push_back(session_management());
    modules.push_back(misc());
    modules.push_back(messaging());
    modules.push_back(slack());
    modules.push_back(asset_management());
    modules.push_back(workflow());
    modules.push_back(integration_hub());
    modules.push_back(indexes_and_fixes());
    return modules;
}

} // namespace schema_modules

} // namespace tenantcore
