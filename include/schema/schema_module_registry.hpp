#pragma once

#include "schema/schema_module.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tenantcore {

/**
 * @brief Static lookup from table name to the module that creates it
 *
 * Built once from schema_modules::all(). Lookups are exact (case-folded,
 * "public." prefix stripped); no substring or heuristic matching. When two
 * modules declare the same table the earlier module in dependency order
 * owns it.
 */
class SchemaModuleRegistry {
public:
    SchemaModuleRegistry();
    explicit SchemaModuleRegistry(std::vector<SchemaModule> modules);

    /**
     * @brief Process-wide registry over the built-in modules
     */
    static const SchemaModuleRegistry& instance();

    [[nodiscard]] const SchemaModule* find(std::string_view module_name) const;

    /**
     * @brief Module that owns a table, or nullopt for an unknown relation
     */
    [[nodiscard]] std::optional<std::string> module_for_table(std::string_view table) const;

    [[nodiscard]] const std::vector<SchemaModule>& modules() const { return modules_; }

    /**
     * @brief Every declared table, in module order
     */
    [[nodiscard]] std::vector<std::string> all_tables() const;

    /**
     * @brief Strip schema qualifier and quotes, lowercase
     */
    static std::string normalize_relation(std::string_view relation);

private:
    std::vector<SchemaModule> modules_;
    std::unordered_map<std::string, size_t> by_name_;
    std::unordered_map<std::string, std::string> table_owner_;
};

} // namespace tenantcore
