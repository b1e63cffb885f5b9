#include "schema/schema_module_registry.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantcore {

SchemaModuleRegistry::SchemaModuleRegistry()
    : SchemaModuleRegistry(schema_modules::all()) {}

SchemaModuleRegistry::SchemaModuleRegistry(std::vector<SchemaModule> modules)
    : modules_(std::move(modules)) {
    for (size_t i = 0; i < modules_.size(); ++i) {
        const auto& module = modules_[i];
        by_name_.emplace(module.name, i);
        for (const auto& table : module.tables) {
            const auto [it, inserted] = table_owner_.emplace(normalize_relation(table), module.name);
            if (!inserted) {
                utils::log::warn(std::format("Table '{}' declared by both '{}' and '{}'; keeping '{}'",
                    table, it->second, module.name, it->second));
            }
        }
    }
}

const SchemaModuleRegistry& SchemaModuleRegistry::instance() {
    static const SchemaModuleRegistry registry;
    return registry;
}

const SchemaModule* SchemaModuleRegistry::find(std::string_view module_name) const {
    const auto it = by_name_.find(std::string(module_name));
    return it == by_name_.end() ? nullptr : &modules_[it->second];
}

std::optional<std::string> SchemaModuleRegistry::module_for_table(std::string_view table) const {
    const auto it = table_owner_.find(normalize_relation(table));
    if (it == table_owner_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> SchemaModuleRegistry::all_tables() const {
    std::vector<std::string> tables;
    tables.reserve(table_owner_.size());
    for (const auto& module : modules_) {
        for (const auto& table : module.tables) {
            const auto owner = table_owner_.find(normalize_relation(table));
            if (owner != table_owner_.end() && owner->second == module.name) {
                tables.push_back(table);
            }
        }
    }
    return tables;
}

std::string SchemaModuleRegistry::normalize_relation(std::string_view relation) {
    std::string out;
    out.reserve(relation.size());
    for (const char c : relation) {
        if (c != '"') out += c;
    }
    out = utils::to_lower(utils::trim(out));
    if (out.starts_with("public.")) {
        out.erase(0, 7);
    }
    return out;
}

} // namespace tenantcore
