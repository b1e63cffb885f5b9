#include "tenant/tenant_record.hpp"
#include "core/utils.hpp"

#include <regex>

namespace tenantcore {

namespace {

std::optional<std::string> non_empty(const std::string& s) {
    auto t = utils::trim(s);
    if (t.empty()) return std::nullopt;
    return t;
}

} // namespace

Address parse_address(std::string_view text) {
    const std::string trimmed = utils::trim(std::string(text));
    if (trimmed.empty()) {
        return Address{};
    }

    static const std::regex with_zip(
        R"(^(.+?),\s*(.+?),\s*(.+?)\s+(\d{5}(?:-\d{4})?)(?:,\s*(.+))?$)");
    static const std::regex simple(R"(^(.+?),\s*(.+?),\s*(.+?)(?:,\s*(.+))?$)");

    std::smatch m;
    if (std::regex_match(trimmed, m, with_zip)) {
        return Address{
            .street = non_empty(m[1].str()),
            .city = non_empty(m[2].str()),
            .state = non_empty(m[3].str()),
            .zip = non_empty(m[4].str()),
            .country = m[5].matched ? non_empty(m[5].str()) : std::nullopt,
        };
    }
    if (std::regex_match(trimmed, m, simple)) {
        return Address{
            .street = non_empty(m[1].str()),
            .city = non_empty(m[2].str()),
            .state = non_empty(m[3].str()),
            .zip = std::nullopt,
            .country = m[4].matched ? non_empty(m[4].str()) : std::nullopt,
        };
    }
    return Address{.street = trimmed};
}

Address OnboardingMetadata::resolved_address() const {
    if (address) return *address;
    if (address_text) return parse_address(*address_text);
    return Address{};
}

ProvisionedTenant ProvisionedTenant::from_existing(const TenantRecord& record, bool conflict_resolved) {
    return ProvisionedTenant{
        .tenant_id = record.id,
        .database_name = record.database_name,
        .admin_user_id = record.owner_user_id,
        .reused_existing = true,
        .domain_conflict_resolved = conflict_resolved,
        .subscription_plan = record.subscription_plan,
        .max_users = record.max_users,
    };
}

int32_t max_users_for_plan(std::string_view plan) {
    const auto p = utils::to_lower(std::string(plan));
    if (p == "starter") return 5;
    if (p == "professional") return 25;
    if (p == "enterprise") return 1000;
    return 25;
}

} // namespace tenantcore
