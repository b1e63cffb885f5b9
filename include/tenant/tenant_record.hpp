#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tenantcore {

/**
 * @brief Structured postal address; every field optional
 */
struct Address {
    std::optional<std::string> street;
    std::optional<std::string> city;
    std::optional<std::string> state;
    std::optional<std::string> zip;
    std::optional<std::string> country;
};

/**
 * @brief Parse "Street, City, State ZIP, Country" or "Street, City, State, Country"
 *
 * Anything else becomes the street. Blank input yields an empty Address.
 */
[[nodiscard]] Address parse_address(std::string_view text);

/**
 * @brief Onboarding answers captured with the create request
 */
struct OnboardingMetadata {
    std::optional<std::string> industry;
    std::optional<std::string> phone;
    std::optional<std::string> address_text;
    std::optional<Address> address;          // wins over address_text when set
    std::optional<std::string> employee_count;
    std::optional<std::string> country;
    std::optional<std::string> timezone;
    std::optional<std::string> currency;
    std::optional<std::string> language;
    bool enable_gst = false;
    std::optional<std::string> primary_focus;
    std::vector<std::string> page_ids;

    [[nodiscard]] Address resolved_address() const;
};

struct CreateTenantRequest {
    std::string agency_name;
    std::string domain;
    std::string admin_name;
    std::string admin_email;
    std::string admin_password_hash;
    std::string subscription_plan = "professional";
    OnboardingMetadata metadata;
};

/**
 * @brief Row of public.agencies in the central database
 */
struct TenantRecord {
    std::string id;
    std::string name;
    std::string domain;
    std::string database_name;
    std::string owner_user_id;
    std::string subscription_plan;
    int32_t max_users = 0;
    bool is_active = true;
    std::string created_at;
};

struct ProvisionedTenant {
    std::string tenant_id;
    std::string database_name;
    std::string admin_user_id;
    bool reused_existing = false;
    bool domain_conflict_resolved = false;
    std::string subscription_plan;
    int32_t max_users = 0;

    static ProvisionedTenant from_existing(const TenantRecord& record, bool conflict_resolved);
};

/**
 * @brief starter 5, professional 25, enterprise 1000, otherwise 25
 */
[[nodiscard]] int32_t max_users_for_plan(std::string_view plan);

} // namespace tenantcore
