#pragma once

#include "auth/credentials.hpp"
#include "core/error.hpp"
#include "db/tenant_pool_registry.hpp"
#include "schema/schema_repair_engine.hpp"
#include "tenant/tenant_directory.hpp"
#include "tenant/tenant_record.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tenantcore {

struct DepartmentSpec {
    std::string name;
    std::string description;
};

struct TeamMemberSpec {
    std::string name;
    std::string email;
    std::optional<std::string> phone;
    std::optional<std::string> department;
    std::optional<std::string> title;
};

/**
 * @brief Answers of the post-provisioning setup wizard
 *
 * Unset fields leave the stored value untouched.
 */
struct ExtendedSettings {
    std::optional<std::string> company_name;
    std::optional<std::string> tagline;
    std::optional<std::string> industry;
    std::optional<std::string> business_type;
    std::optional<std::string> founded_year;
    std::optional<std::string> employee_count;
    std::optional<std::string> description;
    std::optional<std::string> legal_name;
    std::optional<std::string> registration_number;
    std::optional<std::string> tax_id;
    std::optional<std::string> address_text;
    std::optional<Address> address;
    std::optional<std::string> phone;
    std::optional<std::string> email;
    std::optional<std::string> website;
    std::map<std::string, std::string> social_links;   // e.g. linkedin -> url
    std::optional<std::string> currency;
    std::optional<std::string> fiscal_year_start;
    std::optional<std::string> payment_terms;
    std::optional<std::string> invoice_prefix;
    std::optional<bool> enable_gst;
    std::optional<std::string> timezone;
    std::optional<std::string> date_format;
    std::optional<std::string> time_format;
    std::optional<std::string> week_start;
    std::optional<std::string> language;

    std::vector<DepartmentSpec> departments;
    std::vector<TeamMemberSpec> team_members;
};

/**
 * @brief Read wizard answers from a JSON object with snake_case keys
 *
 * "address" may be a string (parsed) or an object of street/city/state/zip/
 * country. "departments" and "team_members" are arrays of objects.
 */
[[nodiscard]] Result<ExtendedSettings> extended_settings_from_json(const nlohmann::json& j);

struct TeamCredential {
    std::string name;
    std::string email;
    std::string role;
    std::string department;
    std::string employee_id;
    std::string temporary_password;
};

struct TeamMemberFailure {
    std::string email;
    ErrorCode code = ErrorCode::PARTIAL_TEAM_MEMBER_FAILURE;
    std::string message;
};

/**
 * @brief First-login credentials of the members created by one setup run
 */
struct TeamCredentialsManifest {
    std::vector<TeamCredential> created;
    std::vector<std::string> skipped;          // emails that already had an account
    std::vector<TeamMemberFailure> failed;

    /**
     * @brief Name,Email,Role,Department,Employee ID,Temporary Password
     *
     * Empty string when nothing was created.
     */
    [[nodiscard]] std::string to_csv() const;
};

/**
 * @brief Completes a provisioned tenant: extended settings, departments, team
 *
 * Everything runs in one tenant transaction. Each team member gets its own
 * savepoint, so one failing member is rolled back and reported while the
 * others and the settings still commit.
 */
class TenantSetupService {
public:
    static constexpr const char* kMemberRole = "admin";

    TenantSetupService(std::shared_ptr<TenantPoolRegistry> registry,
                       std::shared_ptr<ITenantDirectory> directory,
                       std::shared_ptr<SchemaRepairEngine> engine,
                       std::shared_ptr<IPasswordHasher> hasher);

    [[nodiscard]] Result<TeamCredentialsManifest> complete_tenant_setup(
        const std::string& database_name, const ExtendedSettings& settings);

    /**
     * @brief agency_settings.setup_complete of the tenant
     */
    [[nodiscard]] Result<bool> is_setup_complete(const std::string& database_name);

private:
    Result<void> update_settings(IDbConnection& conn, const TenantRecord& tenant,
                                 const ExtendedSettings& settings);
    Result<void> upsert_departments(IDbConnection& conn, const std::vector<DepartmentSpec>& departments);
    Result<int> last_employee_number(IDbConnection& conn);

    /**
     * @brief Create one member inside the caller's savepoint
     */
    Result<TeamCredential> create_member(IDbConnection& conn, const TenantRecord& tenant,
                                         const TeamMemberSpec& member, int& next_employee_number);

    std::shared_ptr<TenantPoolRegistry> registry_;
    std::shared_ptr<ITenantDirectory> directory_;
    std::shared_ptr<SchemaRepairEngine> engine_;
    std::shared_ptr<IPasswordHasher> hasher_;
};

} // namespace tenantcore
