#pragma once

#include "core/error.hpp"
#include "db/pooled_connection.hpp"
#include "db/tenant_pool_registry.hpp"
#include "tenant/tenant_record.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tenantcore {

/**
 * @brief Central registry of tenants (public.agencies in the main database)
 */
class ITenantDirectory {
public:
    virtual ~ITenantDirectory() = default;

    /**
     * @brief Oldest tenant holding the subdomain prefix of domain
     *
     * The prefix is the label before the first dot. A tenant holds it when
     * its stored domain equals the prefix or starts with "<prefix>.".
     * @param domain Normalized (lowercase, trimmed) domain
     */
    [[nodiscard]] virtual Result<std::optional<TenantRecord>> find_by_domain(
        const std::string& domain) = 0;

    [[nodiscard]] virtual Result<std::optional<TenantRecord>> find_by_database_name(
        const std::string& database_name) = 0;

    /**
     * @brief Upsert the tenant row and its settings summary in one transaction
     *
     * Returns DOMAIN_CONFLICT (nothing written) when another tenant already
     * owns the domain.
     */
    [[nodiscard]] virtual Result<void> commit_tenant(
        const TenantRecord& record, const OnboardingMetadata& metadata) = 0;

    /**
     * @brief Entitle the tenant to pages of the central catalog
     * @param page_ids Explicit ids; empty means every active page
     * @return Number of pages assigned
     */
    [[nodiscard]] virtual Result<size_t> assign_default_pages(
        const std::string& tenant_id, const std::vector<std::string>& page_ids) = 0;

    /**
     * @brief Delete the tenant row, its settings summary and page assignments
     */
    [[nodiscard]] virtual Result<void> delete_tenant_record(const std::string& tenant_id) = 0;
};

/**
 * @brief ITenantDirectory over the main database, through the pool registry
 *
 * The first call in a process creates the central tables (agencies with its
 * agencies_domain_key constraint, agency_settings, page_catalog,
 * agency_page_assignments) when they are missing.
 */
class PgTenantDirectory : public ITenantDirectory {
public:
    PgTenantDirectory(std::shared_ptr<TenantPoolRegistry> registry, std::string main_database);

    Result<std::optional<TenantRecord>> find_by_domain(const std::string& domain) override;
    Result<std::optional<TenantRecord>> find_by_database_name(const std::string& database_name) override;
    Result<void> commit_tenant(const TenantRecord& record, const OnboardingMetadata& metadata) override;
    Result<size_t> assign_default_pages(
        const std::string& tenant_id, const std::vector<std::string>& page_ids) override;
    Result<void> delete_tenant_record(const std::string& tenant_id) override;

    [[nodiscard]] const std::string& main_database() const { return main_database_; }

private:
    Result<std::unique_ptr<PooledConnection>> connect();
    Result<std::optional<TenantRecord>> find_one(const std::string& where_clause,
                                                 const std::vector<SqlParam>& params);

    std::shared_ptr<TenantPoolRegistry> registry_;
    std::string main_database_;

    std::mutex schema_mutex_;
    std::atomic<bool> schema_ready_{false};
};

} // namespace tenantcore
