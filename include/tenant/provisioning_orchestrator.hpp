#pragma once

#include "core/error.hpp"
#include "db/cluster_admin.hpp"
#include "db/tenant_pool_registry.hpp"
#include "schema/schema_repair_engine.hpp"
#include "tenant/tenant_directory.hpp"
#include "tenant/tenant_record.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tenantcore {

enum class ProvisioningPhase : uint8_t {
    CHECKING_DOMAIN,
    CREATING_DATABASE,
    CREATING_SCHEMA,
    SEEDING_SETTINGS,
    CREATING_ADMIN,
    COMMITTING_MAIN_RECORD,
    ASSIGNING_DEFAULTS,
    COMPLETE
};

inline constexpr size_t kProvisioningPhaseCount = 8;

const char* phase_to_string(ProvisioningPhase phase);

/**
 * @brief In-memory progress of one create_tenant call (never persisted)
 *
 * The flags drive compensation: only what was actually done is undone.
 */
struct ProvisioningTransaction {
    ProvisioningPhase phase = ProvisioningPhase::CHECKING_DOMAIN;
    std::string tenant_id;
    std::string database_name;
    std::string admin_user_id;

    bool domain_checked = false;
    bool database_created = false;
    bool schema_created = false;
    bool settings_seeded = false;
    bool admin_user_created = false;
    bool roles_assigned = false;
    bool main_record_committed = false;
};

/**
 * @brief Creates, repairs and deletes tenants
 *
 * create_tenant() runs a 7-phase state machine:
 * CheckingDomain -> CreatingDatabase -> CreatingSchema -> SeedingSettings
 * -> CreatingAdmin -> CommittingMainRecord -> AssigningDefaults.
 *
 * Any fatal failure after the database exists evicts its pool and drops
 * it before the error is returned, so a failed attempt leaves nothing
 * behind. The caller sees one PROVISIONING_PHASE_FAILED whose context is
 * the failed phase. Losing a concurrent race for the same domain is not
 * a failure: the loser drops its own database and returns the winner.
 */
class ProvisioningOrchestrator {
public:
    struct Config {
        uint32_t schema_statement_timeout_ms = 120000;
        std::vector<std::string> required_tables{"users", "profiles", "user_roles", "attendance"};
        std::string default_plan = "professional";
    };

    ProvisioningOrchestrator(Config config,
                             std::shared_ptr<ClusterAdmin> admin,
                             std::shared_ptr<TenantPoolRegistry> registry,
                             std::shared_ptr<SchemaRepairEngine> engine,
                             std::shared_ptr<ITenantDirectory> directory);

    [[nodiscard]] Result<ProvisionedTenant> create_tenant(const CreateTenantRequest& request);

    /**
     * @brief true when no tenant owns the domain or its subdomain
     */
    [[nodiscard]] Result<bool> check_domain_available(const std::string& domain);

    [[nodiscard]] Result<RepairReport> repair_tenant_schema(const std::string& database_name);

    /**
     * @brief Evict the pool, drop the database, delete the central record
     */
    [[nodiscard]] Result<void> delete_tenant(const std::string& database_name);

    struct Stats {
        uint64_t attempts;
        uint64_t succeeded;
        uint64_t reused_existing;
        uint64_t conflicts_resolved;
        uint64_t compensations_run;
        uint64_t compensations_failed;
        std::unordered_map<std::string, uint64_t> failures_by_phase;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    Result<ProvisionedTenant> fail(const ProvisioningTransaction& txn, ProvisioningPhase phase,
                                   ErrorCode code, const std::string& message);

    template<typename T>
    Result<ProvisionedTenant> fail(const ProvisioningTransaction& txn, ProvisioningPhase phase,
                                   const Result<T>& cause) {
        return fail(txn, phase, cause.error_code(), cause.error_message());
    }

    Result<void> create_database(ProvisioningTransaction& txn);

    /**
     * @brief Phases 3-5 on one dedicated tenant connection
     * @return error with txn.phase set to the failing phase
     */
    Result<void> build_tenant(ProvisioningTransaction& txn, const CreateTenantRequest& request);

    Result<void> seed_settings(IDbConnection& conn, const CreateTenantRequest& request);
    Result<void> create_admin(IDbConnection& conn, ProvisioningTransaction& txn,
                              const CreateTenantRequest& request);

    /**
     * @brief Evict, terminate and drop; logs instead of failing
     */
    void compensate(const ProvisioningTransaction& txn);

    Config config_;
    std::shared_ptr<ClusterAdmin> admin_;
    std::shared_ptr<TenantPoolRegistry> registry_;
    std::shared_ptr<SchemaRepairEngine> engine_;
    std::shared_ptr<ITenantDirectory> directory_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> reused_{0};
    std::atomic<uint64_t> conflicts_resolved_{0};
    std::atomic<uint64_t> compensations_run_{0};
    std::atomic<uint64_t> compensations_failed_{0};
    std::array<std::atomic<uint64_t>, kProvisioningPhaseCount> phase_failures_{};
};

} // namespace tenantcore
