#pragma once

#include "core/error.hpp"
#include "db/cluster_admin.hpp"
#include "db/idb_connection.hpp"
#include "db/tenant_pool_registry.hpp"
#include "schema/schema_module_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tenantcore {

/**
 * @brief Outcome of a full repair of one tenant database
 */
struct RepairReport {
    std::string database;
    size_t tables_before = 0;
    size_t tables_after = 0;
    std::vector<std::string> tables_added;
    std::vector<std::string> all_tables;
};

/**
 * @brief Applies schema modules to tenant databases
 *
 * Two entry points:
 * - proactive: ensure_all() during provisioning and repair_tenant() for
 *   administrative repair;
 * - reactive: run_with_repair() wraps tenant work and, when enabled, repairs
 *   the module owning a missing relation and retries the work once.
 *
 * Reactive repair is gated per tenant: at most one attempt per cooldown,
 * and a longer cooldown after a failed attempt, so a broken tenant cannot
 * turn every request into a DDL run.
 */
class SchemaRepairEngine {
public:
    struct Config {
        bool reactive_enabled = false;
        std::chrono::seconds cooldown{30};
        std::chrono::seconds failure_cooldown{300};
        uint32_t lock_wait_attempts = 30;
        std::chrono::milliseconds lock_wait_interval{1000};
        uint32_t statement_timeout_ms = 120000;
        // Tables whose presence means a concurrent ensure_all() finished
        std::vector<std::string> critical_tables{"users", "profiles", "attendance"};
    };

    SchemaRepairEngine(Config config,
                       std::shared_ptr<ClusterAdmin> admin,
                       std::shared_ptr<TenantPoolRegistry> registry,
                       const SchemaModuleRegistry& modules = SchemaModuleRegistry::instance());

    /**
     * @brief Apply one module's statements in order, stopping at the first failure
     */
    [[nodiscard]] Result<void> ensure_module(IDbConnection& conn, std::string_view module_name);

    /**
     * @brief Apply every module under the schema-creation advisory lock
     *
     * If another session holds the lock, waits for the critical tables to
     * appear instead of running DDL concurrently. The lock is released on
     * every exit path.
     */
    [[nodiscard]] Result<void> ensure_all(IDbConnection& conn);

    /**
     * @brief Base tables in the public schema, sorted
     */
    [[nodiscard]] Result<std::vector<std::string>> list_tables(IDbConnection& conn);

    /**
     * @brief SCHEMA_VERIFICATION_FAILED naming every missing table
     */
    [[nodiscard]] Result<void> verify_tables(IDbConnection& conn,
                                             const std::vector<std::string>& required);

    /**
     * @brief Bring an existing tenant database up to the current schema
     */
    [[nodiscard]] Result<RepairReport> repair_tenant(const std::string& database);

    /**
     * @brief Run work on a pooled tenant connection with reactive repair
     *
     * work returns a Result whose error_context() carries the SQLSTATE (as
     * run_sql does). A missing-object failure either becomes
     * TENANT_CONFIG_INVALID (reactive repair disabled) or triggers one gated
     * repair of the module owning the relation followed by one retry. A
     * failed or gated repair returns the original error.
     *
     * @param relation Relation the work depends on. Empty means take it from
     *        the server message (relation_from_error); when neither names a
     *        relation every module is ensured.
     */
    template<typename Work>
    auto run_with_repair(const std::string& database, std::string_view relation, Work&& work)
        -> std::invoke_result_t<Work&, IDbConnection&>;

    template<typename Work>
    auto run_with_repair(const std::string& database, Work&& work)
        -> std::invoke_result_t<Work&, IDbConnection&> {
        return run_with_repair(database, std::string_view{}, std::forward<Work>(work));
    }

    /**
     * @brief Relation named by an undefined-table message
     *
     * `relation "public.clients" does not exist` gives "public.clients".
     * Empty when the message names no relation.
     */
    static std::string relation_from_error(std::string_view message);

    /**
     * @brief SQLSTATE 42P01 / 42883 / 42704
     */
    static bool is_missing_object(std::string_view sqlstate);

    struct Stats {
        uint64_t reactive_attempts;
        uint64_t reactive_successes;
        uint64_t reactive_gated;
        uint64_t full_repairs;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct GateState {
        Clock::time_point last_attempt{};
        bool last_failed = false;
        bool attempted = false;
    };

    /**
     * @brief Claim the per-tenant repair slot if the cooldown has elapsed
     */
    bool try_enter_gate(const std::string& database);
    void record_gate_outcome(const std::string& database, bool success);

    Result<void> reactive_repair(IDbConnection& conn, const std::string& database,
                                 std::string_view relation);
    Result<void> wait_for_concurrent_creation(IDbConnection& conn);
    Result<void> record_version(IDbConnection& conn);

    Config config_;
    std::shared_ptr<ClusterAdmin> admin_;
    std::shared_ptr<TenantPoolRegistry> registry_;
    const SchemaModuleRegistry& modules_;

    mutable std::mutex gate_mutex_;
    std::unordered_map<std::string, GateState> gates_;

    std::atomic<uint64_t> reactive_attempts_{0};
    std::atomic<uint64_t> reactive_successes_{0};
    std::atomic<uint64_t> reactive_gated_{0};
    std::atomic<uint64_t> full_repairs_{0};
};

template<typename Work>
auto SchemaRepairEngine::run_with_repair(const std::string& database, std::string_view relation,
                                         Work&& work)
    -> std::invoke_result_t<Work&, IDbConnection&> {

    using R = std::invoke_result_t<Work&, IDbConnection&>;

    auto conn = registry_->acquire(database);
    if (conn.is_error()) {
        return R::error_from(conn);
    }
    IDbConnection& db = *conn.value()->get();

    auto first = work(db);
    if (first.is_ok() || !is_missing_object(first.error_context())) {
        return first;
    }

    const std::string target = relation.empty()
        ? relation_from_error(first.error_message())
        : std::string(relation);

    if (!config_.reactive_enabled) {
        return R::error(ErrorCode::TENANT_CONFIG_INVALID,
            std::format("Tenant '{}' is missing a schema object ({}): {}",
                database, target, first.error_message()),
            first.error_context());
    }

    if (reactive_repair(db, database, target).is_error()) {
        return first;
    }
    return work(db);
}

} // namespace tenantcore
