#include "schema/schema_repair_engine.hpp"
#include "db/scoped_transaction.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <set>
#include <thread>

namespace tenantcore {

namespace {

constexpr const char* kTryLockSql =
    "SELECT pg_try_advisory_lock(hashtext('tenant_schema_creation'))";
constexpr const char* kUnlockSql =
    "SELECT pg_advisory_unlock(hashtext('tenant_schema_creation'))";

/**
 * @brief Releases the schema-creation advisory lock at scope exit
 */
class AdvisoryLockGuard {
public:
    explicit AdvisoryLockGuard(IDbConnection& conn) : conn_(conn) {}
    ~AdvisoryLockGuard() {
        const auto res = run_sql(conn_, kUnlockSql);
        if (res.is_error()) {
            utils::log::warn(std::format("Failed to release schema advisory lock: {}",
                res.error_message()));
        }
    }

    AdvisoryLockGuard(const AdvisoryLockGuard&) = delete;
    AdvisoryLockGuard& operator=(const AdvisoryLockGuard&) = delete;

private:
    IDbConnection& conn_;
};

std::vector<std::string> missing_from(const std::vector<std::string>& present,
                                      const std::vector<std::string>& required) {
    const std::set<std::string> have(present.begin(), present.end());
    std::vector<std::string> missing;
    for (const auto& table : required) {
        if (!have.contains(table)) missing.push_back(table);
    }
    return missing;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace

SchemaRepairEngine::SchemaRepairEngine(Config config,
                                       std::shared_ptr<ClusterAdmin> admin,
                                       std::shared_ptr<TenantPoolRegistry> registry,
                                       const SchemaModuleRegistry& modules)
    : config_(std::move(config)),
      admin_(std::move(admin)),
      registry_(std::move(registry)),
      modules_(modules) {}

bool SchemaRepairEngine::is_missing_object(std::string_view sqlstate) {
    return sqlstate == "42P01" || sqlstate == "42883" || sqlstate == "42704";
}

std::string SchemaRepairEngine::relation_from_error(std::string_view message) {
    static constexpr std::string_view kPrefix = "relation \"";
    const auto start = message.find(kPrefix);
    if (start == std::string_view::npos) return {};
    const auto name_start = start + kPrefix.size();
    const auto end = message.find('"', name_start);
    if (end == std::string_view::npos || end == name_start) return {};
    return std::string(message.substr(name_start, end - name_start));
}

Result<void> SchemaRepairEngine::ensure_module(IDbConnection& conn, std::string_view module_name) {
    const SchemaModule* module = modules_.find(module_name);
    if (!module) {
        return Result<void>::error(ErrorCode::NOT_FOUND,
            std::format("Unknown schema module '{}'", module_name));
    }

    for (size_t i = 0; i < module->statements.size(); ++i) {
        const auto res = run_sql(conn, module->statements[i]);
        if (res.is_error()) {
            return Result<void>::error(ErrorCode::QUERY_FAILED,
                std::format("Schema module '{}' failed at statement {}/{}: {}",
                    module->name, i + 1, module->statements.size(), res.error_message()),
                res.error_context());
        }
    }
    return Result<void>::ok();
}

Result<void> SchemaRepairEngine::ensure_all(IDbConnection& conn) {
    const auto locked = run_sql(conn, kTryLockSql);
    if (locked.is_error()) {
        return Result<void>::error_from(locked);
    }
    if (locked.value().scalar() != "t") {
        utils::log::info("Schema creation lock held by another session; waiting for it to finish");
        return wait_for_concurrent_creation(conn);
    }

    AdvisoryLockGuard guard(conn);

    utils::Timer timer;
    for (const auto& module : modules_.modules()) {
        auto applied = ensure_module(conn, module.name);
        if (applied.is_error()) {
            utils::log::error(applied.error_message());
            return applied;
        }
    }

    auto recorded = record_version(conn);
    if (recorded.is_error()) {
        return recorded;
    }

    utils::log::info(std::format("Ensured {} schema modules in {}ms",
        modules_.modules().size(), timer.elapsed_ms().count()));
    return Result<void>::ok();
}

Result<void> SchemaRepairEngine::wait_for_concurrent_creation(IDbConnection& conn) {
    for (uint32_t attempt = 1; attempt <= config_.lock_wait_attempts; ++attempt) {
        const auto tables = list_tables(conn);
        if (tables.is_error()) {
            return Result<void>::error_from(tables);
        }
        if (missing_from(tables.value(), config_.critical_tables).empty()) {
            return Result<void>::ok();
        }
        std::this_thread::sleep_for(config_.lock_wait_interval);
    }
    return Result<void>::error(ErrorCode::SCHEMA_VERIFICATION_FAILED,
        std::format("Concurrent schema creation did not produce {} after {} attempts",
            join(config_.critical_tables), config_.lock_wait_attempts));
}

Result<void> SchemaRepairEngine::record_version(IDbConnection& conn) {
    const std::string version(schema_modules::kSchemaVersion);

    const auto migration = run_sql(conn,
        "INSERT INTO public.schema_migrations (version, description) VALUES ($1, $2) "
        "ON CONFLICT (version) DO NOTHING",
        {version, std::string("Tenant schema modules")});
    if (migration.is_error()) {
        return Result<void>::error_from(migration);
    }

    const auto info = run_sql(conn,
        "INSERT INTO public.schema_info (id, schema_version, updated_at) VALUES (1, $1, NOW()) "
        "ON CONFLICT (id) DO UPDATE SET schema_version = EXCLUDED.schema_version, updated_at = NOW()",
        {version});
    if (info.is_error()) {
        return Result<void>::error_from(info);
    }
    return Result<void>::ok();
}

Result<std::vector<std::string>> SchemaRepairEngine::list_tables(IDbConnection& conn) {
    const auto res = run_sql(conn,
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = 'public' AND table_type = 'BASE TABLE' ORDER BY table_name");
    if (res.is_error()) {
        return Result<std::vector<std::string>>::error_from(res);
    }

    std::vector<std::string> tables;
    tables.reserve(res.value().rows.size());
    for (const auto& row : res.value().rows) {
        if (!row.empty()) tables.push_back(row.front());
    }
    std::sort(tables.begin(), tables.end());
    return Result<std::vector<std::string>>::ok(std::move(tables));
}

Result<void> SchemaRepairEngine::verify_tables(IDbConnection& conn,
                                               const std::vector<std::string>& required) {
    const auto tables = list_tables(conn);
    if (tables.is_error()) {
        return Result<void>::error_from(tables);
    }
    const auto missing = missing_from(tables.value(), required);
    if (!missing.empty()) {
        return Result<void>::error(ErrorCode::SCHEMA_VERIFICATION_FAILED,
            std::format("Required tables missing after schema creation: {}", join(missing)));
    }
    return Result<void>::ok();
}

Result<RepairReport> SchemaRepairEngine::repair_tenant(const std::string& database) {
    auto conn = admin_->connect(database, config_.statement_timeout_ms);
    if (conn.is_error()) {
        return Result<RepairReport>::error_from(conn);
    }
    IDbConnection& db = *conn.value();

    const auto before = list_tables(db);
    if (before.is_error()) {
        db.close();
        return Result<RepairReport>::error_from(before);
    }

    const auto ensured = ensure_all(db);
    if (ensured.is_error()) {
        db.close();
        return Result<RepairReport>::error_from(ensured);
    }

    auto after = list_tables(db);
    db.close();
    if (after.is_error()) {
        return Result<RepairReport>::error_from(after);
    }

    RepairReport report;
    report.database = database;
    report.tables_before = before.value().size();
    report.tables_after = after.value().size();
    report.tables_added = missing_from(before.value(), after.value());
    report.all_tables = std::move(after.value());

    full_repairs_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("Repaired tenant '{}': {} -> {} tables ({} added)",
        database, report.tables_before, report.tables_after, report.tables_added.size()));
    return Result<RepairReport>::ok(std::move(report));
}

bool SchemaRepairEngine::try_enter_gate(const std::string& database) {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    auto& gate = gates_[database];
    const auto now = Clock::now();
    if (gate.attempted) {
        const auto wait = gate.last_failed ? config_.failure_cooldown : config_.cooldown;
        if (now - gate.last_attempt < wait) {
            return false;
        }
    }
    gate.attempted = true;
    gate.last_attempt = now;
    gate.last_failed = false;
    return true;
}

void SchemaRepairEngine::record_gate_outcome(const std::string& database, bool success) {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    auto& gate = gates_[database];
    gate.last_failed = !success;
    gate.last_attempt = Clock::now();
}

Result<void> SchemaRepairEngine::reactive_repair(IDbConnection& conn, const std::string& database,
                                                 std::string_view relation) {
    if (!try_enter_gate(database)) {
        reactive_gated_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Reactive repair for '{}' skipped: cooldown active", database));
        return Result<void>::error(ErrorCode::TENANT_CONFIG_INVALID,
            std::format("Reactive repair for '{}' is cooling down", database));
    }
    reactive_attempts_.fetch_add(1, std::memory_order_relaxed);

    const auto module = modules_.module_for_table(relation);
    Result<void> repaired = Result<void>::ok();
    if (module) {
        utils::log::info(std::format("Reactive repair: relation '{}' in '{}' -> module '{}'",
            relation, database, *module));
        repaired = ensure_module(conn, *module);
    } else {
        utils::log::info(std::format("Reactive repair: unknown relation '{}' in '{}', ensuring all modules",
            relation, database));
        repaired = ensure_all(conn);
    }

    record_gate_outcome(database, repaired.is_ok());
    if (repaired.is_error()) {
        utils::log::error(std::format("Reactive repair of '{}' failed: {}",
            database, repaired.error_message()));
        return repaired;
    }
    reactive_successes_.fetch_add(1, std::memory_order_relaxed);
    return Result<void>::ok();
}

SchemaRepairEngine::Stats SchemaRepairEngine::get_stats() const {
    return Stats{
        .reactive_attempts = reactive_attempts_.load(std::memory_order_relaxed),
        .reactive_successes = reactive_successes_.load(std::memory_order_relaxed),
        .reactive_gated = reactive_gated_.load(std::memory_order_relaxed),
        .full_repairs = full_repairs_.load(std::memory_order_relaxed),
    };
}

} // namespace tenantcore
