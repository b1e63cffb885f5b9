#include "tenant/provisioning_orchestrator.hpp"
#include "db/identifier.hpp"
#include "db/scoped_transaction.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantcore {

const char* phase_to_string(ProvisioningPhase phase) {
    switch (phase) {
        case ProvisioningPhase::CHECKING_DOMAIN:        return "CheckingDomain";
        case ProvisioningPhase::CREATING_DATABASE:      return "CreatingDatabase";
        case ProvisioningPhase::CREATING_SCHEMA:        return "CreatingSchema";
        case ProvisioningPhase::SEEDING_SETTINGS:       return "SeedingSettings";
        case ProvisioningPhase::CREATING_ADMIN:         return "CreatingAdmin";
        case ProvisioningPhase::COMMITTING_MAIN_RECORD: return "CommittingMainRecord";
        case ProvisioningPhase::ASSIGNING_DEFAULTS:     return "AssigningDefaults";
        case ProvisioningPhase::COMPLETE:               return "Complete";
    }
    return "Unknown";
}

namespace {

/**
 * @brief Closes a dedicated (unpooled) connection at scope exit
 */
class DedicatedConnection {
public:
    explicit DedicatedConnection(std::unique_ptr<IDbConnection> conn) : conn_(std::move(conn)) {}
    ~DedicatedConnection() {
        if (conn_) conn_->close();
    }

    DedicatedConnection(const DedicatedConnection&) = delete;
    DedicatedConnection& operator=(const DedicatedConnection&) = delete;

    IDbConnection& operator*() const { return *conn_; }

private:
    std::unique_ptr<IDbConnection> conn_;
};

std::pair<std::string, std::string> split_name(const std::string& full_name) {
    const auto parts = utils::split(utils::trim(full_name), ' ');
    std::vector<std::string> words;
    for (const auto& p : parts) {
        if (!p.empty()) words.push_back(p);
    }
    if (words.empty()) return {"", ""};
    std::string last;
    for (size_t i = 1; i < words.size(); ++i) {
        if (!last.empty()) last += ' ';
        last += words[i];
    }
    if (last.empty()) last = words.front();
    return {words.front(), last};
}

Result<void> exec(IDbConnection& conn, const std::string& sql, const std::vector<SqlParam>& params) {
    const auto res = run_sql(conn, sql, params);
    if (res.is_error()) {
        return Result<void>::error_from(res);
    }
    return Result<void>::ok();
}

} // namespace

ProvisioningOrchestrator::ProvisioningOrchestrator(Config config,
                                                   std::shared_ptr<ClusterAdmin> admin,
                                                   std::shared_ptr<TenantPoolRegistry> registry,
                                                   std::shared_ptr<SchemaRepairEngine> engine,
                                                   std::shared_ptr<ITenantDirectory> directory)
    : config_(std::move(config)),
      admin_(std::move(admin)),
      registry_(std::move(registry)),
      engine_(std::move(engine)),
      directory_(std::move(directory)) {}

Result<ProvisionedTenant> ProvisioningOrchestrator::create_tenant(const CreateTenantRequest& request) {
    if (utils::trim(request.agency_name).empty() || utils::trim(request.domain).empty() ||
        utils::trim(request.admin_email).empty() || request.admin_password_hash.empty()) {
        return Result<ProvisionedTenant>::error(ErrorCode::INVALID_ARGUMENT,
            "agency name, domain, admin email and admin password hash are required");
    }

    attempts_.fetch_add(1, std::memory_order_relaxed);
    const std::string domain = utils::to_lower(utils::trim(request.domain));
    const std::string plan = request.subscription_plan.empty()
        ? config_.default_plan : request.subscription_plan;

    ProvisioningTransaction txn;

    // Phase 1: an existing tenant for this domain is returned as-is
    txn.phase = ProvisioningPhase::CHECKING_DOMAIN;
    const auto existing = directory_->find_by_domain(domain);
    if (existing.is_error()) {
        return fail(txn, txn.phase, existing);
    }
    if (existing.value()) {
        reused_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("Domain '{}' already provisioned as '{}'; reusing",
            domain, existing.value()->database_name));
        return Result<ProvisionedTenant>::ok(ProvisionedTenant::from_existing(*existing.value(), false));
    }
    txn.domain_checked = true;

    // Phase 2
    txn.phase = ProvisioningPhase::CREATING_DATABASE;
    txn.tenant_id = utils::generate_uuid();
    txn.admin_user_id = utils::generate_uuid();
    const auto db_name = identifier::derive_database_name(domain, txn.tenant_id);
    if (db_name.is_error()) {
        return fail(txn, txn.phase, db_name);
    }
    txn.database_name = db_name.value();
    utils::log::info(std::format("Provisioning tenant '{}' ({}) into database '{}'",
        request.agency_name, domain, txn.database_name));

    if (auto created = create_database(txn); created.is_error()) {
        return fail(txn, txn.phase, created);
    }

    // Phases 3-5
    if (auto built = build_tenant(txn, request); built.is_error()) {
        return fail(txn, txn.phase, built);
    }

    // Phase 6
    txn.phase = ProvisioningPhase::COMMITTING_MAIN_RECORD;
    const TenantRecord record{
        .id = txn.tenant_id,
        .name = request.agency_name,
        .domain = domain,
        .database_name = txn.database_name,
        .owner_user_id = txn.admin_user_id,
        .subscription_plan = plan,
        .max_users = max_users_for_plan(plan),
        .is_active = true,
        .created_at = {},
    };
    const auto committed = directory_->commit_tenant(record, request.metadata);
    if (committed.is_error()) {
        if (committed.error_code() != ErrorCode::DOMAIN_CONFLICT) {
            return fail(txn, txn.phase, committed);
        }

        // Lost the race: undo our database and converge on the winner
        utils::log::warn(std::format("Domain '{}' was registered concurrently; discarding '{}'",
            domain, txn.database_name));
        compensate(txn);
        const auto winner = directory_->find_by_domain(domain);
        if (winner.is_error()) {
            return Result<ProvisionedTenant>::error_from(winner);
        }
        if (!winner.value()) {
            return Result<ProvisionedTenant>::error(ErrorCode::DOMAIN_CONFLICT,
                std::format("Domain '{}' conflicted but no owning tenant was found", domain));
        }
        conflicts_resolved_.fetch_add(1, std::memory_order_relaxed);
        return Result<ProvisionedTenant>::ok(ProvisionedTenant::from_existing(*winner.value(), true));
    }
    txn.main_record_committed = true;

    // Phase 7: best effort
    txn.phase = ProvisioningPhase::ASSIGNING_DEFAULTS;
    const auto pages = directory_->assign_default_pages(txn.tenant_id, request.metadata.page_ids);
    if (pages.is_error()) {
        utils::log::warn(std::format("Page assignment for '{}' failed (non-fatal): {}",
            txn.database_name, pages.error_message()));
    } else {
        utils::log::info(std::format("Assigned {} page(s) to tenant '{}'",
            pages.value(), txn.tenant_id));
    }

    txn.phase = ProvisioningPhase::COMPLETE;
    succeeded_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("Tenant '{}' provisioned (database '{}')",
        request.agency_name, txn.database_name));

    return Result<ProvisionedTenant>::ok(ProvisionedTenant{
        .tenant_id = txn.tenant_id,
        .database_name = txn.database_name,
        .admin_user_id = txn.admin_user_id,
        .reused_existing = false,
        .domain_conflict_resolved = false,
        .subscription_plan = plan,
        .max_users = record.max_users,
    });
}

Result<void> ProvisioningOrchestrator::create_database(ProvisioningTransaction& txn) {
    auto session = admin_->open_session();
    if (session.is_error()) {
        return Result<void>::error_from(session);
    }
    AdminSession& admin = session.value();

    const auto exists = admin.database_exists(txn.database_name);
    if (exists.is_error()) {
        return Result<void>::error_from(exists);
    }
    if (exists.value()) {
        utils::log::warn(std::format("Database '{}' already exists; dropping stale copy",
            txn.database_name));
        if (auto dropped = admin.drop_database(txn.database_name); dropped.is_error()) {
            return dropped;
        }
    }

    if (auto created = admin.create_database(txn.database_name); created.is_error()) {
        return created;
    }
    txn.database_created = true;

    const auto verified = admin.database_exists(txn.database_name);
    if (verified.is_error()) {
        return Result<void>::error_from(verified);
    }
    if (!verified.value()) {
        return Result<void>::error(ErrorCode::INTERNAL_ERROR,
            std::format("Database '{}' not visible after CREATE DATABASE", txn.database_name));
    }
    return Result<void>::ok();
}

Result<void> ProvisioningOrchestrator::build_tenant(ProvisioningTransaction& txn,
                                                    const CreateTenantRequest& request) {
    txn.phase = ProvisioningPhase::CREATING_SCHEMA;
    auto opened = admin_->connect(txn.database_name, config_.schema_statement_timeout_ms);
    if (opened.is_error()) {
        return Result<void>::error_from(opened);
    }
    DedicatedConnection conn(std::move(opened.value()));

    if (auto ensured = engine_->ensure_all(*conn); ensured.is_error()) {
        return ensured;
    }
    if (auto verified = engine_->verify_tables(*conn, config_.required_tables); verified.is_error()) {
        return verified;
    }
    txn.schema_created = true;

    txn.phase = ProvisioningPhase::SEEDING_SETTINGS;
    if (auto seeded = seed_settings(*conn, request); seeded.is_error()) {
        return seeded;
    }
    txn.settings_seeded = true;

    txn.phase = ProvisioningPhase::CREATING_ADMIN;
    return create_admin(*conn, txn, request);
}

Result<void> ProvisioningOrchestrator::seed_settings(IDbConnection& conn,
                                                     const CreateTenantRequest& request) {
    const auto& m = request.metadata;
    const Address addr = m.resolved_address();
    const std::string domain = utils::to_lower(utils::trim(request.domain));
    const std::string gst = m.enable_gst ? "true" : "false";

    const auto current = run_sql(conn, "SELECT id::text FROM public.agency_settings LIMIT 1");
    if (current.is_error()) {
        return Result<void>::error_from(current);
    }

    if (!current.value().empty()) {
        return exec(conn,
            "UPDATE public.agency_settings SET "
            "agency_name = COALESCE(NULLIF($1, ''), agency_name), "
            "industry = COALESCE($2, industry), phone = COALESCE($3, phone), "
            "address_street = COALESCE($4, address_street), address_city = COALESCE($5, address_city), "
            "address_state = COALESCE($6, address_state), address_zip = COALESCE($7, address_zip), "
            "address_country = COALESCE($8, address_country), "
            "employee_count = COALESCE($9, employee_count), enable_gst = $10::boolean, "
            "domain = COALESCE($11, domain), country = COALESCE($12, country), "
            "timezone = COALESCE($13, timezone), currency = COALESCE($14, currency), "
            "language = COALESCE($15, language), updated_at = NOW() "
            "WHERE id = $16::uuid",
            {request.agency_name, m.industry, m.phone, addr.street, addr.city, addr.state,
             addr.zip, addr.country, m.employee_count, gst, domain, m.country, m.timezone,
             m.currency, m.language, current.value().scalar()});
    }

    return exec(conn,
        "INSERT INTO public.agency_settings (agency_name, industry, phone, address_street, "
        "address_city, address_state, address_zip, address_country, employee_count, enable_gst, "
        "domain, country, timezone, currency, language, setup_complete, created_at, updated_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10::boolean, $11, $12, "
        "COALESCE($13, 'UTC'), COALESCE($14, 'USD'), COALESCE($15, 'en'), false, NOW(), NOW())",
        {request.agency_name, m.industry, m.phone, addr.street, addr.city, addr.state,
         addr.zip, addr.country, m.employee_count, gst, domain, m.country, m.timezone,
         m.currency, m.language});
}

Result<void> ProvisioningOrchestrator::create_admin(IDbConnection& conn, ProvisioningTransaction& txn,
                                                    const CreateTenantRequest& request) {
    const auto [first_name, last_name] = split_name(request.admin_name);
    const std::string email = utils::to_lower(utils::trim(request.admin_email));

    ScopedTransaction tx(conn);
    if (auto begun = tx.begin(); begun.is_error()) {
        return begun;
    }

    if (auto r = exec(conn,
            "INSERT INTO public.users (id, email, password_hash, email_confirmed, is_active, "
            "created_at, updated_at) VALUES ($1, $2, $3, true, true, NOW(), NOW())",
            {txn.admin_user_id, email, request.admin_password_hash});
        r.is_error()) {
        return r;
    }
    txn.admin_user_created = true;

    if (auto r = exec(conn,
            "INSERT INTO public.profiles (user_id, full_name, phone, agency_id, is_active, "
            "created_at, updated_at) VALUES ($1, $2, $3, $4, true, NOW(), NOW()) "
            "ON CONFLICT (user_id) DO UPDATE SET full_name = EXCLUDED.full_name, "
            "phone = EXCLUDED.phone, "
            "agency_id = COALESCE(EXCLUDED.agency_id, public.profiles.agency_id), updated_at = NOW()",
            {txn.admin_user_id, request.admin_name, request.metadata.phone, txn.tenant_id});
        r.is_error()) {
        return r;
    }

    if (auto r = exec(conn,
            "INSERT INTO public.employee_details (user_id, employee_id, agency_id, first_name, "
            "last_name, employment_type, created_at, updated_at) "
            "VALUES ($1, 'EMP-0001', $2, $3, $4, 'full_time', NOW(), NOW()) ON CONFLICT DO NOTHING",
            {txn.admin_user_id, txn.tenant_id, first_name, last_name});
        r.is_error()) {
        return r;
    }

    if (auto r = exec(conn,
            "DELETE FROM public.user_roles WHERE user_id = $1 AND role = 'employee'",
            {txn.admin_user_id});
        r.is_error()) {
        return r;
    }

    if (auto r = exec(conn,
            "INSERT INTO public.user_roles (user_id, role, agency_id, assigned_at) "
            "VALUES ($1, 'super_admin', $2, NOW()) ON CONFLICT (user_id, role, agency_id) DO NOTHING",
            {txn.admin_user_id, txn.tenant_id});
        r.is_error()) {
        return r;
    }
    txn.roles_assigned = true;

    return tx.commit();
}

void ProvisioningOrchestrator::compensate(const ProvisioningTransaction& txn) {
    if (!txn.database_created || txn.database_name.empty()) {
        return;
    }
    compensations_run_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Compensating: dropping tenant database '{}'", txn.database_name));

    const auto evicted = registry_->evict(txn.database_name);
    if (evicted.found && evicted.outstanding > 0) {
        utils::log::warn(std::format("{} connection(s) to '{}' still borrowed during compensation",
            evicted.outstanding, txn.database_name));
    }

    auto session = admin_->open_session();
    if (session.is_error()) {
        compensations_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Compensation for '{}' could not open an admin session: {}",
            txn.database_name, session.error_message()));
        return;
    }
    const auto dropped = session.value().drop_database(txn.database_name);
    if (dropped.is_error()) {
        compensations_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Compensation for '{}' failed to drop database: {}",
            txn.database_name, dropped.error_message()));
    }
}

Result<ProvisionedTenant> ProvisioningOrchestrator::fail(const ProvisioningTransaction& txn,
                                                         ProvisioningPhase phase, ErrorCode code,
                                                         const std::string& message) {
    phase_failures_[static_cast<size_t>(phase)].fetch_add(1, std::memory_order_relaxed);
    utils::log::error(std::format("Provisioning failed in {}: [{}] {}",
        phase_to_string(phase), error_code_to_string(code), message));
    compensate(txn);
    return Result<ProvisionedTenant>::error(ErrorCode::PROVISIONING_PHASE_FAILED,
        std::format("{} failed ({}): {}", phase_to_string(phase), error_code_to_string(code), message),
        phase_to_string(phase));
}

Result<bool> ProvisioningOrchestrator::check_domain_available(const std::string& domain) {
    const std::string normalized = utils::to_lower(utils::trim(domain));
    if (normalized.empty()) {
        return Result<bool>::error(ErrorCode::INVALID_ARGUMENT, "Domain is empty");
    }
    const auto existing = directory_->find_by_domain(normalized);
    if (existing.is_error()) {
        return Result<bool>::error_from(existing);
    }
    return Result<bool>::ok(!existing.value().has_value());
}

Result<RepairReport> ProvisioningOrchestrator::repair_tenant_schema(const std::string& database_name) {
    const auto name = identifier::validate_database_name(database_name);
    if (name.is_error()) {
        return Result<RepairReport>::error_from(name);
    }
    return engine_->repair_tenant(name.value());
}

Result<void> ProvisioningOrchestrator::delete_tenant(const std::string& database_name) {
    const auto name = identifier::validate_database_name(database_name);
    if (name.is_error()) {
        return Result<void>::error_from(name);
    }

    const auto record = directory_->find_by_database_name(name.value());
    if (record.is_error()) {
        return Result<void>::error_from(record);
    }
    if (!record.value()) {
        return Result<void>::error(ErrorCode::NOT_FOUND,
            std::format("No tenant owns database '{}'", name.value()));
    }

    const auto evicted = registry_->evict(name.value());
    if (evicted.outstanding > 0) {
        utils::log::warn(std::format("{} connection(s) to '{}' were still borrowed at deletion",
            evicted.outstanding, name.value()));
    }

    {
        auto session = admin_->open_session();
        if (session.is_error()) {
            return Result<void>::error_from(session);
        }
        if (auto dropped = session.value().drop_database(name.value()); dropped.is_error()) {
            return dropped;
        }
    }

    if (auto removed = directory_->delete_tenant_record(record.value()->id); removed.is_error()) {
        return removed;
    }
    utils::log::info(std::format("Deleted tenant '{}' (database '{}')",
        record.value()->id, name.value()));
    return Result<void>::ok();
}

ProvisioningOrchestrator::Stats ProvisioningOrchestrator::get_stats() const {
    std::unordered_map<std::string, uint64_t> failures;
    for (size_t i = 0; i < kProvisioningPhaseCount; ++i) {
        const auto n = phase_failures_[i].load(std::memory_order_relaxed);
        if (n > 0) {
            failures.emplace(phase_to_string(static_cast<ProvisioningPhase>(i)), n);
        }
    }
    return Stats{
        .attempts = attempts_.load(std::memory_order_relaxed),
        .succeeded = succeeded_.load(std::memory_order_relaxed),
        .reused_existing = reused_.load(std::memory_order_relaxed),
        .conflicts_resolved = conflicts_resolved_.load(std::memory_order_relaxed),
        .compensations_run = compensations_run_.load(std::memory_order_relaxed),
        .compensations_failed = compensations_failed_.load(std::memory_order_relaxed),
        .failures_by_phase = std::move(failures),
    };
}

} // namespace tenantcore
