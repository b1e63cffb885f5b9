#include "tenant/tenant_directory.hpp"
#include "db/identifier.hpp"
#include "db/scoped_transaction.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace tenantcore {

namespace {

constexpr const char* kSelectTenant =
    "SELECT id::text, name, COALESCE(domain, ''), COALESCE(database_name, ''), "
    "COALESCE(owner_user_id::text, ''), COALESCE(subscription_plan, ''), "
    "COALESCE(max_users, 0), is_active, created_at::text "
    "FROM public.agencies ";

// Central tables, applied once per process before the first directory call.
// Older central databases get the later columns through ADD COLUMN.
constexpr const char* kCentralSchema[] = {
    "CREATE EXTENSION IF NOT EXISTS pgcrypto",
    "CREATE TABLE IF NOT EXISTS public.agencies (\n"
    "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),\n"
    "  name TEXT NOT NULL,\n"
    "  domain TEXT UNIQUE,\n"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
    "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
    "  is_active BOOLEAN NOT NULL DEFAULT true,\n"
    "  subscription_plan TEXT DEFAULT 'basic',\n"
    "  max_users INTEGER DEFAULT 50,\n"
    "  database_name TEXT UNIQUE,\n"
    "  owner_user_id UUID\n"
    ")",
    "ALTER TABLE public.agencies ADD COLUMN IF NOT EXISTS database_name TEXT UNIQUE",
    "ALTER TABLE public.agencies ADD COLUMN IF NOT EXISTS owner_user_id UUID",
    "ALTER TABLE public.agencies ADD COLUMN IF NOT EXISTS subscription_plan TEXT",
    "ALTER TABLE public.agencies ADD COLUMN IF NOT EXISTS max_users INTEGER",
    // The unique violation on this constraint is what settles concurrent creates
    "DO $$\n"
    "BEGIN\n"
    "  IF NOT EXISTS (SELECT 1 FROM pg_constraint WHERE conname = 'agencies_domain_key'\n"
    "                 AND conrelid = 'public.agencies'::regclass) THEN\n"
    "    ALTER TABLE public.agencies ADD CONSTRAINT agencies_domain_key UNIQUE (domain);\n"
    "  END IF;\n"
    "END $$",
    "CREATE INDEX IF NOT EXISTS idx_agencies_created_at ON public.agencies(created_at)",
    "CREATE INDEX IF NOT EXISTS idx_agencies_is_active ON public.agencies(is_active)",

    "CREATE TABLE IF NOT EXISTS public.agency_settings (\n"
    "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),\n"
    "  agency_id UUID REFERENCES public.agencies(id) ON DELETE CASCADE,\n"
    "  agency_name TEXT,\n"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
    "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now()\n"
    ")",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS agency_id UUID "
    "REFERENCES public.agencies(id) ON DELETE CASCADE",
    "DO $$\n"
    "BEGIN\n"
    "  IF NOT EXISTS (SELECT 1 FROM pg_constraint WHERE conname = 'agency_settings_agency_id_key') THEN\n"
    "    ALTER TABLE public.agency_settings ADD CONSTRAINT agency_settings_agency_id_key UNIQUE (agency_id);\n"
    "  END IF;\n"
    "END $$",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS primary_focus TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS enable_gst BOOLEAN DEFAULT false",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS onboarding JSONB",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS industry TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS phone TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS address_street TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS address_city TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS address_state TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS address_zip TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS address_country TEXT",
    "ALTER TABLE public.agency_settings ADD COLUMN IF NOT EXISTS employee_count TEXT",

    "CREATE TABLE IF NOT EXISTS public.page_catalog (\n"
    "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),\n"
    "  path TEXT NOT NULL UNIQUE,\n"
    "  title TEXT NOT NULL,\n"
    "  description TEXT,\n"
    "  icon TEXT,\n"
    "  category TEXT NOT NULL,\n"
    "  base_cost NUMERIC(12,2) NOT NULL DEFAULT 0,\n"
    "  is_active BOOLEAN NOT NULL DEFAULT true,\n"
    "  requires_approval BOOLEAN NOT NULL DEFAULT false,\n"
    "  metadata JSONB DEFAULT '{}'::jsonb,\n"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
    "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now()\n"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_page_catalog_is_active ON public.page_catalog(is_active)",
    "CREATE TABLE IF NOT EXISTS public.agency_page_assignments (\n"
    "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),\n"
    "  agency_id UUID NOT NULL REFERENCES public.agencies(id) ON DELETE CASCADE,\n"
    "  page_id UUID NOT NULL REFERENCES public.page_catalog(id) ON DELETE CASCADE,\n"
    "  assigned_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
    "  assigned_by UUID,\n"
    "  cost_override NUMERIC(12,2),\n"
    "  status TEXT NOT NULL DEFAULT 'active'\n"
    "    CHECK (status IN ('active', 'pending_approval', 'suspended')),\n"
    "  metadata JSONB DEFAULT '{}'::jsonb,\n"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
    "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
    "  UNIQUE (agency_id, page_id)\n"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_agency_page_assignments_agency_id "
    "ON public.agency_page_assignments(agency_id)",
};

TenantRecord row_to_record(const std::vector<std::string>& row) {
    TenantRecord r;
    if (row.size() < 9) return r;
    r.id = row[0];
    r.name = row[1];
    r.domain = row[2];
    r.database_name = row[3];
    r.owner_user_id = row[4];
    r.subscription_plan = row[5];
    r.max_users = utils::parse_int<int32_t>(row[6], 0);
    r.is_active = row[7] == "t" || row[7] == "true";
    r.created_at = row[8];
    return r;
}

std::string escape_like(std::string_view s) {
    std::string out;
    for (const char c : s) {
        if (c == '\\' || c == '%' || c == '_') out += '\\';
        out += c;
    }
    return out;
}

SqlParam optional_param(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

std::string onboarding_json(const OnboardingMetadata& m) {
    nlohmann::json j = nlohmann::json::object();
    if (m.industry) j["industry"] = *m.industry;
    if (m.employee_count) j["employee_count"] = *m.employee_count;
    if (m.primary_focus) j["primary_focus"] = *m.primary_focus;
    if (m.country) j["country"] = *m.country;
    if (m.timezone) j["timezone"] = *m.timezone;
    if (m.currency) j["currency"] = *m.currency;
    if (m.language) j["language"] = *m.language;
    j["enable_gst"] = m.enable_gst;
    if (!m.page_ids.empty()) j["page_ids"] = m.page_ids;
    return j.dump();
}

/**
 * @brief "{a,b}" literal for a uuid[] parameter (ids already validated)
 */
std::string uuid_array_literal(const std::vector<std::string>& ids) {
    std::string out = "{";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ',';
        out += ids[i];
    }
    out += '}';
    return out;
}

} // namespace

PgTenantDirectory::PgTenantDirectory(std::shared_ptr<TenantPoolRegistry> registry,
                                     std::string main_database)
    : registry_(std::move(registry)), main_database_(std::move(main_database)) {}

Result<std::unique_ptr<PooledConnection>> PgTenantDirectory::connect() {
    auto conn = registry_->acquire(main_database_);
    if (conn.is_error() || schema_ready_.load(std::memory_order_acquire)) {
        return conn;
    }

    std::lock_guard lock(schema_mutex_);
    if (schema_ready_.load(std::memory_order_relaxed)) {
        return conn;
    }
    for (const char* sql : kCentralSchema) {
        const auto res = run_sql(**conn.value(), sql);
        if (res.is_error()) {
            utils::log::error(std::format("Central schema on '{}' failed: {}",
                main_database_, res.error_message()));
            return Result<std::unique_ptr<PooledConnection>>::error_from(res);
        }
    }
    schema_ready_.store(true, std::memory_order_release);
    utils::log::info(std::format("Central schema ready on '{}'", main_database_));
    return conn;
}

Result<std::optional<TenantRecord>> PgTenantDirectory::find_one(
    const std::string& where_clause, const std::vector<SqlParam>& params) {

    using FindResult = Result<std::optional<TenantRecord>>;

    auto conn = connect();
    if (conn.is_error()) {
        return FindResult::error_from(conn);
    }
    const auto res = run_sql(**conn.value(), std::string(kSelectTenant) + where_clause, params);
    if (res.is_error()) {
        return FindResult::error_from(res);
    }
    if (res.value().empty()) {
        return FindResult::ok(std::nullopt);
    }
    return FindResult::ok(row_to_record(res.value().rows.front()));
}

Result<std::optional<TenantRecord>> PgTenantDirectory::find_by_domain(const std::string& domain) {
    // "acme", "acme.example.com" and "acme.other.io" all claim the prefix "acme"
    const auto sub = identifier::subdomain_of(domain);
    return find_one("WHERE domain = $1 OR domain LIKE $2 ORDER BY created_at ASC LIMIT 1",
        {sub, escape_like(sub) + ".%"});
}

Result<std::optional<TenantRecord>> PgTenantDirectory::find_by_database_name(
    const std::string& database_name) {
    return find_one("WHERE database_name = $1 LIMIT 1", {database_name});
}

Result<void> PgTenantDirectory::commit_tenant(const TenantRecord& record,
                                              const OnboardingMetadata& metadata) {
    auto conn = connect();
    if (conn.is_error()) {
        return Result<void>::error_from(conn);
    }
    IDbConnection& db = **conn.value();

    ScopedTransaction tx(db);
    if (auto begun = tx.begin(); begun.is_error()) {
        return begun;
    }

    // Executed directly so the constraint name of a unique violation is visible
    const auto inserted = db.execute(
        "INSERT INTO public.agencies (id, name, domain, database_name, owner_user_id, "
        "is_active, subscription_plan, max_users) VALUES ($1, $2, $3, $4, $5, true, $6, $7) "
        "ON CONFLICT (id) DO UPDATE SET database_name = EXCLUDED.database_name, "
        "owner_user_id = COALESCE(public.agencies.owner_user_id, EXCLUDED.owner_user_id)",
        {record.id, record.name, record.domain, record.database_name,
         optional_param(record.owner_user_id), record.subscription_plan,
         std::to_string(record.max_users)});
    if (!inserted.success) {
        if (inserted.sqlstate == "23505" &&
            (inserted.constraint_name == "agencies_domain_key" ||
             utils::contains(inserted.error_message, "agencies_domain_key") ||
             utils::contains(inserted.error_message, "(domain)"))) {
            return Result<void>::error(ErrorCode::DOMAIN_CONFLICT,
                std::format("Domain '{}' is already registered", record.domain), "23505");
        }
        return Result<void>::error(ErrorCode::QUERY_FAILED,
            utils::trim(inserted.error_message), inserted.sqlstate);
    }

    const Address addr = metadata.resolved_address();
    const auto mirrored = run_sql(db,
        "INSERT INTO public.agency_settings (agency_id, agency_name, primary_focus, enable_gst, "
        "onboarding, industry, phone, address_street, address_city, address_state, address_zip, "
        "address_country, employee_count, created_at, updated_at) "
        "VALUES ($1, $2, $3, $4, $5::jsonb, $6, $7, $8, $9, $10, $11, $12, $13, NOW(), NOW()) "
        "ON CONFLICT (agency_id) DO UPDATE SET "
        "agency_name = EXCLUDED.agency_name, "
        "primary_focus = COALESCE(EXCLUDED.primary_focus, public.agency_settings.primary_focus), "
        "enable_gst = COALESCE(EXCLUDED.enable_gst, public.agency_settings.enable_gst), "
        "onboarding = COALESCE(EXCLUDED.onboarding, public.agency_settings.onboarding), "
        "industry = COALESCE(EXCLUDED.industry, public.agency_settings.industry), "
        "phone = COALESCE(EXCLUDED.phone, public.agency_settings.phone), "
        "address_street = COALESCE(EXCLUDED.address_street, public.agency_settings.address_street), "
        "address_city = COALESCE(EXCLUDED.address_city, public.agency_settings.address_city), "
        "address_state = COALESCE(EXCLUDED.address_state, public.agency_settings.address_state), "
        "address_zip = COALESCE(EXCLUDED.address_zip, public.agency_settings.address_zip), "
        "address_country = COALESCE(EXCLUDED.address_country, public.agency_settings.address_country), "
        "employee_count = COALESCE(EXCLUDED.employee_count, public.agency_settings.employee_count), "
        "updated_at = NOW()",
        {record.id, record.name, metadata.primary_focus,
         std::string(metadata.enable_gst ? "true" : "false"), onboarding_json(metadata),
         metadata.industry, metadata.phone, addr.street, addr.city, addr.state, addr.zip,
         addr.country, metadata.employee_count});
    if (mirrored.is_error()) {
        return Result<void>::error_from(mirrored);
    }

    return tx.commit();
}

Result<size_t> PgTenantDirectory::assign_default_pages(const std::string& tenant_id,
                                                       const std::vector<std::string>& page_ids) {
    auto conn = connect();
    if (conn.is_error()) {
        return Result<size_t>::error_from(conn);
    }
    IDbConnection& db = **conn.value();

    Result<DbResultSet> pages = Result<DbResultSet>::ok(DbResultSet{});
    if (page_ids.empty()) {
        pages = run_sql(db, "SELECT id::text FROM public.page_catalog WHERE is_active = true");
    } else {
        std::vector<std::string> valid;
        for (const auto& id : page_ids) {
            if (identifier::is_valid_uuid(id)) {
                valid.push_back(id);
            } else {
                utils::log::warn(std::format("Ignoring malformed page id '{}'", id));
            }
        }
        if (valid.empty()) {
            return Result<size_t>::ok(0);
        }
        pages = run_sql(db,
            "SELECT id::text FROM public.page_catalog WHERE id = ANY($1::uuid[]) AND is_active = true",
            {uuid_array_literal(valid)});
    }
    if (pages.is_error()) {
        return Result<size_t>::error_from(pages);
    }

    size_t assigned = 0;
    for (const auto& row : pages.value().rows) {
        if (row.empty()) continue;
        const auto res = run_sql(db,
            "INSERT INTO public.agency_page_assignments (agency_id, page_id, assigned_by, status) "
            "VALUES ($1, $2, NULL, 'active') "
            "ON CONFLICT (agency_id, page_id) DO UPDATE SET status = 'active', updated_at = now()",
            {tenant_id, row.front()});
        if (res.is_error()) {
            return Result<size_t>::error_from(res);
        }
        ++assigned;
    }
    return Result<size_t>::ok(assigned);
}

Result<void> PgTenantDirectory::delete_tenant_record(const std::string& tenant_id) {
    auto conn = connect();
    if (conn.is_error()) {
        return Result<void>::error_from(conn);
    }
    IDbConnection& db = **conn.value();

    ScopedTransaction tx(db);
    if (auto begun = tx.begin(); begun.is_error()) {
        return begun;
    }

    for (const char* table : {"agency_page_assignments", "agency_settings"}) {
        const auto removed = run_sql(db,
            std::format("DELETE FROM public.{} WHERE agency_id = $1", table), {tenant_id});
        if (removed.is_error()) {
            return Result<void>::error_from(removed);
        }
    }

    const auto removed = run_sql(db, "DELETE FROM public.agencies WHERE id = $1", {tenant_id});
    if (removed.is_error()) {
        return Result<void>::error_from(removed);
    }
    if (removed.value().affected_rows == 0) {
        return Result<void>::error(ErrorCode::NOT_FOUND,
            std::format("Tenant '{}' not found in the central directory", tenant_id));
    }
    return tx.commit();
}

} // namespace tenantcore
