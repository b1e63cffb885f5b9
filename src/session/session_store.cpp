#include "session/session_store.hpp"
#include "db/scoped_transaction.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantcore {

namespace {

constexpr const char* kSelectSession =
    "SELECT id::text, user_id::text, token_hash, ip_address, user_agent, "
    "COALESCE(device_info, '{}'::jsonb)::text, is_active::text, "
    "(EXTRACT(EPOCH FROM last_activity_at) * 1000000)::bigint::text, "
    "(EXTRACT(EPOCH FROM expires_at) * 1000000)::bigint::text, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint::text, "
    "(EXTRACT(EPOCH FROM revoked_at) * 1000000)::bigint::text, revoke_reason "
    "FROM public.user_sessions ";

constexpr const char* kLiveFilter =
    "is_active = true AND revoked_at IS NULL AND expires_at > NOW()";

// Timestamps cross the wire as microseconds since the epoch, the resolution
// of timestamptz, so activity ordering survives the round trip
SessionClock::time_point from_epoch_us(const std::string& s) {
    return SessionClock::time_point{std::chrono::duration_cast<SessionClock::duration>(
        std::chrono::microseconds{utils::parse_int<int64_t>(s, 0)})};
}

std::string to_epoch_us(SessionClock::time_point tp) {
    return std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count());
}

// SQL for the timestamptz bound at $n
std::string timestamp_param(int n) {
    return std::format("TIMESTAMPTZ 'epoch' + ${}::bigint * INTERVAL '1 microsecond'", n);
}

std::optional<std::string> optional_text(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

SessionRecord parse_row(const std::vector<std::string>& row) {
    SessionRecord r;
    if (row.size() < 12) return r;
    r.id = row[0];
    r.user_id = row[1];
    r.token_hash = row[2];
    r.ip_address = optional_text(row[3]);
    r.user_agent = optional_text(row[4]);
    r.device_info = nlohmann::json::parse(row[5], nullptr, false);
    if (r.device_info.is_discarded()) {
        r.device_info = nlohmann::json::object();
    }
    r.is_active = (row[6] == "t" || row[6] == "true");
    r.last_activity_at = from_epoch_us(row[7]);
    r.expires_at = from_epoch_us(row[8]);
    r.created_at = from_epoch_us(row[9]);
    if (!row[10].empty()) r.revoked_at = from_epoch_us(row[10]);
    r.revoke_reason = optional_text(row[11]);
    return r;
}

std::vector<std::string> first_column(const DbResultSet& rs) {
    std::vector<std::string> out;
    out.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (!row.empty()) out.push_back(row.front());
    }
    return out;
}

} // namespace

PgSessionStore::PgSessionStore(std::shared_ptr<TenantPoolRegistry> registry,
                               std::shared_ptr<SchemaRepairEngine> engine)
    : registry_(std::move(registry)), engine_(std::move(engine)) {}

Result<std::unique_ptr<PooledConnection>> PgSessionStore::connect(const std::string& database) {
    auto conn = registry_->acquire(database);
    if (conn.is_error()) {
        return conn;
    }

    {
        std::lock_guard lock(ensured_mutex_);
        if (ensured_.contains(database)) {
            return conn;
        }
    }

    for (const char* module : {"shared_functions", "session_management"}) {
        if (auto r = engine_->ensure_module(**conn.value(), module); r.is_error()) {
            return Result<std::unique_ptr<PooledConnection>>::error_from(r);
        }
    }

    std::lock_guard lock(ensured_mutex_);
    ensured_.insert(database);
    return conn;
}

Result<SessionRecord> PgSessionStore::insert(const std::string& database, const SessionRecord& record) {
    auto conn = connect(database);
    if (conn.is_error()) {
        return Result<SessionRecord>::error_from(conn);
    }

    const auto res = run_sql(**conn.value(),
        std::format("INSERT INTO public.user_sessions (id, user_id, token_hash, ip_address, user_agent, "
                    "device_info, is_active, last_activity_at, expires_at, created_at) "
                    "VALUES ($1::uuid, $2::uuid, $3, $4, $5, $6::jsonb, true, {}, {}, {}) RETURNING id",
                    timestamp_param(7), timestamp_param(8), timestamp_param(9)),
        {record.id, record.user_id, record.token_hash, record.ip_address, record.user_agent,
         record.device_info.dump(), to_epoch_us(record.last_activity_at),
         to_epoch_us(record.expires_at), to_epoch_us(record.created_at)});
    if (res.is_error()) {
        return Result<SessionRecord>::error_from(res);
    }

    SessionRecord stored = record;
    if (const auto id = res.value().scalar(); !id.empty()) {
        stored.id = id;
    }
    return Result<SessionRecord>::ok(std::move(stored));
}

Result<std::vector<SessionRecord>> PgSessionStore::list_active(const std::string& database,
                                                               const std::string& user_id) {
    auto conn = connect(database);
    if (conn.is_error()) {
        return Result<std::vector<SessionRecord>>::error_from(conn);
    }

    const auto res = run_sql(**conn.value(),
        std::format("{}WHERE user_id = $1::uuid AND {} ORDER BY last_activity_at ASC, created_at ASC",
                    kSelectSession, kLiveFilter),
        {user_id});
    if (res.is_error()) {
        return Result<std::vector<SessionRecord>>::error_from(res);
    }

    std::vector<SessionRecord> sessions;
    sessions.reserve(res.value().rows.size());
    for (const auto& row : res.value().rows) {
        sessions.push_back(parse_row(row));
    }
    return Result<std::vector<SessionRecord>>::ok(std::move(sessions));
}

Result<std::optional<SessionRecord>> PgSessionStore::find_by_token_hash(const std::string& database,
                                                                        const std::string& token_hash) {
    auto conn = connect(database);
    if (conn.is_error()) {
        return Result<std::optional<SessionRecord>>::error_from(conn);
    }

    const auto res = run_sql(**conn.value(),
        std::format("{}WHERE token_hash = $1 LIMIT 1", kSelectSession), {token_hash});
    if (res.is_error()) {
        return Result<std::optional<SessionRecord>>::error_from(res);
    }
    if (res.value().empty()) {
        return Result<std::optional<SessionRecord>>::ok(std::nullopt);
    }
    return Result<std::optional<SessionRecord>>::ok(parse_row(res.value().rows.front()));
}

Result<void> PgSessionStore::touch(const std::string& database, const std::string& session_id,
                                   SessionClock::time_point at) {
    auto conn = connect(database);
    if (conn.is_error()) {
        return Result<void>::error_from(conn);
    }

    const auto res = run_sql(**conn.value(),
        std::format("UPDATE public.user_sessions SET last_activity_at = {} WHERE id = $1::uuid",
                    timestamp_param(2)),
        {session_id, to_epoch_us(at)});
    if (res.is_error()) {
        return Result<void>::error_from(res);
    }
    return Result<void>::ok();
}

Result<std::optional<std::string>> PgSessionStore::revoke(const std::string& database,
                                                          const std::string& session_id,
                                                          const std::string& reason) {
    auto conn = connect(database);
    if (conn.is_error()) {
        return Result<std::optional<std::string>>::error_from(conn);
    }

    const auto res = run_sql(**conn.value(),
        "UPDATE public.user_sessions SET is_active = false, revoked_at = NOW(), revoke_reason = $2 "
        "WHERE id = $1::uuid AND is_active = true RETURNING token_hash",
        {session_id, reason});
    if (res.is_error()) {
        return Result<std::optional<std::string>>::error_from(res);
    }
    if (res.value().empty()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>>::ok(res.value().scalar());
}

Result<std::vector<std::string>> PgSessionStore::revoke_user_sessions(const std::string& database,
                                                                      const std::string& user_id,
                                                                      const std::string& except_session_id,
                                                                      const std::string& reason) {
    auto conn = connect(database);
    if (conn.is_error()) {
        return Result<std::vector<std::string>>::error_from(conn);
    }

    const SqlParam except = except_session_id.empty() ? SqlParam{} : SqlParam{except_session_id};
    const auto res = run_sql(**conn.value(),
        "UPDATE public.user_sessions SET is_active = false, revoked_at = NOW(), revoke_reason = $3 "
        "WHERE user_id = $1::uuid AND is_active = true AND revoked_at IS NULL "
        "AND ($2::uuid IS NULL OR id <> $2::uuid) RETURNING token_hash",
        {user_id, except, reason});
    if (res.is_error()) {
        return Result<std::vector<std::string>>::error_from(res);
    }
    return Result<std::vector<std::string>>::ok(first_column(res.value()));
}

Result<std::vector<std::string>> PgSessionStore::delete_expired(const std::string& database) {
    auto conn = connect(database);
    if (conn.is_error()) {
        return Result<std::vector<std::string>>::error_from(conn);
    }

    const auto res = run_sql(**conn.value(),
        "DELETE FROM public.user_sessions "
        "WHERE expires_at <= NOW() OR revoked_at IS NOT NULL OR is_active = false "
        "RETURNING token_hash");
    if (res.is_error()) {
        return Result<std::vector<std::string>>::error_from(res);
    }
    return Result<std::vector<std::string>>::ok(first_column(res.value()));
}

} // namespace tenantcore
