#include "session/session_governor.hpp"
#include "auth/credentials.hpp"
#include "db/identifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace tenantcore {

namespace {

Result<std::string> hash_token(const std::string& token) {
    if (token.empty()) {
        return Result<std::string>::error(ErrorCode::INVALID_ARGUMENT, "Session token is empty");
    }
    return Credentials::sha256_hex(token);
}

} // namespace

SessionGovernor::SessionGovernor(Config config, std::shared_ptr<ISessionStore> store)
    : config_(std::move(config)),
      store_(std::move(store)),
      cache_(config_.cache) {}

std::mutex& SessionGovernor::user_lock(const std::string& database, const std::string& user_id) {
    const size_t h = std::hash<std::string>{}(database) ^ (std::hash<std::string>{}(user_id) << 1);
    return user_locks_[h % kUserLockStripes];
}

Result<SessionRecord> SessionGovernor::create_session(const std::string& database,
                                                      const std::string& user_id,
                                                      const std::string& token,
                                                      const CreateSessionOptions& options) {
    if (!identifier::is_valid_uuid(user_id)) {
        return Result<SessionRecord>::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Invalid user id '{}'", user_id));
    }
    auto token_hash = hash_token(token);
    if (token_hash.is_error()) {
        return Result<SessionRecord>::error_from(token_hash);
    }

    const SessionPolicy policy = policy_for(database);
    std::lock_guard lock(user_lock(database, user_id));

    auto active = store_->list_active(database, user_id);
    if (active.is_error()) {
        return Result<SessionRecord>::error_from(active);
    }

    // Ceiling reached: revoke least recently active sessions until one slot is free
    auto& sessions = active.value();
    std::stable_sort(sessions.begin(), sessions.end(), [](const SessionRecord& a, const SessionRecord& b) {
        if (a.last_activity_at != b.last_activity_at) return a.last_activity_at < b.last_activity_at;
        return a.created_at < b.created_at;
    });
    size_t live = sessions.size();
    for (size_t i = 0; live >= policy.max_concurrent_sessions && i < sessions.size(); ++i) {
        const auto revoked = store_->revoke(database, sessions[i].id, kReasonSessionLimit);
        if (revoked.is_error()) {
            return Result<SessionRecord>::error_from(revoked);
        }
        if (revoked.value()) {
            cache_.erase(*revoked.value());
        }
        --live;
        limit_evictions_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("Session limit for user {} in {}: revoked session {}",
                                     user_id, database, sessions[i].id));
    }

    const auto now = SessionClock::now();
    SessionRecord record;
    record.id = utils::generate_uuid();
    record.user_id = user_id;
    record.token_hash = std::move(token_hash.value());
    record.ip_address = options.ip_address;
    record.user_agent = options.user_agent;
    record.device_info = options.device_info.is_null() ? nlohmann::json::object() : options.device_info;
    record.is_active = true;
    record.last_activity_at = now;
    record.created_at = now;
    record.expires_at = now + policy.session_timeout;

    auto stored = store_->insert(database, record);
    if (stored.is_error()) {
        return stored;
    }

    cache_.put(database, stored.value());
    sessions_created_.fetch_add(1, std::memory_order_relaxed);
    return stored;
}

Result<std::optional<SessionRecord>> SessionGovernor::validate_session(const std::string& database,
                                                                       const std::string& token) {
    using R = Result<std::optional<SessionRecord>>;

    auto token_hash = hash_token(token);
    if (token_hash.is_error()) {
        return R::error_from(token_hash);
    }
    const std::string& hash = token_hash.value();
    validations_.fetch_add(1, std::memory_order_relaxed);

    std::optional<SessionRecord> session = cache_.get(database, hash);
    if (!session) {
        auto found = store_->find_by_token_hash(database, hash);
        if (found.is_error()) {
            return R::error_from(found);
        }
        session = std::move(found.value());
        utils::log::debug(std::format("Session cache miss in {}; loaded from store", database));
    }

    const auto now = SessionClock::now();
    if (!session || !session->is_live(now)) {
        cache_.erase(hash);
        return R::ok(std::nullopt);
    }

    const SessionPolicy policy = policy_for(database);
    if (now - session->last_activity_at > policy.idle_timeout) {
        cache_.erase(hash);
        const auto revoked = store_->revoke(database, session->id, kReasonIdleTimeout);
        if (revoked.is_error()) {
            return R::error_from(revoked);
        }
        idle_revocations_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("Session {} in {} revoked after idle timeout",
                                     session->id, database));
        return R::ok(std::nullopt);
    }

    if (auto touched = store_->touch(database, session->id, now); touched.is_error()) {
        return R::error_from(touched);
    }
    session->last_activity_at = now;
    cache_.put(database, *session);
    return R::ok(std::move(session));
}

Result<bool> SessionGovernor::revoke_session(const std::string& database, const std::string& session_id,
                                             const std::string& reason) {
    if (!identifier::is_valid_uuid(session_id)) {
        return Result<bool>::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Invalid session id '{}'", session_id));
    }

    const auto revoked = store_->revoke(database, session_id, reason);
    if (revoked.is_error()) {
        return Result<bool>::error_from(revoked);
    }
    if (!revoked.value()) {
        return Result<bool>::ok(false);
    }
    cache_.erase(*revoked.value());
    return Result<bool>::ok(true);
}

Result<size_t> SessionGovernor::revoke_all_user_sessions(const std::string& database,
                                                         const std::string& user_id,
                                                         const std::string& except_session_id) {
    if (!identifier::is_valid_uuid(user_id)) {
        return Result<size_t>::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Invalid user id '{}'", user_id));
    }

    std::lock_guard lock(user_lock(database, user_id));
    const auto revoked = store_->revoke_user_sessions(database, user_id, except_session_id, kReasonManual);
    if (revoked.is_error()) {
        return Result<size_t>::error_from(revoked);
    }
    for (const auto& hash : revoked.value()) {
        cache_.erase(hash);
    }
    return Result<size_t>::ok(revoked.value().size());
}

Result<std::vector<SessionRecord>> SessionGovernor::list_active_sessions(const std::string& database,
                                                                         const std::string& user_id) {
    if (!identifier::is_valid_uuid(user_id)) {
        return Result<std::vector<SessionRecord>>::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Invalid user id '{}'", user_id));
    }
    return store_->list_active(database, user_id);
}

Result<size_t> SessionGovernor::cleanup_expired_sessions(const std::string& database) {
    const auto removed = store_->delete_expired(database);
    if (removed.is_error()) {
        return Result<size_t>::error_from(removed);
    }
    for (const auto& hash : removed.value()) {
        cache_.erase(hash);
    }
    if (!removed.value().empty()) {
        utils::log::info(std::format("Cleaned up {} expired sessions in {}",
                                     removed.value().size(), database));
    }
    return Result<size_t>::ok(removed.value().size());
}

Result<void> SessionGovernor::set_tenant_policy(const std::string& database, const SessionPolicy& policy) {
    if (policy.max_concurrent_sessions == 0) {
        return Result<void>::error(ErrorCode::INVALID_ARGUMENT,
            "max_concurrent_sessions must be at least 1");
    }
    if (policy.session_timeout.count() <= 0 || policy.idle_timeout.count() <= 0) {
        return Result<void>::error(ErrorCode::INVALID_ARGUMENT,
            "Session and idle timeouts must be positive");
    }

    std::unique_lock lock(policy_mutex_);
    policies_[database] = policy;
    return Result<void>::ok();
}

SessionPolicy SessionGovernor::policy_for(const std::string& database) const {
    std::shared_lock lock(policy_mutex_);
    const auto it = policies_.find(database);
    return it != policies_.end() ? it->second : config_.defaults;
}

SessionGovernor::Stats SessionGovernor::get_stats() const {
    return {
        .sessions_created = sessions_created_.load(std::memory_order_relaxed),
        .limit_evictions = limit_evictions_.load(std::memory_order_relaxed),
        .idle_revocations = idle_revocations_.load(std::memory_order_relaxed),
        .validations = validations_.load(std::memory_order_relaxed),
        .cache = cache_.get_stats(),
    };
}

} // namespace tenantcore
