#pragma once

#include "core/error.hpp"
#include "session/session_cache.hpp"
#include "session/session_record.hpp"
#include "session/session_store.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tenantcore {

/**
 * @brief Per-user concurrent session accounting
 *
 * Creating a session beyond the tenant's ceiling revokes the least recently
 * active one first, so a user never holds more than the ceiling. Validation
 * prefers the cache, falls back to the store, and revokes idle sessions
 * lazily.
 */
class SessionGovernor {
public:
    static constexpr const char* kReasonSessionLimit = "session_limit";
    static constexpr const char* kReasonIdleTimeout = "idle_timeout";
    static constexpr const char* kReasonManual = "manual";

    struct Config {
        SessionPolicy defaults;
        SessionCache::Config cache;
    };

    SessionGovernor(Config config, std::shared_ptr<ISessionStore> store);

    [[nodiscard]] Result<SessionRecord> create_session(const std::string& database,
                                                       const std::string& user_id,
                                                       const std::string& token,
                                                       const CreateSessionOptions& options = {});

    /**
     * @return The refreshed session, or nullopt when unknown, revoked, expired or idle
     */
    [[nodiscard]] Result<std::optional<SessionRecord>> validate_session(const std::string& database,
                                                                        const std::string& token);

    /**
     * @return false if no active session has that id
     */
    [[nodiscard]] Result<bool> revoke_session(const std::string& database, const std::string& session_id,
                                              const std::string& reason = kReasonManual);

    /**
     * @param except_session_id Session to keep (e.g. the caller's own); empty keeps none
     * @return Number of sessions revoked
     */
    [[nodiscard]] Result<size_t> revoke_all_user_sessions(const std::string& database,
                                                          const std::string& user_id,
                                                          const std::string& except_session_id = {});

    [[nodiscard]] Result<std::vector<SessionRecord>> list_active_sessions(const std::string& database,
                                                                          const std::string& user_id);

    /**
     * @brief Delete expired and revoked rows
     * @return Number of rows deleted
     */
    [[nodiscard]] Result<size_t> cleanup_expired_sessions(const std::string& database);

    [[nodiscard]] Result<void> set_tenant_policy(const std::string& database, const SessionPolicy& policy);
    [[nodiscard]] SessionPolicy policy_for(const std::string& database) const;

    struct Stats {
        uint64_t sessions_created;
        uint64_t limit_evictions;
        uint64_t idle_revocations;
        uint64_t validations;
        SessionCache::Stats cache;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    static constexpr size_t kUserLockStripes = 64;

    std::mutex& user_lock(const std::string& database, const std::string& user_id);

    Config config_;
    std::shared_ptr<ISessionStore> store_;
    SessionCache cache_;

    mutable std::shared_mutex policy_mutex_;
    std::unordered_map<std::string, SessionPolicy> policies_;

    // Serializes count-then-insert per user so concurrent logins cannot overshoot the ceiling
    std::array<std::mutex, kUserLockStripes> user_locks_;

    std::atomic<uint64_t> sessions_created_{0};
    std::atomic<uint64_t> limit_evictions_{0};
    std::atomic<uint64_t> idle_revocations_{0};
    std::atomic<uint64_t> validations_{0};
};

} // namespace tenantcore
