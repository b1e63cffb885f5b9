#pragma once

#include "session/session_store.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tenantcore::testing {

/**
 * @brief ISessionStore held in memory, keyed by tenant database
 */
class InMemorySessionStore : public ISessionStore {
public:
    Result<SessionRecord> insert(const std::string& database, const SessionRecord& record) override {
        std::lock_guard lock(mutex_);
        if (fail_inserts_) {
            return Result<SessionRecord>::error(ErrorCode::QUERY_FAILED, "insert rejected", "23505");
        }
        inserts_.fetch_add(1);
        rows_[database].push_back(record);
        return Result<SessionRecord>::ok(record);
    }

    Result<std::vector<SessionRecord>> list_active(const std::string& database,
                                                   const std::string& user_id) override {
        std::lock_guard lock(mutex_);
        const auto now = SessionClock::now();
        std::vector<SessionRecord> out;
        for (const auto& r : rows_[database]) {
            if (r.user_id == user_id && r.is_live(now)) out.push_back(r);
        }
        std::sort(out.begin(), out.end(), [](const SessionRecord& a, const SessionRecord& b) {
            return a.last_activity_at < b.last_activity_at;
        });
        return Result<std::vector<SessionRecord>>::ok(std::move(out));
    }

    Result<std::optional<SessionRecord>> find_by_token_hash(const std::string& database,
                                                            const std::string& token_hash) override {
        std::lock_guard lock(mutex_);
        lookups_.fetch_add(1);
        for (const auto& r : rows_[database]) {
            if (r.token_hash == token_hash) return Result<std::optional<SessionRecord>>::ok(r);
        }
        return Result<std::optional<SessionRecord>>::ok(std::nullopt);
    }

    Result<void> touch(const std::string& database, const std::string& session_id,
                       SessionClock::time_point at) override {
        std::lock_guard lock(mutex_);
        for (auto& r : rows_[database]) {
            if (r.id == session_id) r.last_activity_at = at;
        }
        return Result<void>::ok();
    }

    Result<std::optional<std::string>> revoke(const std::string& database, const std::string& session_id,
                                              const std::string& reason) override {
        std::lock_guard lock(mutex_);
        for (auto& r : rows_[database]) {
            if (r.id == session_id && r.is_active && !r.revoked_at) {
                mark_revoked(r, reason);
                return Result<std::optional<std::string>>::ok(r.token_hash);
            }
        }
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    Result<std::vector<std::string>> revoke_user_sessions(const std::string& database,
                                                          const std::string& user_id,
                                                          const std::string& except_session_id,
                                                          const std::string& reason) override {
        std::lock_guard lock(mutex_);
        std::vector<std::string> hashes;
        for (auto& r : rows_[database]) {
            if (r.user_id != user_id || !r.is_active || r.revoked_at) continue;
            if (!except_session_id.empty() && r.id == except_session_id) continue;
            mark_revoked(r, reason);
            hashes.push_back(r.token_hash);
        }
        return Result<std::vector<std::string>>::ok(std::move(hashes));
    }

    Result<std::vector<std::string>> delete_expired(const std::string& database) override {
        std::lock_guard lock(mutex_);
        const auto now = SessionClock::now();
        std::vector<std::string> hashes;
        auto& rows = rows_[database];
        std::erase_if(rows, [&](const SessionRecord& r) {
            if (r.is_live(now)) return false;
            hashes.push_back(r.token_hash);
            return true;
        });
        return Result<std::vector<std::string>>::ok(std::move(hashes));
    }

    // ---- test helpers -------------------------------------------------------

    void set_last_activity(const std::string& database, const std::string& session_id,
                           SessionClock::time_point at) {
        std::lock_guard lock(mutex_);
        for (auto& r : rows_[database]) {
            if (r.id == session_id) r.last_activity_at = at;
        }
    }

    void set_expires_at(const std::string& database, const std::string& session_id,
                        SessionClock::time_point at) {
        std::lock_guard lock(mutex_);
        for (auto& r : rows_[database]) {
            if (r.id == session_id) r.expires_at = at;
        }
    }

    [[nodiscard]] std::optional<SessionRecord> get(const std::string& database, const std::string& session_id) {
        std::lock_guard lock(mutex_);
        for (const auto& r : rows_[database]) {
            if (r.id == session_id) return r;
        }
        return std::nullopt;
    }

    [[nodiscard]] size_t row_count(const std::string& database) {
        std::lock_guard lock(mutex_);
        return rows_[database].size();
    }

    void set_fail_inserts(bool fail) {
        std::lock_guard lock(mutex_);
        fail_inserts_ = fail;
    }

    [[nodiscard]] size_t inserts() const { return inserts_.load(); }
    [[nodiscard]] size_t lookups() const { return lookups_.load(); }

private:
    static void mark_revoked(SessionRecord& r, const std::string& reason) {
        r.is_active = false;
        r.revoked_at = SessionClock::now();
        r.revoke_reason = reason;
    }

    std::mutex mutex_;
    std::map<std::string, std::vector<SessionRecord>> rows_;
    bool fail_inserts_ = false;
    std::atomic<size_t> inserts_{0};
    std::atomic<size_t> lookups_{0};
};

} // namespace tenantcore::testing
