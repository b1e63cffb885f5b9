#pragma once

#include "core/error.hpp"
#include "db/tenant_pool_registry.hpp"
#include "schema/schema_repair_engine.hpp"
#include "session/session_record.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tenantcore {

/**
 * @brief Durable side of session accounting
 *
 * Every call names the tenant database it operates on.
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    [[nodiscard]] virtual Result<SessionRecord> insert(const std::string& database,
                                                       const SessionRecord& record) = 0;

    /**
     * @brief Live sessions of a user, least recently active first
     */
    [[nodiscard]] virtual Result<std::vector<SessionRecord>> list_active(
        const std::string& database, const std::string& user_id) = 0;

    [[nodiscard]] virtual Result<std::optional<SessionRecord>> find_by_token_hash(
        const std::string& database, const std::string& token_hash) = 0;

    [[nodiscard]] virtual Result<void> touch(const std::string& database, const std::string& session_id,
                                             SessionClock::time_point at) = 0;

    /**
     * @brief Revoke one session
     * @return Token hash of the revoked session, nullopt if no active session has that id
     */
    [[nodiscard]] virtual Result<std::optional<std::string>> revoke(
        const std::string& database, const std::string& session_id, const std::string& reason) = 0;

    /**
     * @return Token hashes of the revoked sessions
     */
    [[nodiscard]] virtual Result<std::vector<std::string>> revoke_user_sessions(
        const std::string& database, const std::string& user_id,
        const std::string& except_session_id, const std::string& reason) = 0;

    /**
     * @brief Delete expired and revoked rows
     * @return Token hashes of the deleted rows
     */
    [[nodiscard]] virtual Result<std::vector<std::string>> delete_expired(const std::string& database) = 0;
};

/**
 * @brief ISessionStore on pooled tenant connections
 *
 * The first call for a tenant applies the session_management module, so
 * tenants created before sessions existed get the table on demand.
 */
class PgSessionStore : public ISessionStore {
public:
    PgSessionStore(std::shared_ptr<TenantPoolRegistry> registry,
                   std::shared_ptr<SchemaRepairEngine> engine);

    Result<SessionRecord> insert(const std::string& database, const SessionRecord& record) override;
    Result<std::vector<SessionRecord>> list_active(const std::string& database,
                                                   const std::string& user_id) override;
    Result<std::optional<SessionRecord>> find_by_token_hash(const std::string& database,
                                                            const std::string& token_hash) override;
    Result<void> touch(const std::string& database, const std::string& session_id,
                       SessionClock::time_point at) override;
    Result<std::optional<std::string>> revoke(const std::string& database, const std::string& session_id,
                                              const std::string& reason) override;
    Result<std::vector<std::string>> revoke_user_sessions(const std::string& database,
                                                          const std::string& user_id,
                                                          const std::string& except_session_id,
                                                          const std::string& reason) override;
    Result<std::vector<std::string>> delete_expired(const std::string& database) override;

private:
    Result<std::unique_ptr<PooledConnection>> connect(const std::string& database);

    std::shared_ptr<TenantPoolRegistry> registry_;
    std::shared_ptr<SchemaRepairEngine> engine_;

    std::mutex ensured_mutex_;
    std::unordered_set<std::string> ensured_;
};

} // namespace tenantcore
