#pragma once

#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/identifier.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tenantcore {

/**
 * @brief Process-wide map of tenant database name -> connection pool
 *
 * Lifecycle: empty at startup, a pool is added on the first acquire for a
 * name and removed only by evict(), the LRU cap, the idle sweep or
 * close_all().
 *
 * Pool construction is coalesced per key: the first caller publishes a
 * shared_future under the registry lock and builds the pool outside it;
 * concurrent callers for the same name wait on that future, callers for
 * other names are never blocked by it. A failed construction is not
 * cached, the next acquire retries.
 */
class TenantPoolRegistry {
public:
    struct Config {
        size_t max_connections_per_pool = 5;
        size_t min_connections = 1;     // >0 makes pool creation probe the database
        size_t max_pools = 50;
        std::chrono::milliseconds acquire_timeout{5000};
        std::chrono::seconds idle_pool_timeout{1800};
        std::chrono::milliseconds drain_timeout{5000};
        uint32_t statement_timeout_ms = 30000;
    };

    using PoolResult = Result<std::shared_ptr<IConnectionPool>>;
    using PoolFactory = std::function<PoolResult(const std::string& database, size_t max_conn)>;

    /**
     * @brief Default factory: GenericConnectionPool over the given cluster
     */
    [[nodiscard]] static PoolFactory make_pool_factory(
        ClusterCoordinates cluster, std::shared_ptr<IConnectionFactory> connections, Config config);

    TenantPoolRegistry(Config config, PoolFactory factory);
    ~TenantPoolRegistry();

    TenantPoolRegistry(const TenantPoolRegistry&) = delete;
    TenantPoolRegistry& operator=(const TenantPoolRegistry&) = delete;

    /**
     * @brief Borrow a connection to the tenant database
     *
     * Errors: INVALID_IDENTIFIER, TENANT_DATABASE_NOT_FOUND,
     * TENANT_UNREACHABLE (retryable), TENANT_CONFIG_INVALID,
     * POOL_SATURATED (retryable).
     */
    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire(const std::string& database);
    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire(
        const std::string& database, std::chrono::milliseconds timeout);

    /**
     * @brief Get (or lazily create) the pool for a tenant database
     */
    [[nodiscard]] PoolResult get_pool(const std::string& database);

    /**
     * @brief Return a borrowed connection to its pool
     */
    void release(std::unique_ptr<PooledConnection> handle);

    struct EvictResult {
        bool found = false;
        size_t outstanding = 0;   // borrows still out at the drain deadline
    };

    /**
     * @brief Close and remove the pool for a tenant database
     *
     * New acquires on the old pool fail with TENANT_UNREACHABLE; borrowed
     * connections get drain_timeout to come back and are closed on return.
     */
    EvictResult evict(const std::string& database);

    /**
     * @brief Evict pools unused for idle_pool_timeout with nothing borrowed
     * @return Number of pools evicted
     */
    size_t sweep_idle_pools();

    /**
     * @brief Evict every pool (process shutdown)
     */
    void close_all();

    /**
     * @brief Override the connection ceiling for one tenant (next pool creation)
     */
    void set_tenant_limit(const std::string& database, size_t max_conn);

    [[nodiscard]] bool contains(const std::string& database) const;

    struct Stats {
        size_t total_pools;
        uint64_t pools_created;
        uint64_t pools_evicted;
        uint64_t creation_failures;
        std::unordered_map<std::string, PoolStats> pools;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        std::shared_future<PoolResult> ready;
        std::atomic<Clock::rep> last_used{0};

        void touch() { last_used.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed); }
    };

    /**
     * @brief Pool of a slot if its construction finished successfully
     */
    static std::shared_ptr<IConnectionPool> ready_pool(const Slot& slot);

    /**
     * @brief Pick LRU idle victims so one more pool fits (caller holds unique lock)
     */
    std::vector<std::shared_ptr<Slot>> take_lru_victims_locked();

    size_t shutdown_slots(const std::vector<std::shared_ptr<Slot>>& slots);

    Config config_;
    PoolFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> pools_;
    std::unordered_map<std::string, size_t> tenant_max_connections_;
    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> pools_created_{0};
    std::atomic<uint64_t> pools_evicted_{0};
    std::atomic<uint64_t> creation_failures_{0};
};

} // namespace tenantcore
