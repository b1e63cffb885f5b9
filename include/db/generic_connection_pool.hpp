#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace tenantcore {

/**
 * @brief Bounded connection pool for one tenant database
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20);
 *   this is the per-tenant ceiling, waits beyond it end in POOL_SATURATED
 * - Lazy initialization: connections created on-demand up to max
 * - Health checking: validates connections idle longer than idle_timeout;
 *   borrows returned disconnected or discarded are closed, not reused
 * - Thread-safe: mutex protects deque, semaphore prevents oversubscription
 * - RAII: PooledConnection auto-returns on destruction
 *
 * Must be owned by a std::shared_ptr: borrowed connections keep the pool
 * alive until they are returned, so eviction never leaves a dangling pool.
 */
class GenericConnectionPool : public IConnectionPool,
                              public std::enable_shared_from_this<GenericConnectionPool> {
public:
    /**
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    /**
     * @brief Open min_connections up front
     * @return The first connection error, if the database is unusable
     */
    Result<void> warm_up();

    Result<std::unique_ptr<PooledConnection>> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    size_t shutdown(std::chrono::milliseconds drain_timeout) override;

    size_t borrowed() const override {
        return borrowed_.load(std::memory_order_acquire);
    }

    const std::string& name() const override { return db_name_; }

private:
    /**
     * @brief Create new connection via factory and apply the statement timeout
     */
    Result<std::unique_ptr<IDbConnection>> create_connection();

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    void forget(IDbConnection* conn);
    void record_acquire_time(std::chrono::steady_clock::time_point start);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;
    std::condition_variable returned_cv_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> borrowed_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> saturated_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> discarded_on_return_{0};
    std::atomic<uint64_t> acquire_time_sum_us_{0};
    std::atomic<uint64_t> acquire_time_count_{0};
    std::array<std::atomic<uint64_t>, 6> acquire_time_buckets_{};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};

    // Connection lifetime tracking
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
};

} // namespace tenantcore
