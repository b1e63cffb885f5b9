#pragma once

#include "core/error.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace tenantcore {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 0;
    size_t max_connections = 5;
    std::chrono::milliseconds idle_timeout{300000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
    uint32_t statement_timeout_ms = 30000;    // 0 = server default
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t saturated_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
    size_t discarded_on_return = 0;

    // Acquire time histogram (microseconds)
    // Buckets: ≤100μs, ≤500μs, ≤1ms, ≤5ms, ≤50ms, +Inf
    uint64_t acquire_time_sum_us = 0;
    uint64_t acquire_time_count = 0;
    std::array<uint64_t, 6> acquire_time_buckets = {};
};

/**
 * @brief Abstract connection pool interface
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time when the pool is at its ceiling
     * @return RAII connection handle, POOL_SATURATED on timeout, or the
     *         classified connection error
     */
    [[nodiscard]] virtual Result<std::unique_ptr<PooledConnection>> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Stop handing out connections and close idle ones
     */
    virtual void drain() = 0;

    /**
     * @brief Drain, then wait for borrowed connections to come back
     * @return Number of connections still borrowed at the deadline
     */
    virtual size_t shutdown(std::chrono::milliseconds drain_timeout) = 0;

    /**
     * @brief Connections currently borrowed
     */
    [[nodiscard]] virtual size_t borrowed() const = 0;

    /**
     * @brief Get database name this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace tenantcore
