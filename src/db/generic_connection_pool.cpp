#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace tenantcore {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

Result<void> GenericConnectionPool::warm_up() {
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (conn.is_error()) {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for database '{}': {}",
                i + 1, db_name_, conn.error_message()));
            return Result<void>::error_from(conn);
        }
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        created_at_[conn.value().get()] = now;
        last_used_[conn.value().get()] = now;
        idle_connections_.emplace_back(std::move(conn.value()));
    }

    utils::log::info(std::format("ConnectionPool initialized for database '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
    return Result<void>::ok();
}

Result<std::unique_ptr<PooledConnection>> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    using AcquireResult = Result<std::unique_ptr<PooledConnection>>;
    const auto acquire_start = std::chrono::steady_clock::now();

    if (shutdown_.load(std::memory_order_acquire)) {
        return AcquireResult::error(ErrorCode::TENANT_UNREACHABLE,
            std::format("Pool for '{}' is shut down", db_name_));
    }

    // Acquire semaphore slot (blocks while the tenant is at its ceiling)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        saturated_acquires_.fetch_add(1, std::memory_order_relaxed);
        return AcquireResult::error(ErrorCode::POOL_SATURATED,
            std::format("Pool for '{}' saturated: {} connections busy after {}ms",
                db_name_, config_.max_connections, timeout.count()));
    }

    // Re-check shutdown: evict may have run while we waited on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return AcquireResult::error(ErrorCode::TENANT_UNREACHABLE,
            std::format("Pool for '{}' is shut down", db_name_));
    }

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = created_at_.find(conn.get()); it != created_at_.end()) birth = it->second;
            if (const auto lu = last_used_.find(conn.get()); lu != last_used_.end()) last_used = lu->second;
        }
    }

    const auto replace = [&]() -> Result<void> {
        auto fresh = create_connection();
        if (fresh.is_error()) {
            return Result<void>::error_from(fresh);
        }
        conn = std::move(fresh.value());
        const auto now = std::chrono::steady_clock::now();
        birth = now;
        last_used = now;
        std::lock_guard lock(mutex_);
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
        return Result<void>::ok();
    };

    const auto discard = [&]() {
        forget(conn.get());
        conn->close();
        conn.reset();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
    };

    Result<void> ready = Result<void>::ok();
    if (!conn) {
        ready = replace();
    } else if (config_.max_lifetime.count() > 0 &&
               std::chrono::steady_clock::now() - birth > config_.max_lifetime) {
        discard();
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Recycling connection to '{}' past max_lifetime", db_name_));
        ready = replace();
    } else if (std::chrono::steady_clock::now() - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Only connections idle past idle_timeout pay for a health round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Idle connection to '{}' failed its health check", db_name_));
        discard();
        ready = replace();
    }

    if (ready.is_error()) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return AcquireResult::error_from(ready);
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);
    borrowed_.fetch_add(1, std::memory_order_acq_rel);
    record_acquire_time(acquire_start);

    auto self = shared_from_this();
    auto return_fn = [self](std::unique_ptr<IDbConnection> c, bool reusable) {
        self->return_connection(std::move(c), reusable);
    };

    return AcquireResult::ok(std::make_unique<PooledConnection>(db_name_, std::move(conn), return_fn));
}

void GenericConnectionPool::record_acquire_time(std::chrono::steady_clock::time_point start) {
    const auto elapsed = std::chrono::steady_clock::now() - start;
    const auto us = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    acquire_time_sum_us_.fetch_add(us, std::memory_order_relaxed);
    acquire_time_count_.fetch_add(1, std::memory_order_relaxed);

    size_t bucket = 5;  // +Inf
    if (us <= 100)        bucket = 0;
    else if (us <= 500)   bucket = 1;
    else if (us <= 1000)  bucket = 2;
    else if (us <= 5000)  bucket = 3;
    else if (us <= 50000) bucket = 4;
    acquire_time_buckets_[bucket].fetch_add(1, std::memory_order_relaxed);
}

PoolStats GenericConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.idle_connections = idle_connections_.size();
    }
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.active_connections = borrowed_.load(std::memory_order_relaxed);
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.saturated_acquires = saturated_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.discarded_on_return = discarded_on_return_.load(std::memory_order_relaxed);

    stats.acquire_time_sum_us = acquire_time_sum_us_.load(std::memory_order_relaxed);
    stats.acquire_time_count = acquire_time_count_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < acquire_time_buckets_.size(); ++i) {
        stats.acquire_time_buckets[i] = acquire_time_buckets_[i].load(std::memory_order_relaxed);
    }

    return stats;
}

void GenericConnectionPool::drain() {
    const bool was_shutdown = shutdown_.exchange(true, std::memory_order_acq_rel);

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            created_at_.erase(conn.get());
            last_used_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();

    if (!was_shutdown) {
        utils::log::info(std::format("ConnectionPool drained for database '{}'", db_name_));
    }
}

size_t GenericConnectionPool::shutdown(std::chrono::milliseconds drain_timeout) {
    drain();

    std::unique_lock lock(mutex_);
    returned_cv_.wait_for(lock, drain_timeout, [this] {
        return borrowed_.load(std::memory_order_acquire) == 0;
    });

    const size_t outstanding = borrowed_.load(std::memory_order_acquire);
    if (outstanding > 0) {
        utils::log::warn(std::format("ConnectionPool for '{}' shut down with {} connection(s) still borrowed; "
            "they will be closed on return", db_name_, outstanding));
    }
    return outstanding;
}

Result<std::unique_ptr<IDbConnection>> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn.is_error()) {
        return conn;
    }
    if (config_.statement_timeout_ms > 0 &&
        !conn.value()->set_query_timeout(config_.statement_timeout_ms)) {
        utils::log::warn(std::format("Failed to set statement_timeout={}ms on connection to '{}'",
            config_.statement_timeout_ms, db_name_));
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

void GenericConnectionPool::forget(IDbConnection* conn) {
    std::lock_guard lock(mutex_);
    created_at_.erase(conn);
    last_used_.erase(conn);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire) || !reusable) {
        if (!reusable) {
            discarded_on_return_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format("Discarding returned connection to '{}'", db_name_));
        }
        forget(conn.get());
        conn->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
    } else {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    {
        std::lock_guard lock(mutex_);
        borrowed_.fetch_sub(1, std::memory_order_acq_rel);
    }
    returned_cv_.notify_all();
    semaphore_.release();
}

} // namespace tenantcore
