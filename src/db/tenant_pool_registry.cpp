#include "db/tenant_pool_registry.hpp"
#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace tenantcore {

TenantPoolRegistry::PoolFactory TenantPoolRegistry::make_pool_factory(
    ClusterCoordinates cluster, std::shared_ptr<IConnectionFactory> connections, Config config) {

    return [cluster = std::move(cluster), connections = std::move(connections), config](
               const std::string& database, size_t max_conn) -> PoolResult {
        const auto target = identifier::build_target(cluster, database);
        if (target.is_error()) {
            return PoolResult::error_from(target);
        }

        PoolConfig pool_config;
        pool_config.connection_string = target.value().connection_string;
        pool_config.max_connections = max_conn;
        pool_config.min_connections = std::min(config.min_connections, max_conn);
        pool_config.statement_timeout_ms = config.statement_timeout_ms;

        auto pool = std::make_shared<GenericConnectionPool>(database, pool_config, connections);
        const auto warmed = pool->warm_up();
        if (warmed.is_error()) {
            pool->drain();
            return PoolResult::error_from(warmed);
        }
        return PoolResult::ok(std::move(pool));
    };
}

TenantPoolRegistry::TenantPoolRegistry(Config config, PoolFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {}

TenantPoolRegistry::~TenantPoolRegistry() {
    close_all();
}

std::shared_ptr<IConnectionPool> TenantPoolRegistry::ready_pool(const Slot& slot) {
    if (!slot.ready.valid() ||
        slot.ready.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
        return nullptr;
    }
    const auto& res = slot.ready.get();
    return res.is_ok() ? res.value() : nullptr;
}

TenantPoolRegistry::PoolResult TenantPoolRegistry::get_pool(const std::string& database) {
    const auto name = identifier::validate_database_name(database);
    if (name.is_error()) {
        return PoolResult::error_from(name);
    }
    const std::string& key = name.value();

    // Fast path: shared lock (read-only)
    std::shared_ptr<Slot> slot;
    {
        std::shared_lock lock(mutex_);
        const auto it = pools_.find(key);
        if (it != pools_.end()) {
            slot = it->second;
        }
    }

    if (!slot) {
        std::promise<PoolResult> promise;
        std::vector<std::shared_ptr<Slot>> victims;
        size_t max_conn = config_.max_connections_per_pool;
        bool creator = false;

        {
            std::unique_lock lock(mutex_);

            // Double-check: another thread may have published the slot
            auto [it, inserted] = pools_.try_emplace(key, nullptr);
            if (inserted) {
                victims = take_lru_victims_locked();
                it->second = std::make_shared<Slot>();
                it->second->ready = promise.get_future().share();
                it->second->touch();
                if (const auto cfg_it = tenant_max_connections_.find(key);
                    cfg_it != tenant_max_connections_.end()) {
                    max_conn = cfg_it->second;
                }
                creator = true;
            }
            slot = it->second;
        }

        if (!victims.empty()) {
            shutdown_slots(victims);
            pools_evicted_.fetch_add(victims.size(), std::memory_order_relaxed);
        }

        if (creator) {
            // Build outside the registry lock so unrelated tenants proceed
            PoolResult created = factory_
                ? factory_(key, max_conn)
                : PoolResult::error(ErrorCode::INTERNAL_ERROR, "No pool factory configured");

            if (created.is_ok()) {
                pools_created_.fetch_add(1, std::memory_order_relaxed);
                utils::log::info(std::format("Created pool for tenant database '{}' (max_connections={})",
                    key, max_conn));
            } else {
                creation_failures_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("Pool creation for '{}' failed ({}): {}",
                    key, error_code_to_string(created.error_code()), created.error_message()));
                std::unique_lock lock(mutex_);
                const auto it = pools_.find(key);
                if (it != pools_.end() && it->second == slot) {
                    pools_.erase(it);
                }
            }
            promise.set_value(std::move(created));
        }
    }

    const PoolResult& result = slot->ready.get();
    if (result.is_ok()) {
        slot->touch();
    }
    return result;
}

Result<std::unique_ptr<PooledConnection>> TenantPoolRegistry::acquire(const std::string& database) {
    return acquire(database, config_.acquire_timeout);
}

Result<std::unique_ptr<PooledConnection>> TenantPoolRegistry::acquire(
    const std::string& database, std::chrono::milliseconds timeout) {

    auto pool = get_pool(database);
    if (pool.is_error()) {
        return Result<std::unique_ptr<PooledConnection>>::error_from(pool);
    }
    return pool.value()->acquire(timeout);
}

void TenantPoolRegistry::release(std::unique_ptr<PooledConnection> handle) {
    if (handle) {
        handle->release();
    }
}

std::vector<std::shared_ptr<TenantPoolRegistry::Slot>> TenantPoolRegistry::take_lru_victims_locked() {
    std::vector<std::shared_ptr<Slot>> victims;
    if (config_.max_pools == 0) {
        return victims;
    }

    // The new key is already in the map with a null slot
    while (pools_.size() > config_.max_pools) {
        auto victim = pools_.end();
        Clock::rep oldest = 0;
        for (auto it = pools_.begin(); it != pools_.end(); ++it) {
            if (!it->second) continue;
            const auto pool = ready_pool(*it->second);
            if (!pool || pool->borrowed() > 0) continue;
            const auto used = it->second->last_used.load(std::memory_order_relaxed);
            if (victim == pools_.end() || used < oldest) {
                victim = it;
                oldest = used;
            }
        }
        if (victim == pools_.end()) {
            utils::log::warn(std::format("Pool cap {} reached but every pool is busy; exceeding cap",
                config_.max_pools));
            break;
        }
        utils::log::info(std::format("Evicting least recently used pool '{}' (cap {})",
            victim->first, config_.max_pools));
        victims.push_back(victim->second);
        pools_.erase(victim);
    }
    return victims;
}

size_t TenantPoolRegistry::shutdown_slots(const std::vector<std::shared_ptr<Slot>>& slots) {
    size_t outstanding = 0;
    for (const auto& slot : slots) {
        const PoolResult& res = slot->ready.get();
        if (res.is_ok()) {
            outstanding += res.value()->shutdown(config_.drain_timeout);
        }
    }
    return outstanding;
}

TenantPoolRegistry::EvictResult TenantPoolRegistry::evict(const std::string& database) {
    std::shared_ptr<Slot> slot;
    {
        std::unique_lock lock(mutex_);
        const auto it = pools_.find(database);
        if (it == pools_.end()) {
            return EvictResult{};
        }
        slot = std::move(it->second);
        pools_.erase(it);
    }

    pools_evicted_.fetch_add(1, std::memory_order_relaxed);
    const size_t outstanding = shutdown_slots({slot});
    utils::log::info(std::format("Evicted pool for tenant database '{}' ({} borrow(s) outstanding)",
        database, outstanding));
    return EvictResult{.found = true, .outstanding = outstanding};
}

size_t TenantPoolRegistry::sweep_idle_pools() {
    const auto cutoff = (Clock::now() - config_.idle_pool_timeout).time_since_epoch().count();

    std::vector<std::shared_ptr<Slot>> idle;
    {
        std::unique_lock lock(mutex_);
        for (auto it = pools_.begin(); it != pools_.end(); ) {
            const auto pool = ready_pool(*it->second);
            if (pool && pool->borrowed() == 0 &&
                it->second->last_used.load(std::memory_order_relaxed) < cutoff) {
                utils::log::info(std::format("Closing idle pool '{}'", it->first));
                idle.push_back(std::move(it->second));
                it = pools_.erase(it);
            } else {
                ++it;
            }
        }
    }

    shutdown_slots(idle);
    pools_evicted_.fetch_add(idle.size(), std::memory_order_relaxed);
    return idle.size();
}

void TenantPoolRegistry::close_all() {
    std::vector<std::shared_ptr<Slot>> all;
    {
        std::unique_lock lock(mutex_);
        all.reserve(pools_.size());
        for (auto& [key, slot] : pools_) {
            if (slot) all.push_back(std::move(slot));
        }
        pools_.clear();
    }
    if (all.empty()) {
        return;
    }
    const size_t outstanding = shutdown_slots(all);
    pools_evicted_.fetch_add(all.size(), std::memory_order_relaxed);
    utils::log::info(std::format("Closed {} tenant pool(s), {} borrow(s) outstanding",
        all.size(), outstanding));
}

void TenantPoolRegistry::set_tenant_limit(const std::string& database, size_t max_conn) {
    std::unique_lock lock(mutex_);
    tenant_max_connections_[database] = max_conn;
}

bool TenantPoolRegistry::contains(const std::string& database) const {
    std::shared_lock lock(mutex_);
    return pools_.contains(database);
}

TenantPoolRegistry::Stats TenantPoolRegistry::get_stats() const {
    std::unordered_map<std::string, PoolStats> per_pool;
    size_t total = 0;
    {
        std::shared_lock lock(mutex_);
        total = pools_.size();
        for (const auto& [key, slot] : pools_) {
            if (!slot) continue;
            if (const auto pool = ready_pool(*slot)) {
                per_pool.emplace(key, pool->get_stats());
            }
        }
    }

    return Stats{
        .total_pools = total,
        .pools_created = pools_created_.load(std::memory_order_relaxed),
        .pools_evicted = pools_evicted_.load(std::memory_order_relaxed),
        .creation_failures = creation_failures_.load(std::memory_order_relaxed),
        .pools = std::move(per_pool),
    };
}

} // namespace tenantcore
