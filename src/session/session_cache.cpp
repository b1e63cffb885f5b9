#include "session/session_cache.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace tenantcore {

// ============================================================================
// SessionCache
// ============================================================================

SessionCache::SessionCache(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

std::string SessionCache::make_key(const std::string& token_hash) {
    return std::format("session:{}", token_hash);
}

size_t SessionCache::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

std::optional<SessionRecord> SessionCache::get(const std::string& database,
                                               const std::string& token_hash) {
    if (!config_.enabled) return std::nullopt;

    const auto key = make_key(token_hash);
    auto result = shards_[select_shard(key)]->get(key, database);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void SessionCache::put(const std::string& database, const SessionRecord& record) {
    if (!config_.enabled) return;

    const auto expires = std::min(SessionClock::now() + config_.ttl, record.expires_at);
    const auto key = make_key(record.token_hash);
    shards_[select_shard(key)]->put(key, database, record, expires);
}

void SessionCache::erase(const std::string& token_hash) {
    const auto key = make_key(token_hash);
    if (shards_[select_shard(key)]->erase(key)) {
        invalidations_.fetch_add(1, std::memory_order_relaxed);
    }
}

SessionCache::Stats SessionCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .invalidations = invalidations_.load(std::memory_order_relaxed),
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<SessionRecord> SessionCache::Shard::get(const std::string& key,
                                                      const std::string& database) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto& entry = *it->second;
    if (entry.database != database) return std::nullopt;

    if (SessionClock::now() >= entry.expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return entry.record;
}

void SessionCache::Shard::put(const std::string& key, const std::string& database,
                              SessionRecord record, SessionClock::time_point expires_at) {
    std::lock_guard lock(mutex_);

    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->database = database;
        it->second->record = std::move(record);
        it->second->expires_at = expires_at;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, database, std::move(record), expires_at});
    map_[key] = lru_list_.begin();
}

bool SessionCache::Shard::erase(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return false;
    lru_list_.erase(it->second);
    map_.erase(it);
    return true;
}

size_t SessionCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace tenantcore
