#pragma once

#include "session/session_record.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tenantcore {

/**
 * @brief Fast path for session validation
 *
 * Sharded LRU keyed by "session:<token hash>". An entry lives until the
 * cache TTL or the session's own expiry, whichever comes first. Entries
 * remember their tenant database; a lookup from another tenant is a miss.
 */
class SessionCache {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 10000;
        size_t num_shards = 16;
        std::chrono::seconds ttl{300};
    };

    explicit SessionCache(const Config& config);

    [[nodiscard]] std::optional<SessionRecord> get(const std::string& database,
                                                   const std::string& token_hash);

    void put(const std::string& database, const SessionRecord& record);

    void erase(const std::string& token_hash);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    static std::string make_key(const std::string& token_hash);

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t invalidations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        std::string database;
        SessionRecord record;
        SessionClock::time_point expires_at;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<SessionRecord> get(const std::string& key, const std::string& database);
        void put(const std::string& key, const std::string& database, SessionRecord record,
                 SessionClock::time_point expires_at);
        bool erase(const std::string& key);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;
    };

    size_t select_shard(const std::string& key) const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> invalidations_{0};
};

} // namespace tenantcore
