#ifndef cache_store_hpp
#define cache_store_hpp

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "cache_category.h"

namespace cache {

using Clock = std::chrono::steady_clock;
using TimeSource = std::function<Clock::time_point()>;

/**
 * One cached value.
 * An entry whose age reaches its TTL is expired, so a TTL of 0 is never served.
 */
struct CacheEntry {
    std::string key;
    nlohmann::json data;
    CacheCategory category = CacheCategory::Default;
    Clock::time_point created_at;
    std::chrono::seconds ttl{0};
    uint64_t access_count = 0;
    Clock::time_point last_accessed;

    Clock::duration age(Clock::time_point now) const { return now - created_at; }
    bool expired(Clock::time_point now) const { return age(now) >= ttl; }
    double remainingSeconds(Clock::time_point now) const;
};

struct CacheCounters {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> evictions{0};
    std::atomic<uint64_t> expirations{0};
};

/**
 * Point-in-time view of the store
 */
struct StoreSnapshot {
    size_t entries = 0;
    size_t max_entries = 0;
    std::array<size_t, kCategoryCount> by_category{};
    double average_remaining_ttl = 0.0;   // seconds, over live entries
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
};

/**
 * Thread-safe TTL + LRU key/value store.
 *
 * - Expired entries are dropped lazily on read and by purgeExpired()
 * - At capacity, expired entries go first, then the least recently accessed one
 * - The clock is injectable for tests
 */
class CacheStore {
public:
    explicit CacheStore(size_t max_entries = 1000, TimeSource now = {});

    std::optional<nlohmann::json> get(const std::string& key);

    void set(const std::string& key,
             nlohmann::json data,
             CacheCategory category,
             std::chrono::seconds ttl);

    /**
     * Insert unless a live entry already exists.
     * @return the value now held for key (the existing one if it was live)
     */
    nlohmann::json setIfAbsent(const std::string& key,
                               nlohmann::json data,
                               CacheCategory category,
                               std::chrono::seconds ttl);

    bool erase(const std::string& key);

    /// Remove all entries, or only those of one category
    size_t clear(std::optional<CacheCategory> category = std::nullopt);

    /// Remove every key matching pred
    size_t eraseIf(const std::function<bool(const std::string&)>& pred);

    size_t purgeExpired();

    std::optional<CacheEntry> entryInfo(const std::string& key) const;

    /// Live-entry check that neither touches LRU order nor counts as a hit or miss
    bool contains(const std::string& key) const;

    size_t size() const;
    size_t maxEntries() const { return max_entries_; }
    Clock::time_point now() const { return now_(); }

    StoreSnapshot snapshot() const;

private:
    using LRUList = std::list<std::string>;
    using MapValue = std::pair<CacheEntry, LRUList::iterator>;

    void insertLocked(const std::string& key,
                      nlohmann::json data,
                      CacheCategory category,
                      std::chrono::seconds ttl,
                      Clock::time_point now);
    void touchLocked(std::unordered_map<std::string, MapValue>::iterator it,
                     Clock::time_point now);
    size_t purgeExpiredLocked(Clock::time_point now);
    void makeRoomLocked(Clock::time_point now);

private:
    std::unordered_map<std::string, MapValue> entries_;
    LRUList lru_;   // front = most recently accessed

    size_t max_entries_;
    TimeSource now_;
    mutable std::mutex lock_;
    CacheCounters counters_;
};

} // namespace cache

#endif // cache_store_hpp
