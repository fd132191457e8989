#ifndef cache_manager_hpp
#define cache_manager_hpp

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "cache_category.h"
#include "cache_store.hpp"
#include "durable_backing.hpp"

namespace cache {

struct CacheManagerConfig {
    std::map<CacheCategory, std::chrono::seconds> ttl_overrides;
    size_t max_entries = 1000;
    std::chrono::seconds cleanup_interval{300};
    // durable records are accepted while younger than ttl * stale_multiplier
    double stale_multiplier = 1.0;

    /// Throws std::invalid_argument on negative TTLs or non-positive limits
    void validate() const;
};

struct CacheManagerStats {
    StoreSnapshot store;
    uint64_t cleanups = 0;
    uint64_t backing_failures = 0;
    double hit_rate = 0.0;

    nlohmann::json toJson() const;
};

/**
 * Category-aware cache in front of CacheStore.
 *
 * Default TTLs come from kCategoryTable, overridable per category by config and
 * per call by an explicit ttl. Operations never throw to callers: failures of the
 * optional durable backing are logged and counted, and the cache continues in memory.
 */
class CacheManager {
public:
    using Factory = std::function<nlohmann::json()>;

    explicit CacheManager(CacheManagerConfig config = {},
                          std::shared_ptr<DurableCacheBacking> backing = nullptr,
                          TimeSource now = {});
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    std::optional<nlohmann::json> get(const std::string& key, CacheCategory category = CacheCategory::Default);

    void set(const std::string& key,
             nlohmann::json value,
             CacheCategory category = CacheCategory::Default,
             std::optional<std::chrono::seconds> ttl = std::nullopt);

    bool remove(const std::string& key);
    void clear(std::optional<CacheCategory> category = std::nullopt);

    /**
     * Return the cached value, or call factory once and cache its result.
     * A null result is returned but not cached. The factory runs outside the lock;
     * if another caller stored a value meanwhile, that value wins.
     */
    nlohmann::json getOrSet(const std::string& key,
                            CacheCategory category,
                            const Factory& factory,
                            std::optional<std::chrono::seconds> ttl = std::nullopt);

    std::chrono::seconds ttlFor(CacheCategory category) const;

    size_t cleanupExpired();

    // ===== Background sweep =====
    void startCleanup();
    void stopCleanup();
    bool cleanupRunning() const;

    // ===== Host / inventory helpers =====
    static std::string hostKey(const std::string& hostname, CacheCategory category);

    void cacheHostData(const std::string& hostname, const nlohmann::json& data, CacheCategory category);
    std::optional<nlohmann::json> getHostData(const std::string& hostname, CacheCategory category);
    void invalidateHost(const std::string& hostname);

    void cacheInventorySearch(const std::string& query, const nlohmann::json& results);
    std::optional<nlohmann::json> getInventorySearch(const std::string& query);

    void cacheLocalContext(const nlohmann::json& context);
    std::optional<nlohmann::json> getLocalContext();

    std::optional<CacheEntry> entryInfo(const std::string& key) const { return store_.entryInfo(key); }
    CacheManagerStats getStats() const;

private:
    void sweepLoop();
    void noteDegraded(const char* op, const std::string& hostname, const std::exception& e);

private:
    CacheManagerConfig config_;
    CacheStore store_;
    std::shared_ptr<DurableCacheBacking> backing_;

    std::thread sweeper_;
    mutable std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stop_requested_ = false;

    std::atomic<uint64_t> cleanups_{0};
    std::atomic<uint64_t> backing_failures_{0};
};

} // namespace cache

#endif // cache_manager_hpp
