#include "cache_manager.hpp"

#include <cmath>
#include <stdexcept>

#include "../Common/host_common.h"
#include "../Common/logging.hpp"

namespace cache {

namespace {

constexpr std::chrono::seconds kNoDataTtl{60};

std::string noDataKey(const std::string& key) {
    return "nodata|" + key;
}

} // namespace

void CacheManagerConfig::validate() const {
    if (max_entries == 0) {
        throw std::invalid_argument("cache.max_entries must be positive");
    }
    if (cleanup_interval.count() <= 0) {
        throw std::invalid_argument("cache.cleanup_interval must be positive");
    }
    if (!(stale_multiplier > 0.0)) {
        throw std::invalid_argument("cache.stale_multiplier must be positive");
    }
    for (const auto& [category, ttl] : ttl_overrides) {
        if (ttl.count() < 0) {
            throw std::invalid_argument("cache TTL for " + std::string(categoryName(category)) +
                                        " must not be negative");
        }
    }
}

nlohmann::json CacheManagerStats::toJson() const {
    nlohmann::json by_type = nlohmann::json::object();
    for (const auto& info : kCategoryTable) {
        size_t n = store.by_category[static_cast<size_t>(info.category)];
        if (n > 0) {
            by_type[std::string(info.name)] = n;
        }
    }

    return {
        {"entries", store.entries},
        {"max_entries", store.max_entries},
        {"entries_by_type", by_type},
        {"average_ttl_remaining", std::round(store.average_remaining_ttl * 10.0) / 10.0},
        {"stats", {
            {"hits", store.hits},
            {"misses", store.misses},
            {"evictions", store.evictions},
            {"expirations", store.expirations},
            {"cleanups", cleanups},
            {"backing_failures", backing_failures},
            {"hit_rate", hit_rate},
        }},
    };
}

CacheManager::CacheManager(CacheManagerConfig config,
                           std::shared_ptr<DurableCacheBacking> backing,
                           TimeSource now)
    : config_((config.validate(), std::move(config)))
    , store_(config_.max_entries, std::move(now))
    , backing_(std::move(backing)) {
}

CacheManager::~CacheManager() {
    stopCleanup();
}

std::optional<nlohmann::json> CacheManager::get(const std::string& key, CacheCategory /*category*/) {
    return store_.get(key);
}

void CacheManager::set(const std::string& key,
                       nlohmann::json value,
                       CacheCategory category,
                       std::optional<std::chrono::seconds> ttl) {
    std::chrono::seconds effective = ttl ? *ttl : ttlFor(category);
    if (effective.count() < 0) {
        hostguard::logger()->warn("negative TTL {}s for key {}, storing as expired", effective.count(), key);
        effective = std::chrono::seconds(0);
    }
    store_.set(key, std::move(value), category, effective);
}

bool CacheManager::remove(const std::string& key) {
    return store_.erase(key);
}

void CacheManager::clear(std::optional<CacheCategory> category) {
    size_t removed = store_.clear(category);
    hostguard::logger()->debug("cache cleared: {} entries ({})", removed,
                               category ? categoryName(*category) : std::string_view("all"));
}

nlohmann::json CacheManager::getOrSet(const std::string& key,
                                      CacheCategory category,
                                      const Factory& factory,
                                      std::optional<std::chrono::seconds> ttl) {
    if (auto cached = store_.get(key)) {
        return *cached;
    }

    nlohmann::json value;
    try {
        value = factory();
    } catch (const std::exception& e) {
        hostguard::logger()->warn("cache factory for {} failed: {}", key, e.what());
        return nlohmann::json();
    }

    if (value.is_null()) {
        return value;
    }

    std::chrono::seconds effective = ttl ? *ttl : ttlFor(category);
    if (effective.count() < 0) {
        effective = std::chrono::seconds(0);
    }
    return store_.setIfAbsent(key, std::move(value), category, effective);
}

std::chrono::seconds CacheManager::ttlFor(CacheCategory category) const {
    auto it = config_.ttl_overrides.find(category);
    if (it != config_.ttl_overrides.end()) {
        return it->second;
    }
    return defaultTtl(category);
}

size_t CacheManager::cleanupExpired() {
    size_t removed = store_.purgeExpired();
    cleanups_++;
    if (removed > 0) {
        hostguard::logger()->debug("cache sweep removed {} expired entries", removed);
    }
    return removed;
}

void CacheManager::startCleanup() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    if (sweeper_.joinable()) {
        return;
    }
    stop_requested_ = false;
    sweeper_ = std::thread(&CacheManager::sweepLoop, this);
    hostguard::logger()->debug("cache cleanup started, interval {}s", config_.cleanup_interval.count());
}

void CacheManager::stopCleanup() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        if (!sweeper_.joinable()) {
            return;
        }
        stop_requested_ = true;
        worker = std::move(sweeper_);
    }
    sweep_cv_.notify_all();

    // join outside the lock, the loop needs it to observe the stop flag
    worker.join();
    hostguard::logger()->debug("cache cleanup stopped");
}

bool CacheManager::cleanupRunning() const {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    return sweeper_.joinable();
}

void CacheManager::sweepLoop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!stop_requested_) {
        if (sweep_cv_.wait_for(lock, config_.cleanup_interval, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        cleanupExpired();
        lock.lock();
    }
}

std::string CacheManager::hostKey(const std::string& hostname, CacheCategory category) {
    return "host:" + hostguard::toLower(hostname) + ":" + std::string(categoryName(category));
}

void CacheManager::cacheHostData(const std::string& hostname,
                                 const nlohmann::json& data,
                                 CacheCategory category) {
    const std::string key = hostKey(hostname, category);
    store_.set(key, data, category, ttlFor(category));
    store_.erase(noDataKey(key));

    if (!backing_) {
        return;
    }
    try {
        backing_->set(hostname, category, data, ttlFor(category));
    } catch (const std::exception& e) {
        noteDegraded("write", hostname, e);
    }
}

std::optional<nlohmann::json> CacheManager::getHostData(const std::string& hostname, CacheCategory category) {
    const std::string key = hostKey(hostname, category);
    if (auto cached = store_.get(key)) {
        return cached;
    }
    if (!backing_ || store_.contains(noDataKey(key))) {
        return std::nullopt;
    }

    try {
        auto record = backing_->get(hostname, category);
        if (record && !record->data.is_null()) {
            std::chrono::duration<double> window = ttlFor(category) * config_.stale_multiplier;
            std::chrono::duration<double> age = std::chrono::system_clock::now() - record->cached_at;
            if (age < window) {
                auto remaining = std::chrono::seconds(static_cast<int64_t>(std::ceil((window - age).count())));
                store_.set(key, record->data, category, remaining);
                return record->data;
            }
        }
        // remember the miss so the backing is not hit on every call
        store_.set(noDataKey(key), true, category, kNoDataTtl);
    } catch (const std::exception& e) {
        noteDegraded("read", hostname, e);
        store_.set(noDataKey(key), true, category, kNoDataTtl);
    }
    return std::nullopt;
}

void CacheManager::invalidateHost(const std::string& hostname) {
    const std::string prefix = "host:" + hostguard::toLower(hostname) + ":";
    store_.eraseIf([&prefix](const std::string& key) {
        return key.compare(0, prefix.size(), prefix) == 0 ||
               key.compare(0, 7 + prefix.size(), "nodata|" + prefix) == 0;
    });

    if (!backing_) {
        return;
    }
    try {
        backing_->clearHost(hostname);
    } catch (const std::exception& e) {
        noteDegraded("clear", hostname, e);
    }
}

void CacheManager::cacheInventorySearch(const std::string& query, const nlohmann::json& results) {
    set("inventory_search:" + hostguard::toLower(query), results, CacheCategory::InventorySearch);
}

std::optional<nlohmann::json> CacheManager::getInventorySearch(const std::string& query) {
    return get("inventory_search:" + hostguard::toLower(query), CacheCategory::InventorySearch);
}

void CacheManager::cacheLocalContext(const nlohmann::json& context) {
    set("local_context", context, CacheCategory::LocalContext);
}

std::optional<nlohmann::json> CacheManager::getLocalContext() {
    return get("local_context", CacheCategory::LocalContext);
}

CacheManagerStats CacheManager::getStats() const {
    CacheManagerStats stats;
    stats.store = store_.snapshot();
    stats.cleanups = cleanups_.load();
    stats.backing_failures = backing_failures_.load();

    uint64_t total = stats.store.hits + stats.store.misses;
    stats.hit_rate = total > 0 ? static_cast<double>(stats.store.hits) / static_cast<double>(total) : 0.0;
    return stats;
}

void CacheManager::noteDegraded(const char* op, const std::string& hostname, const std::exception& e) {
    backing_failures_++;
    hostguard::logger()->warn("durable cache {} failed for {}: {} (continuing in memory)", op, hostname, e.what());
}

} // namespace cache
