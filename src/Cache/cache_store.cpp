#include "cache_store.hpp"

#include <stdexcept>

namespace cache {

double CacheEntry::remainingSeconds(Clock::time_point now) const {
    auto left = std::chrono::duration<double>(ttl) - std::chrono::duration<double>(age(now));
    return left.count() > 0.0 ? left.count() : 0.0;
}

CacheStore::CacheStore(size_t max_entries, TimeSource now)
    : max_entries_(max_entries)
    , now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })) {
    if (max_entries_ == 0) {
        throw std::invalid_argument("cache max_entries must be positive");
    }
}

std::optional<nlohmann::json> CacheStore::get(const std::string& key) {
    auto now = now_();
    std::lock_guard<std::mutex> g(lock_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        counters_.misses++;
        return std::nullopt;
    }

    if (it->second.first.expired(now)) {
        lru_.erase(it->second.second);
        entries_.erase(it);
        counters_.expirations++;
        counters_.misses++;
        return std::nullopt;
    }

    touchLocked(it, now);
    counters_.hits++;
    return it->second.first.data;
}

void CacheStore::set(const std::string& key,
                     nlohmann::json data,
                     CacheCategory category,
                     std::chrono::seconds ttl) {
    auto now = now_();
    std::lock_guard<std::mutex> g(lock_);
    insertLocked(key, std::move(data), category, ttl, now);
}

nlohmann::json CacheStore::setIfAbsent(const std::string& key,
                                       nlohmann::json data,
                                       CacheCategory category,
                                       std::chrono::seconds ttl) {
    auto now = now_();
    std::lock_guard<std::mutex> g(lock_);

    auto it = entries_.find(key);
    if (it != entries_.end() && !it->second.first.expired(now)) {
        return it->second.first.data;
    }

    insertLocked(key, data, category, ttl, now);
    return data;
}

bool CacheStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> g(lock_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    lru_.erase(it->second.second);
    entries_.erase(it);
    return true;
}

size_t CacheStore::clear(std::optional<CacheCategory> category) {
    std::lock_guard<std::mutex> g(lock_);

    if (!category) {
        size_t n = entries_.size();
        entries_.clear();
        lru_.clear();
        return n;
    }

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.first.category == *category) {
            lru_.erase(it->second.second);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t CacheStore::eraseIf(const std::function<bool(const std::string&)>& pred) {
    std::lock_guard<std::mutex> g(lock_);

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (pred(it->first)) {
            lru_.erase(it->second.second);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t CacheStore::purgeExpired() {
    auto now = now_();
    std::lock_guard<std::mutex> g(lock_);
    return purgeExpiredLocked(now);
}

std::optional<CacheEntry> CacheStore::entryInfo(const std::string& key) const {
    std::lock_guard<std::mutex> g(lock_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.first;
}

bool CacheStore::contains(const std::string& key) const {
    auto now = now_();
    std::lock_guard<std::mutex> g(lock_);

    auto it = entries_.find(key);
    return it != entries_.end() && !it->second.first.expired(now);
}

size_t CacheStore::size() const {
    std::lock_guard<std::mutex> g(lock_);
    return entries_.size();
}

StoreSnapshot CacheStore::snapshot() const {
    auto now = now_();
    std::lock_guard<std::mutex> g(lock_);

    StoreSnapshot snap;
    snap.entries = entries_.size();
    snap.max_entries = max_entries_;

    double total_remaining = 0.0;
    size_t live = 0;
    for (const auto& [key, value] : entries_) {
        const CacheEntry& entry = value.first;
        snap.by_category[static_cast<size_t>(entry.category)]++;
        if (!entry.expired(now)) {
            total_remaining += entry.remainingSeconds(now);
            ++live;
        }
    }
    snap.average_remaining_ttl = live > 0 ? total_remaining / static_cast<double>(live) : 0.0;

    snap.hits = counters_.hits.load();
    snap.misses = counters_.misses.load();
    snap.evictions = counters_.evictions.load();
    snap.expirations = counters_.expirations.load();
    return snap;
}

void CacheStore::insertLocked(const std::string& key,
                              nlohmann::json data,
                              CacheCategory category,
                              std::chrono::seconds ttl,
                              Clock::time_point now) {
    CacheEntry entry;
    entry.key = key;
    entry.data = std::move(data);
    entry.category = category;
    entry.created_at = now;
    entry.ttl = ttl;
    entry.access_count = 0;
    entry.last_accessed = now;

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        // Replacing an existing key never evicts
        lru_.erase(it->second.second);
        lru_.push_front(key);
        it->second.first = std::move(entry);
        it->second.second = lru_.begin();
        return;
    }

    // Evict before inserting so the new key is never the victim
    if (entries_.size() >= max_entries_) {
        makeRoomLocked(now);
    }

    lru_.push_front(key);
    try {
        entries_.emplace(key, std::make_pair(std::move(entry), lru_.begin()));
    } catch (const std::bad_alloc&) {
        lru_.pop_front();
        throw;
    }
}

void CacheStore::touchLocked(std::unordered_map<std::string, MapValue>::iterator it,
                             Clock::time_point now) {
    auto& value = it->second;
    value.first.access_count++;
    value.first.last_accessed = now;

    // only the list iterator is invalidated
    lru_.erase(value.second);
    lru_.push_front(it->first);
    value.second = lru_.begin();
}

size_t CacheStore::purgeExpiredLocked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.first.expired(now)) {
            lru_.erase(it->second.second);
            it = entries_.erase(it);
            counters_.expirations++;
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void CacheStore::makeRoomLocked(Clock::time_point now) {
    purgeExpiredLocked(now);

    if (entries_.size() >= max_entries_ && !lru_.empty()) {
        const std::string& victim = lru_.back();
        entries_.erase(victim);
        lru_.pop_back();
        counters_.evictions++;
    }
}

} // namespace cache
