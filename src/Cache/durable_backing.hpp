#ifndef durable_backing_hpp
#define durable_backing_hpp

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "cache_category.h"

namespace cache {

struct DurableRecord {
    nlohmann::json data;
    std::chrono::system_clock::time_point cached_at;
};

/**
 * Optional persistent layer under the in-memory cache.
 * Implementations may throw; the cache manager catches everything they raise.
 */
class DurableCacheBacking {
public:
    virtual ~DurableCacheBacking() = default;

    virtual std::optional<DurableRecord> get(const std::string& hostname, CacheCategory category) = 0;
    virtual void set(const std::string& hostname,
                     CacheCategory category,
                     const nlohmann::json& data,
                     std::chrono::seconds ttl) = 0;
    virtual void clearHost(const std::string& hostname) = 0;
};

/**
 * Backing stored as a single JSON document:
 * { "<hostname>": { "<category>": { "data": ..., "cached_at": <epoch s>, "ttl": <s> } } }
 * The file is loaded on first access and rewritten on every change.
 * A corrupt file fails every later call with the same error, without being
 * re-read or overwritten, until the backing is rebuilt.
 */
class JsonFileBacking : public DurableCacheBacking {
public:
    explicit JsonFileBacking(std::string path);

    std::optional<DurableRecord> get(const std::string& hostname, CacheCategory category) override;
    void set(const std::string& hostname,
             CacheCategory category,
             const nlohmann::json& data,
             std::chrono::seconds ttl) override;
    void clearHost(const std::string& hostname) override;

    const std::string& path() const { return path_; }

private:
    void loadLocked();
    void flushLocked();

private:
    std::string path_;
    nlohmann::json doc_;
    bool loaded_ = false;
    std::string load_error_;
    std::mutex mutex_;
};

} // namespace cache

#endif // durable_backing_hpp
