#ifndef engine_config_hpp
#define engine_config_hpp

#include <string>

#include <nlohmann/json.hpp>

#include "../Cache/cache_manager.hpp"
#include "../Common/logging.hpp"
#include "../Registry/host_registry.hpp"
#include "../Scanner/scan_types.hpp"

namespace hostguard {

/**
 * Everything the engine can be configured with.
 *
 * JSON layout (every key optional, durations in seconds):
 * {
 *   "logging":  {"level", "file", "pattern", "max_file_size", "max_files"},
 *   "rate":     {"requests_per_second", "burst_size"},
 *   "retry":    {"max_retries", "base_delay", "max_delay"},
 *   "timeouts": {"connect", "command"},
 *   "batch":    {"batch_size", "management_port"},
 *   "cache":    {"ttl": {"<category>": seconds}, "max_entries", "cleanup_interval",
 *                "stale_multiplier", "file"},
 *   "registry": {"reload_ttl", "etc_hosts", "ssh_config", "ansible": [], "cloud": [],
 *                "sources": [{"type", "path"}]}
 * }
 */
struct EngineConfig {
    LoggingConfig logging;
    scan::RateConfig rate;
    scan::ScanConfig scan;
    cache::CacheManagerConfig cache;
    std::string cache_file;     // durable cache backing, none when empty
    registry::RegistryConfig registry = registry::RegistryConfig::systemDefaults();

    /// Overlay doc on the defaults. Throws std::invalid_argument on ill-typed values.
    static EngineConfig fromJson(const nlohmann::json& doc);

    /// Throws std::invalid_argument
    void validate() const;
};

/// Read and parse a JSON config file. Throws std::runtime_error when unreadable or not JSON.
EngineConfig loadConfigFile(const std::string& path);

} // namespace hostguard

#endif // engine_config_hpp
