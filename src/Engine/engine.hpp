#ifndef engine_hpp
#define engine_hpp

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Cache/cache_manager.hpp"
#include "../Registry/host_registry.hpp"
#include "../Scanner/network_probe.hpp"
#include "../Scanner/rate_limiter.hpp"
#include "../Scanner/remote_executor.hpp"
#include "../Scanner/scan_orchestrator.hpp"
#include "engine_config.hpp"

namespace hostguard {

struct TargetResolution {
    std::string raw;
    std::string sanitized;
    bool sanitized_modified = false;
    registry::HostValidationResult validation;
};

struct ValidatedScan {
    TargetResolution target;
    std::optional<scan::ScanResult> scan;   // absent when the target did not validate

    nlohmann::json toJson() const;
};

/**
 * Owns one registry, one cache manager and one orchestrator, and hands the
 * orchestrator the process rate limiter. Build one per process.
 */
class Engine {
public:
    /**
     * @param limiter  shared bucket; a new one is built from config.rate when null
     * @param probe    SocketProbe when null
     * @param executor deep-inspection scans fail when null
     */
    explicit Engine(EngineConfig config,
                    std::shared_ptr<scan::RateLimiter> limiter = nullptr,
                    std::shared_ptr<scan::NetworkProbe> probe = nullptr,
                    std::shared_ptr<scan::RemoteExecutor> executor = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Load inventories and start the cache sweep
    void start();
    void stop();

    /// Sanitize then validate. Suggestions for unknown names are cached briefly.
    TargetResolution resolveTarget(std::string_view raw);

    /// Validate, then scan the canonical host when valid
    ValidatedScan validateAndScan(std::string_view raw, scan::ScanCategory category, bool force = false);

    size_t reloadInventory(bool force = true);
    Host registerManualHost(const std::string& hostname,
                            std::optional<std::string> ip_address = std::nullopt,
                            std::optional<std::string> environment = std::nullopt);

    nlohmann::json stats() const;

    registry::HostRegistry& registry() { return *registry_; }
    cache::CacheManager& cache() { return *cache_; }
    scan::ScanOrchestrator& scanner() { return *scanner_; }
    std::shared_ptr<scan::RateLimiter> rateLimiter() const { return limiter_; }
    const EngineConfig& config() const { return config_; }

private:
    static nlohmann::json suggestionsToJson(const std::vector<registry::Suggestion>& suggestions);

private:
    EngineConfig config_;
    std::shared_ptr<scan::RateLimiter> limiter_;
    std::unique_ptr<registry::HostRegistry> registry_;
    std::shared_ptr<cache::CacheManager> cache_;
    std::unique_ptr<scan::ScanOrchestrator> scanner_;
};

} // namespace hostguard

#endif // engine_hpp
