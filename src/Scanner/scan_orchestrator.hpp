#ifndef scan_orchestrator_hpp
#define scan_orchestrator_hpp

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Cache/cache_manager.hpp"
#include "host_inspector.hpp"
#include "network_probe.hpp"
#include "rate_limiter.hpp"
#include "remote_executor.hpp"
#include "scan_types.hpp"

namespace scan {

/**
 * On-demand host scanner.
 *
 * Per host: cache check (unless forced), resolve, one rate-limit token,
 * TCP probe of the management port on each address in turn, optional deep
 * inspection, then cache on success. A failed attempt is retried with
 * exponential backoff up to max_retries; the outcome is always a ScanResult.
 *
 * Scans of the same host are serialized, so a second concurrent caller
 * normally gets the first caller's cached result.
 */
class ScanOrchestrator {
public:
    /**
     * @param limiter  shared with every other orchestrator in the process
     * @param probe    SocketProbe when null
     * @param executor deep inspection is unavailable when null
     */
    ScanOrchestrator(ScanConfig config,
                     std::shared_ptr<RateLimiter> limiter,
                     std::shared_ptr<cache::CacheManager> cache,
                     std::shared_ptr<NetworkProbe> probe = nullptr,
                     std::shared_ptr<RemoteExecutor> executor = nullptr);

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    ScanResult scanHost(const std::string& hostname, ScanCategory category, bool force = false);
    ScanResult scanTarget(const ScanTarget& target, ScanCategory category, bool force = false);

    /**
     * Scan in groups of batch_size, each group concurrently.
     * Results follow input order; on_progress follows completion order.
     */
    std::vector<ScanResult> scanHosts(const std::vector<std::string>& hostnames,
                                      ScanCategory category,
                                      bool force = false,
                                      const ProgressCallback& on_progress = {});

    std::vector<ScanResult> scanTargets(const std::vector<ScanTarget>& targets,
                                        ScanCategory category,
                                        bool force = false,
                                        const ProgressCallback& on_progress = {});

    const ScanConfig& config() const { return config_; }

    /// Hosts with a scan running or waiting
    size_t trackedHostLocks();

private:
    struct Attempt {
        bool ok = false;
        bool retryable = true;
        nlohmann::json data;
        std::string error;
        hostguard::ErrorKind error_kind = hostguard::ErrorKind::None;
    };

    std::optional<ScanResult> cachedResult(const std::string& hostname, ScanCategory category);
    ScanResult scanWithRetry(const ScanTarget& target, ScanCategory category);
    Attempt attemptOnce(const ScanTarget& target, ScanCategory category);

    std::shared_ptr<std::mutex> hostLock(const std::string& hostname);
    void releaseHostLock(const std::string& hostname, std::shared_ptr<std::mutex> lock);

private:
    ScanConfig config_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<cache::CacheManager> cache_;
    std::shared_ptr<NetworkProbe> probe_;
    HostInspector inspector_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> host_locks_;
};

} // namespace scan

#endif // scan_orchestrator_hpp
