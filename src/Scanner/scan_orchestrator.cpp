#include "scan_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "../Common/logging.hpp"

namespace scan {

namespace {

uint64_t elapsedMs(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

} // namespace

ScanOrchestrator::ScanOrchestrator(ScanConfig config,
                                   std::shared_ptr<RateLimiter> limiter,
                                   std::shared_ptr<cache::CacheManager> cache,
                                   std::shared_ptr<NetworkProbe> probe,
                                   std::shared_ptr<RemoteExecutor> executor)
    : config_((config.validate(), std::move(config)))
    , limiter_(std::move(limiter))
    , cache_(std::move(cache))
    , probe_(probe ? std::move(probe) : std::make_shared<SocketProbe>())
    , inspector_(std::move(executor), config_.timeouts.command) {
    if (!limiter_) {
        throw std::invalid_argument("scan orchestrator needs a rate limiter");
    }
    if (!cache_) {
        throw std::invalid_argument("scan orchestrator needs a cache manager");
    }
}

ScanResult ScanOrchestrator::scanHost(const std::string& hostname, ScanCategory category, bool force) {
    return scanTarget(ScanTarget{hostname, std::nullopt}, category, force);
}

ScanResult ScanOrchestrator::scanTarget(const ScanTarget& target, ScanCategory category, bool force) {
    if (hostguard::trim(target.hostname).empty()) {
        ScanResult result;
        result.category = category;
        result.error = "empty hostname";
        result.error_kind = hostguard::ErrorKind::InvalidTarget;
        result.timestamp = std::chrono::system_clock::now();
        return result;
    }

    if (!force) {
        if (auto cached = cachedResult(target.hostname, category)) {
            return *cached;
        }
    }

    auto lock = hostLock(target.hostname);
    ScanResult result;
    {
        std::lock_guard<std::mutex> guard(*lock);

        // a concurrent scan of this host may have finished while we waited
        std::optional<ScanResult> cached;
        if (!force) {
            cached = cachedResult(target.hostname, category);
        }
        if (cached) {
            result = std::move(*cached);
        } else {
            result = scanWithRetry(target, category);
            if (result.success) {
                cache_->cacheHostData(target.hostname, result.data, cacheCategoryFor(category));
            }
        }
    }
    releaseHostLock(target.hostname, std::move(lock));
    return result;
}

std::vector<ScanResult> ScanOrchestrator::scanHosts(const std::vector<std::string>& hostnames,
                                                    ScanCategory category,
                                                    bool force,
                                                    const ProgressCallback& on_progress) {
    std::vector<ScanTarget> targets;
    targets.reserve(hostnames.size());
    for (const auto& name : hostnames) {
        targets.push_back(ScanTarget{name, std::nullopt});
    }
    return scanTargets(targets, category, force, on_progress);
}

std::vector<ScanResult> ScanOrchestrator::scanTargets(const std::vector<ScanTarget>& targets,
                                                      ScanCategory category,
                                                      bool force,
                                                      const ProgressCallback& on_progress) {
    const size_t total = targets.size();
    std::vector<ScanResult> results(total);

    std::mutex progress_mutex;
    size_t completed = 0;

    auto runOne = [&](size_t index) {
        const ScanTarget& target = targets[index];
        ScanResult result;
        try {
            result = scanTarget(target, category, force);
        } catch (const std::exception& e) {
            hostguard::logger()->error("scan of {} aborted: {}", target.hostname, e.what());
            result.hostname = target.hostname;
            result.category = category;
            result.error = e.what();
            result.error_kind = hostguard::ErrorKind::InspectionFailed;
            result.timestamp = std::chrono::system_clock::now();
        }
        results[index] = std::move(result);

        std::lock_guard<std::mutex> lock(progress_mutex);
        ++completed;
        if (on_progress) {
            try {
                on_progress(completed, total, target.hostname);
            } catch (const std::exception& e) {
                hostguard::logger()->warn("progress callback failed: {}", e.what());
            }
        }
    };

    const size_t batch = config_.batch.batch_size;
    for (size_t begin = 0; begin < total; begin += batch) {
        size_t end = std::min(begin + batch, total);

        std::vector<std::thread> workers;
        workers.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            try {
                workers.emplace_back(runOne, i);
            } catch (const std::system_error& e) {
                hostguard::logger()->warn("cannot start scan thread ({}), scanning {} inline",
                                          e.what(), targets[i].hostname);
                runOne(i);
            }
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    size_t ok = 0;
    for (const auto& r : results) {
        if (r.success) ++ok;
    }
    hostguard::logger()->debug("scan {} finished: {}/{} hosts succeeded", scanCategoryName(category), ok, total);
    return results;
}

std::optional<ScanResult> ScanOrchestrator::cachedResult(const std::string& hostname, ScanCategory category) {
    auto data = cache_->getHostData(hostname, cacheCategoryFor(category));
    if (!data) {
        return std::nullopt;
    }

    hostguard::logger()->debug("scan cache hit: {} ({})", hostname, scanCategoryName(category));
    ScanResult result;
    result.hostname = hostname;
    result.category = category;
    result.success = true;
    result.data = std::move(*data);
    result.timestamp = std::chrono::system_clock::now();
    result.from_cache = true;
    return result;
}

ScanResult ScanOrchestrator::scanWithRetry(const ScanTarget& target, ScanCategory category) {
    const auto start = std::chrono::steady_clock::now();
    const uint32_t max_retries = config_.retry.max_retries;

    ScanResult result;
    result.hostname = target.hostname;
    result.category = category;

    Attempt last;
    uint32_t attempt = 0;
    for (;; ++attempt) {
        limiter_->acquire();

        try {
            last = attemptOnce(target, category);
        } catch (const std::exception& e) {
            last = Attempt{};
            last.error = e.what();
            last.error_kind = hostguard::ErrorKind::Unreachable;
        }

        if (last.ok) {
            result.success = true;
            result.data = std::move(last.data);
            result.retries = attempt;
            result.duration_ms = elapsedMs(start);
            result.timestamp = std::chrono::system_clock::now();
            return result;
        }

        if (!last.retryable || attempt >= max_retries) {
            break;
        }

        auto delay = config_.retry.backoff(attempt + 1);
        hostguard::logger()->debug("retry {}/{} for {} in {}ms: {}", attempt + 1, max_retries,
                                   target.hostname, delay.count(), last.error);
        std::this_thread::sleep_for(delay);
    }

    result.retries = attempt;
    result.error = std::string(hostguard::errorKindName(last.error_kind)) + ": " + last.error;
    result.error_kind = last.retryable ? hostguard::ErrorKind::RetriesExhausted : last.error_kind;
    result.data = {{"last_error_kind", std::string(hostguard::errorKindName(last.error_kind))}};
    result.duration_ms = elapsedMs(start);
    result.timestamp = std::chrono::system_clock::now();

    hostguard::logger()->warn("scan {} of {} failed after {} retries: {}", scanCategoryName(category),
                              target.hostname, result.retries, result.error);
    return result;
}

ScanOrchestrator::Attempt ScanOrchestrator::attemptOnce(const ScanTarget& target, ScanCategory category) {
    Attempt out;
    nlohmann::json data = {
        {"hostname", target.hostname},
        {"scan_type", std::string(scanCategoryName(category))},
        {"scanned_at", hostguard::formatTime(std::chrono::system_clock::now())},
    };

    std::vector<std::string> addresses;
    if (target.address && !target.address->empty()) {
        addresses.push_back(*target.address);
    } else {
        addresses = probe_->resolve(target.hostname);
        data["dns_resolved"] = !addresses.empty();
    }
    if (addresses.empty()) {
        out.error = "cannot resolve " + target.hostname;
        out.error_kind = hostguard::ErrorKind::Unreachable;
        return out;
    }
    data["ip"] = addresses.front();
    if (addresses.size() > 1) {
        data["all_ips"] = addresses;
    }

    const uint16_t port = config_.batch.management_port;
    std::optional<std::string> reached;
    for (const auto& addr : addresses) {
        if (probe_->connect(addr, port, config_.timeouts.connect)) {
            reached = addr;
            break;
        }
    }
    if (!reached) {
        out.error = "no address of " + target.hostname + " accepts connections on port " + std::to_string(port);
        out.error_kind = hostguard::ErrorKind::Unreachable;
        return out;
    }
    data["reachable"] = true;
    data["reachable_address"] = *reached;

    if (needsInspection(category)) {
        if (!inspector_.available()) {
            out.error = "no remote executor configured for deep inspection";
            out.error_kind = hostguard::ErrorKind::InspectionFailed;
            out.retryable = false;
            return out;
        }
        auto inspection = inspector_.inspect(*reached, category);
        if (!inspection.ok) {
            out.error = inspection.error;
            out.error_kind = hostguard::ErrorKind::InspectionFailed;
            return out;
        }
        data.update(inspection.facts);
    }

    out.ok = true;
    out.data = std::move(data);
    return out;
}

void ScanOrchestrator::releaseHostLock(const std::string& hostname, std::shared_ptr<std::mutex> lock) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto it = host_locks_.find(hostguard::toLower(hostname));
    // the map and this caller hold the only references: nobody is waiting
    bool idle = it != host_locks_.end() && it->second == lock && lock.use_count() == 2;
    lock.reset();
    if (idle) {
        host_locks_.erase(it);
    }
}

size_t ScanOrchestrator::trackedHostLocks() {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    return host_locks_.size();
}

std::shared_ptr<std::mutex> ScanOrchestrator::hostLock(const std::string& hostname) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = host_locks_[hostguard::toLower(hostname)];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

} // namespace scan
