#include "engine.hpp"

#include <spdlog/fmt/fmt.h>

#include "../Cache/durable_backing.hpp"
#include "../Common/logging.hpp"
#include "../Registry/host_matcher.h"

namespace hostguard {

nlohmann::json ValidatedScan::toJson() const {
    nlohmann::json j = {
        {"query", target.raw},
        {"hostname", target.sanitized},
        {"valid", target.validation.valid},
    };
    if (!target.validation.valid) {
        j["message"] = target.validation.suggestionText();
    }
    if (scan) {
        j["scan"] = scan->toJson();
    }
    return j;
}

Engine::Engine(EngineConfig config,
               std::shared_ptr<scan::RateLimiter> limiter,
               std::shared_ptr<scan::NetworkProbe> probe,
               std::shared_ptr<scan::RemoteExecutor> executor)
    : config_((config.validate(), std::move(config)))
    , limiter_(limiter ? std::move(limiter) : std::make_shared<scan::RateLimiter>(config_.rate)) {
    initLogging(config_.logging);

    std::shared_ptr<cache::DurableCacheBacking> backing;
    if (!config_.cache_file.empty()) {
        backing = std::make_shared<cache::JsonFileBacking>(config_.cache_file);
    }

    registry_ = std::make_unique<registry::HostRegistry>(config_.registry);
    cache_ = std::make_shared<cache::CacheManager>(config_.cache, std::move(backing));
    scanner_ = std::make_unique<scan::ScanOrchestrator>(config_.scan, limiter_, cache_,
                                                        std::move(probe), std::move(executor));
}

Engine::~Engine() {
    stop();
}

void Engine::start() {
    registry_->loadAllSources();
    cache_->startCleanup();
}

void Engine::stop() {
    cache_->stopCleanup();
}

TargetResolution Engine::resolveTarget(std::string_view raw) {
    TargetResolution out;
    out.raw = std::string(raw);

    auto clean = registry::sanitizeHostname(raw);
    out.sanitized = clean.hostname;
    out.sanitized_modified = clean.modified;
    if (clean.modified) {
        logger()->warn("hostname sanitized: '{}' -> '{}'", out.raw, out.sanitized);
    }

    if (auto host = registry_->find(out.sanitized)) {
        out.validation.valid = true;
        out.validation.key = host->key();
        out.validation.host = host;
        out.validation.query = out.sanitized;
        return out;
    }

    // unknown name: reuse recent suggestions instead of another fuzzy pass
    if (auto cached = cache_->getInventorySearch(out.sanitized)) {
        out.validation.query = out.sanitized;
        out.validation.error_message = fmt::format("Host '{}' not found in inventory", out.sanitized);
        for (const auto& s : *cached) {
            out.validation.suggestions.push_back({s.value("hostname", ""), s.value("score", 0.0)});
        }
        return out;
    }

    out.validation = registry_->validate(out.sanitized);
    if (!out.validation.valid && !out.sanitized.empty()) {
        cache_->cacheInventorySearch(out.sanitized, suggestionsToJson(out.validation.suggestions));
    }
    return out;
}

ValidatedScan Engine::validateAndScan(std::string_view raw, scan::ScanCategory category, bool force) {
    ValidatedScan out;
    out.target = resolveTarget(raw);
    if (!out.target.validation.valid) {
        return out;
    }

    // a reload or manual registration may have merged newer facts since validation
    auto host = registry_->find(out.target.validation.key);
    if (!host) {
        host = out.target.validation.host;
    }

    out.scan = scanner_->scanTarget(scan::ScanTarget{host->hostname, host->ip_address}, category, force);
    return out;
}

size_t Engine::reloadInventory(bool force) {
    size_t n = registry_->loadAllSources(force);
    cache_->clear(cache::CacheCategory::InventorySearch);
    return n;
}

Host Engine::registerManualHost(const std::string& hostname,
                                std::optional<std::string> ip_address,
                                std::optional<std::string> environment) {
    Host host = registry_->registerManualHost(hostname, std::move(ip_address), std::move(environment));
    cache_->clear(cache::CacheCategory::InventorySearch);
    return host;
}

nlohmann::json Engine::stats() const {
    return {
        {"registry", registry_->getStats().toJson()},
        {"cache", cache_->getStats().toJson()},
        {"rate_limiter", {
            {"requests_per_second", limiter_->rate()},
            {"burst_size", limiter_->burst()},
        }},
    };
}

nlohmann::json Engine::suggestionsToJson(const std::vector<registry::Suggestion>& suggestions) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : suggestions) {
        arr.push_back({{"hostname", s.hostname}, {"score", s.score}});
    }
    return arr;
}

} // namespace hostguard
