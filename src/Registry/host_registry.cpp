#include "host_registry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <regex>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "../Common/logging.hpp"
#include "../Inventory/ssh_config_source.hpp"
#include "host_matcher.h"

namespace registry {

namespace {

constexpr std::array<std::string_view, 4> kLocalTargets{"local", "localhost", "127.0.0.1", "::1"};

HostPtr makeLocalHost() {
    auto host = std::make_shared<hostguard::Host>();
    host->hostname = "localhost";
    host->ip_address = "127.0.0.1";
    host->source = hostguard::SourceKind::Manual;
    host->environment = "local";
    host->accessible = true;
    return host;
}

} // namespace

RegistryConfig RegistryConfig::systemDefaults() {
    RegistryConfig config;
    config.etc_hosts_path = "/etc/hosts";
    config.ssh_config_path = inventory::SshConfigSource::defaultPath();
    config.ansible_paths = {"/etc/ansible/hosts"};
    return config;
}

void RegistryConfig::validate() const {
    if (reload_ttl.count() < 0) {
        throw std::invalid_argument("registry.reload_ttl must not be negative");
    }
    for (const auto& spec : extra_sources) {
        if (spec.kind == hostguard::SourceKind::Manual) {
            throw std::invalid_argument("registry source of kind manual has no file to read");
        }
        if (spec.path.empty()) {
            throw std::invalid_argument("registry source without a path");
        }
    }
}

std::string HostValidationResult::suggestionText() const {
    if (valid) {
        return fmt::format("✓ Host '{}' is valid", host ? host->hostname : query);
    }
    if (suggestions.empty()) {
        return fmt::format("✗ Host '{}' not found. No similar hosts in inventory.", query);
    }

    std::string text = fmt::format("✗ Host '{}' not found in inventory.\nDid you mean one of these?", query);
    for (const auto& s : suggestions) {
        text += fmt::format("\n  • {} ({:.0f}% match)", s.hostname, s.score * 100.0);
    }
    return text;
}

nlohmann::json RegistryStats::toJson() const {
    return {
        {"total_hosts", total_hosts},
        {"total_aliases", total_aliases},
        {"loaded_sources", loaded_sources},
        {"by_environment", by_environment},
        {"by_source", by_source},
        {"last_refresh", last_refresh ? nlohmann::json(hostguard::formatTime(*last_refresh)) : nlohmann::json()},
    };
}

HostRegistry::HostRegistry(RegistryConfig config)
    : config_((config.validate(), std::move(config)))
    , local_host_(makeLocalHost()) {
}

void HostRegistry::addSource(inventory::SourcePtr source) {
    if (!source) {
        return;
    }
    std::lock_guard<std::mutex> lock(load_mutex_);
    injected_.push_back(std::move(source));
}

size_t HostRegistry::loadAllSources(bool force) {
    std::lock_guard<std::mutex> load(load_mutex_);

    {
        std::shared_lock lock(mutex_);
        if (!force && loaded_at_ &&
            std::chrono::steady_clock::now() - *loaded_at_ < config_.reload_ttl) {
            hostguard::logger()->debug("host registry still fresh, skipping reload");
            return hosts_.size();
        }
    }

    std::vector<inventory::SourcePtr> configured;
    auto add = [&configured](hostguard::SourceKind kind, const std::string& path) {
        if (path.empty()) return;
        if (auto source = inventory::makeSource(kind, path)) {
            configured.push_back(std::move(source));
        }
    };
    add(hostguard::SourceKind::EtcHosts, config_.etc_hosts_path);
    add(hostguard::SourceKind::SshConfig, config_.ssh_config_path);
    for (const auto& p : config_.ansible_paths) add(hostguard::SourceKind::Ansible, p);
    for (const auto& p : config_.cloud_paths) add(hostguard::SourceKind::Cloud, p);
    for (const auto& spec : config_.extra_sources) add(spec.kind, spec.path);

    // Parse without holding the table lock
    std::vector<Pending> pending;
    for (auto& source : configured) pending.push_back(readSource(*source));
    for (auto& source : injected_) pending.push_back(readSource(*source));

    std::unique_lock lock(mutex_);
    reports_.clear();
    for (auto& p : pending) {
        for (const auto& host : p.hosts) {
            registerLocked(host);
        }
        reports_.push_back(std::move(p.report));
    }
    last_refresh_ = std::chrono::system_clock::now();
    loaded_at_ = std::chrono::steady_clock::now();

    size_t ok = std::count_if(reports_.begin(), reports_.end(), [](const SourceLoadReport& r) {
        return r.error_kind == hostguard::ErrorKind::None;
    });
    hostguard::logger()->info("host registry loaded: {} hosts from {}/{} sources",
                              hosts_.size(), ok, reports_.size());
    return hosts_.size();
}

HostRegistry::Pending HostRegistry::readSource(inventory::InventorySource& source) {
    Pending out;
    out.report.source = source.name();
    out.report.kind = source.kind();

    try {
        auto records = source.parse();
        out.report.records = records.size();
        out.hosts.reserve(records.size());
        for (const auto& record : records) {
            auto host = inventory::toHost(record, source.kind());
            if (!host.hostname.empty()) {
                out.hosts.push_back(std::move(host));
            }
        }
    } catch (const std::exception& e) {
        out.hosts.clear();
        out.report.records = 0;
        out.report.error_kind = hostguard::ErrorKind::SourceUnavailable;
        out.report.error = e.what();
        hostguard::logger()->warn("inventory source {} failed: {}", out.report.source, e.what());
    }
    return out;
}

void HostRegistry::registerLocked(const hostguard::Host& host) {
    const std::string key = host.key();

    auto it = hosts_.find(key);
    if (it == hosts_.end()) {
        hosts_.emplace(key, std::make_shared<const hostguard::Host>(host));
    } else {
        auto merged = std::make_shared<hostguard::Host>(*it->second);
        mergeHost(*merged, host);
        if (*merged != *it->second) {
            it->second = std::move(merged);
        }
    }

    for (const auto& alias : host.aliases) {
        aliases_[hostguard::toLower(alias)] = key;
    }
}

HostPtr HostRegistry::lookupLocked(const std::string& key) const {
    auto it = hosts_.find(key);
    if (it != hosts_.end()) {
        return it->second;
    }
    auto alias = aliases_.find(key);
    if (alias != aliases_.end()) {
        auto target = hosts_.find(alias->second);
        if (target != hosts_.end()) {
            return target->second;
        }
    }
    return nullptr;
}

HostValidationResult HostRegistry::validate(std::string_view query) {
    HostValidationResult result;
    result.query = std::string(query);

    if (hostguard::trim(query).empty()) {
        result.error_message = "Empty hostname provided";
        return result;
    }

    if (isLocalTarget(query)) {
        result.valid = true;
        result.host = local_host_;
        result.key = local_host_->key();
        return result;
    }

    if (empty()) {
        loadAllSources();
    }

    const std::string lowered = hostguard::toLower(query);

    std::shared_lock lock(mutex_);
    if (auto host = lookupLocked(lowered)) {
        result.valid = true;
        result.key = host->key();
        result.host = std::move(host);
        return result;
    }

    result.suggestions = findSimilarLocked(lowered);
    result.error_message = fmt::format("Host '{}' not found in inventory", result.query);
    return result;
}

std::vector<Suggestion> HostRegistry::findSimilarLocked(const std::string& lowered) const {
    std::vector<Suggestion> matches;

    for (const auto& [key, host] : hosts_) {
        double score = similarityRatio(lowered, key);
        for (const auto& alias : host->aliases) {
            score = std::max(score, similarityRatio(lowered, hostguard::toLower(alias)));
        }
        if (score > kSuggestionThreshold) {
            matches.push_back({host->hostname, score});
        }
    }

    // hostname breaks ties so the order does not depend on hashing
    std::sort(matches.begin(), matches.end(), [](const Suggestion& a, const Suggestion& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.hostname < b.hostname;
    });
    if (matches.size() > kMaxSuggestions) {
        matches.resize(kMaxSuggestions);
    }
    return matches;
}

HostPtr HostRegistry::get(std::string_view query) {
    auto result = validate(query);
    return result.valid ? result.host : nullptr;
}

HostPtr HostRegistry::find(std::string_view query) {
    if (isLocalTarget(query)) {
        return local_host_;
    }
    if (hostguard::trim(query).empty()) {
        return nullptr;
    }
    if (empty()) {
        loadAllSources();
    }

    std::shared_lock lock(mutex_);
    return lookupLocked(hostguard::toLower(query));
}

HostPtr HostRegistry::require(std::string_view query) {
    auto result = validate(query);
    auto host = result.valid ? result.host : nullptr;
    if (!host) {
        throw std::out_of_range(result.suggestionText());
    }
    return host;
}

std::vector<HostPtr> HostRegistry::filter(const HostFilter& criteria) const {
    std::optional<std::regex> re;
    if (criteria.pattern && !criteria.pattern->empty()) {
        try {
            re.emplace(*criteria.pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("invalid host pattern '" + *criteria.pattern + "': " + e.what());
        }
    }

    std::vector<HostPtr> out;
    std::shared_lock lock(mutex_);
    for (const auto& [key, host] : hosts_) {
        if (criteria.environment && host->environment != criteria.environment) continue;
        if (criteria.group && host->groups.count(*criteria.group) == 0) continue;
        if (criteria.source && host->source != *criteria.source) continue;
        if (re && !std::regex_search(host->hostname, *re)) continue;
        out.push_back(host);
    }
    lock.unlock();

    std::sort(out.begin(), out.end(), [](const HostPtr& a, const HostPtr& b) {
        return a->key() < b->key();
    });
    return out;
}

hostguard::Host HostRegistry::registerManualHost(const std::string& hostname,
                                                 std::optional<std::string> ip_address,
                                                 std::optional<std::string> environment) {
    std::string name = hostguard::trim(hostname);
    if (name.empty()) {
        throw std::invalid_argument("manual host needs a hostname");
    }

    hostguard::Host host;
    host.hostname = name;
    host.ip_address = std::move(ip_address);
    host.environment = std::move(environment);
    host.source = hostguard::SourceKind::Manual;
    host.last_seen = std::chrono::system_clock::now();

    std::unique_lock lock(mutex_);
    registerLocked(host);
    hostguard::logger()->info("manually registered host: {}", name);
    return *hosts_.at(host.key());
}

RegistryStats HostRegistry::getStats() const {
    RegistryStats stats;

    std::shared_lock lock(mutex_);
    stats.total_hosts = hosts_.size();
    stats.total_aliases = aliases_.size();
    stats.last_refresh = last_refresh_;

    for (const auto& [key, host] : hosts_) {
        stats.by_environment[host->environment.value_or("unknown")]++;
        stats.by_source[std::string(hostguard::sourceKindName(host->source))]++;
    }
    for (const auto& report : reports_) {
        if (report.error_kind == hostguard::ErrorKind::None && report.records > 0) {
            stats.loaded_sources.push_back(report.source);
        }
    }
    return stats;
}

std::vector<SourceLoadReport> HostRegistry::lastLoadReport() const {
    std::shared_lock lock(mutex_);
    return reports_;
}

std::vector<std::string> HostRegistry::hostnames() const {
    std::vector<std::string> names;

    std::shared_lock lock(mutex_);
    names.reserve(hosts_.size());
    for (const auto& [key, host] : hosts_) {
        names.push_back(host->hostname);
    }
    lock.unlock();

    std::sort(names.begin(), names.end());
    return names;
}

size_t HostRegistry::size() const {
    std::shared_lock lock(mutex_);
    return hosts_.size();
}

void HostRegistry::reset() {
    std::lock_guard<std::mutex> load(load_mutex_);
    std::unique_lock lock(mutex_);
    hosts_.clear();
    aliases_.clear();
    reports_.clear();
    last_refresh_.reset();
    loaded_at_.reset();
}

bool HostRegistry::isLocalTarget(std::string_view query) {
    std::string lowered = hostguard::toLower(hostguard::trim(query));
    return std::find(kLocalTargets.begin(), kLocalTargets.end(), lowered) != kLocalTargets.end();
}

} // namespace registry
