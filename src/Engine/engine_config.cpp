#include "engine_config.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace hostguard {

namespace {

using nlohmann::json;

const json* section(const json& doc, const char* name) {
    auto it = doc.find(name);
    if (it == doc.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("config section '") + name + "' must be an object");
    }
    return &*it;
}

template <typename T>
void read(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

// negative or oversized counts are rejected instead of wrapping
template <typename T>
void readUnsigned(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return;
    }
    auto value = it->get<int64_t>();
    if (value < 0 || static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw std::invalid_argument(std::string("config value '") + key + "' out of range");
    }
    out = static_cast<T>(value);
}

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

void readMillis(const json& obj, const char* key, std::chrono::milliseconds& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = toMillis(it->get<double>());
    }
}

void readSeconds(const json& obj, const char* key, std::chrono::seconds& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = std::chrono::seconds(std::llround(it->get<double>()));
    }
}

void applyLogging(const json& s, LoggingConfig& c) {
    read(s, "level", c.level);
    read(s, "file", c.file);
    read(s, "pattern", c.pattern);
    readUnsigned(s, "max_file_size", c.max_file_size);
    readUnsigned(s, "max_files", c.max_files);
}

void applyCache(const json& s, EngineConfig& c) {
    readUnsigned(s, "max_entries", c.cache.max_entries);
    readSeconds(s, "cleanup_interval", c.cache.cleanup_interval);
    read(s, "stale_multiplier", c.cache.stale_multiplier);
    read(s, "file", c.cache_file);

    if (const json* ttl = section(s, "ttl")) {
        for (auto it = ttl->begin(); it != ttl->end(); ++it) {
            auto category = cache::parseCategory(it.key());
            if (!category) {
                logger()->warn("ignoring TTL for unknown cache category '{}'", it.key());
                continue;
            }
            c.cache.ttl_overrides[*category] = std::chrono::seconds(std::llround(it.value().get<double>()));
        }
    }
}

void applyRegistry(const json& s, registry::RegistryConfig& c) {
    readSeconds(s, "reload_ttl", c.reload_ttl);
    read(s, "etc_hosts", c.etc_hosts_path);
    read(s, "ssh_config", c.ssh_config_path);
    read(s, "ansible", c.ansible_paths);
    read(s, "cloud", c.cloud_paths);

    auto sources = s.find("sources");
    if (sources == s.end() || sources->is_null()) {
        return;
    }
    if (!sources->is_array()) {
        throw std::invalid_argument("registry.sources must be an array");
    }
    for (const auto& entry : *sources) {
        registry::SourceSpec spec;
        std::string type = entry.value("type", std::string("custom_file"));
        auto kind = parseSourceKind(type);
        if (!kind) {
            throw std::invalid_argument("unknown inventory source type '" + type + "'");
        }
        spec.kind = *kind;
        spec.path = entry.value("path", std::string());
        c.extra_sources.push_back(std::move(spec));
    }
}

} // namespace

EngineConfig EngineConfig::fromJson(const json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("config document must be a JSON object");
    }

    EngineConfig config;
    try {
        if (const json* s = section(doc, "logging")) applyLogging(*s, config.logging);
        if (const json* s = section(doc, "rate")) {
            read(*s, "requests_per_second", config.rate.requests_per_second);
            readUnsigned(*s, "burst_size", config.rate.burst_size);
        }
        if (const json* s = section(doc, "retry")) {
            readUnsigned(*s, "max_retries", config.scan.retry.max_retries);
            readMillis(*s, "base_delay", config.scan.retry.base_delay);
            readMillis(*s, "max_delay", config.scan.retry.max_delay);
        }
        if (const json* s = section(doc, "timeouts")) {
            readMillis(*s, "connect", config.scan.timeouts.connect);
            readMillis(*s, "command", config.scan.timeouts.command);
        }
        if (const json* s = section(doc, "batch")) {
            readUnsigned(*s, "batch_size", config.scan.batch.batch_size);
            readUnsigned(*s, "management_port", config.scan.batch.management_port);
        }
        if (const json* s = section(doc, "cache")) applyCache(*s, config);
        if (const json* s = section(doc, "registry")) applyRegistry(*s, config.registry);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("invalid config value: ") + e.what());
    }
    return config;
}

void EngineConfig::validate() const {
    rate.validate();
    scan.validate();
    cache.validate();
    registry.validate();
}

EngineConfig loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open config file: " + path);
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("config file is not valid JSON: " + path);
    }
    return EngineConfig::fromJson(doc);
}

} // namespace hostguard
