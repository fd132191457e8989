#include "durable_backing.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "../Common/host_common.h"

namespace cache {

JsonFileBacking::JsonFileBacking(std::string path)
    : path_(std::move(path)) {
}

std::optional<DurableRecord> JsonFileBacking::get(const std::string& hostname, CacheCategory category) {
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked();

    auto host_it = doc_.find(hostguard::toLower(hostname));
    if (host_it == doc_.end() || !host_it->is_object()) {
        return std::nullopt;
    }

    auto cat_it = host_it->find(std::string(categoryName(category)));
    if (cat_it == host_it->end() || !cat_it->is_object()) {
        return std::nullopt;
    }

    DurableRecord record;
    record.data = cat_it->value("data", nlohmann::json());
    auto epoch = cat_it->value("cached_at", int64_t{0});
    record.cached_at = std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
    return record;
}

void JsonFileBacking::set(const std::string& hostname,
                          CacheCategory category,
                          const nlohmann::json& data,
                          std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked();

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    doc_[hostguard::toLower(hostname)][std::string(categoryName(category))] = {
        {"data", data},
        {"cached_at", now},
        {"ttl", ttl.count()},
    };
    flushLocked();
}

void JsonFileBacking::clearHost(const std::string& hostname) {
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked();

    if (doc_.erase(hostguard::toLower(hostname)) > 0) {
        flushLocked();
    }
}

void JsonFileBacking::loadLocked() {
    if (loaded_) {
        return;
    }
    if (!load_error_.empty()) {
        throw std::runtime_error(load_error_);
    }

    std::ifstream in(path_);
    if (!in) {
        // no file yet: start empty
        doc_ = nlohmann::json::object();
        loaded_ = true;
        return;
    }

    nlohmann::json parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        load_error_ = "corrupt cache file: " + path_;
        throw std::runtime_error(load_error_);
    }
    doc_ = std::move(parsed);
    loaded_ = true;
}

void JsonFileBacking::flushLocked() {
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot write cache file: " + tmp);
        }
        out << doc_.dump();
        if (!out) {
            throw std::runtime_error("short write to cache file: " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        throw std::runtime_error("cannot replace cache file: " + path_);
    }
}

} // namespace cache
