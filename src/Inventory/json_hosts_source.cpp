#include "json_hosts_source.hpp"

#include "../Common/logging.hpp"

namespace inventory {

namespace {

std::optional<std::string> stringField(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = obj.find(k);
        if (it != obj.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

void appendStrings(const nlohmann::json& obj, const char* key, std::vector<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (it->is_string()) {
        out.push_back(it->get<std::string>());
        return;
    }
    if (!it->is_array()) return;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
}

} // namespace

JsonHostsSource::JsonHostsSource(std::string path)
    : path_(std::move(path)) {
}

std::vector<RawHostRecord> JsonHostsSource::parse() {
    auto content = readFile(path_);
    if (!content) {
        hostguard::logger()->warn("host list not readable: {}", path_);
        return {};
    }

    auto doc = nlohmann::json::parse(*content, nullptr, false);
    if (doc.is_discarded()) {
        hostguard::logger()->warn("failed to parse host list {}: invalid JSON", path_);
        return {};
    }

    auto records = parseDocument(doc);
    hostguard::logger()->debug("loaded {} hosts from {}", records.size(), path_);
    return records;
}

std::vector<RawHostRecord> JsonHostsSource::parseDocument(const nlohmann::json& doc) {
    const nlohmann::json* list = &doc;
    if (doc.is_object()) {
        auto it = doc.find("hosts");
        if (it == doc.end()) return {};
        list = &*it;
    }
    if (!list->is_array()) {
        return {};
    }

    std::vector<RawHostRecord> records;
    for (const auto& entry : *list) {
        if (auto record = parseEntry(entry)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::optional<RawHostRecord> JsonHostsSource::parseEntry(const nlohmann::json& entry) {
    RawHostRecord record;

    if (entry.is_string()) {
        record.name = hostguard::trim(entry.get<std::string>());
        if (record.name.empty()) return std::nullopt;
        return record;
    }
    if (!entry.is_object()) {
        return std::nullopt;
    }

    auto name = stringField(entry, {"hostname", "name"});
    if (!name) {
        return std::nullopt;
    }
    record.name = hostguard::trim(*name);
    record.address = stringField(entry, {"ip", "ip_address", "address"});
    record.environment = stringField(entry, {"environment", "env"});
    appendStrings(entry, "aliases", record.aliases);
    appendStrings(entry, "groups", record.groups);

    auto meta = entry.find("metadata");
    if (meta != entry.end() && meta->is_object()) {
        for (auto it = meta->begin(); it != meta->end(); ++it) {
            record.metadata[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                               : it.value().dump();
        }
    }
    return record;
}

} // namespace inventory
