#include "cloud_source.hpp"

#include "../Common/logging.hpp"
#include "json_hosts_source.hpp"

namespace inventory {

namespace {

std::string lastPathSegment(const std::string& url) {
    auto slash = url.rfind('/');
    return slash == std::string::npos ? url : url.substr(slash + 1);
}

bool isGcpList(const nlohmann::json& doc) {
    return doc.is_array() && !doc.empty() && doc.front().is_object() &&
           doc.front().contains("networkInterfaces");
}

} // namespace

CloudSource::CloudSource(std::string path)
    : path_(std::move(path)) {
}

std::vector<RawHostRecord> CloudSource::parse() {
    auto content = readFile(path_);
    if (!content) {
        hostguard::logger()->warn("cloud inventory not readable: {}", path_);
        return {};
    }

    auto doc = nlohmann::json::parse(*content, nullptr, false);
    if (doc.is_discarded()) {
        hostguard::logger()->warn("failed to parse cloud inventory {}: invalid JSON", path_);
        return {};
    }

    auto records = parseDocument(doc);
    hostguard::logger()->debug("loaded {} instances from cloud inventory {}", records.size(), path_);
    return records;
}

std::vector<RawHostRecord> CloudSource::parseDocument(const nlohmann::json& doc) {
    if (doc.is_object() && doc.contains("Reservations")) {
        return parseAws(doc);
    }
    if (isGcpList(doc)) {
        return parseGcp(doc);
    }
    return JsonHostsSource::parseDocument(doc);
}

std::vector<RawHostRecord> CloudSource::parseAws(const nlohmann::json& doc) {
    std::vector<RawHostRecord> records;

    auto reservations = doc.find("Reservations");
    if (reservations == doc.end() || !reservations->is_array()) {
        return records;
    }

    for (const auto& reservation : *reservations) {
        auto instances = reservation.find("Instances");
        if (instances == reservation.end() || !instances->is_array()) continue;

        for (const auto& inst : *instances) {
            if (!inst.is_object()) continue;

            std::string state;
            auto st = inst.find("State");
            if (st != inst.end() && st->is_object()) {
                state = st->value("Name", "");
            }
            if (state != "running") continue;

            RawHostRecord record;
            std::string instance_id = inst.value("InstanceId", "");

            auto tags = inst.find("Tags");
            if (tags != inst.end() && tags->is_array()) {
                for (const auto& tag : *tags) {
                    std::string key = tag.value("Key", "");
                    std::string value = tag.value("Value", "");
                    std::string lower = hostguard::toLower(key);
                    if (key == "Name") {
                        record.name = value;
                    } else if (lower == "env" || lower == "environment") {
                        record.environment = value;
                    } else if (!key.empty()) {
                        record.metadata["tag:" + key] = value;
                    }
                }
            }
            if (record.name.empty()) {
                record.name = instance_id;
            }
            if (record.name.empty()) continue;

            std::string ip = inst.value("PrivateIpAddress", "");
            if (!ip.empty()) record.address = ip;

            record.metadata["instance_id"] = instance_id;
            record.metadata["instance_type"] = inst.value("InstanceType", "");
            auto placement = inst.find("Placement");
            if (placement != inst.end() && placement->is_object()) {
                record.metadata["availability_zone"] = placement->value("AvailabilityZone", "");
            }
            std::string public_ip = inst.value("PublicIpAddress", "");
            if (!public_ip.empty()) record.metadata["public_ip"] = public_ip;

            record.groups.push_back("aws");
            records.push_back(std::move(record));
        }
    }
    return records;
}

std::vector<RawHostRecord> CloudSource::parseGcp(const nlohmann::json& instances) {
    std::vector<RawHostRecord> records;

    for (const auto& inst : instances) {
        if (!inst.is_object() || inst.value("status", "") != "RUNNING") continue;

        RawHostRecord record;
        record.name = inst.value("name", "");
        if (record.name.empty()) continue;

        auto nics = inst.find("networkInterfaces");
        if (nics != inst.end() && nics->is_array() && !nics->empty()) {
            std::string ip = nics->front().value("networkIP", "");
            if (!ip.empty()) record.address = ip;
        }

        auto labels = inst.find("labels");
        if (labels != inst.end() && labels->is_object()) {
            for (auto it = labels->begin(); it != labels->end(); ++it) {
                if (!it.value().is_string()) continue;
                if (it.key() == "env" || it.key() == "environment") {
                    record.environment = it.value().get<std::string>();
                } else {
                    record.metadata["label:" + it.key()] = it.value().get<std::string>();
                }
            }
        }

        record.metadata["zone"] = lastPathSegment(inst.value("zone", ""));
        record.metadata["machine_type"] = lastPathSegment(inst.value("machineType", ""));
        record.groups.push_back("gcp");
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace inventory
