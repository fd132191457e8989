#include "inventory_source.hpp"

#include <arpa/inet.h>

#include <array>
#include <fstream>
#include <sstream>
#include <utility>

#include "ansible_source.hpp"
#include "cloud_source.hpp"
#include "csv_hosts_source.hpp"
#include "etc_hosts_source.hpp"
#include "json_hosts_source.hpp"
#include "ssh_config_source.hpp"
#include "text_hosts_source.hpp"

namespace inventory {

namespace {

using Factory = SourcePtr (*)(const std::string& path);

template <typename T>
SourcePtr create(const std::string& path) {
    return std::make_unique<T>(path);
}

bool hasExtension(const std::string& path, std::string_view ext) {
    std::string lower = hostguard::toLower(path);
    return lower.size() > ext.size() && lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0;
}

SourcePtr createCustomFile(const std::string& path) {
    if (hasExtension(path, ".csv")) {
        return std::make_unique<CsvHostsSource>(path);
    }
    if (hasExtension(path, ".txt") || hasExtension(path, ".list")) {
        return std::make_unique<TextHostsSource>(path);
    }
    return std::make_unique<JsonHostsSource>(path);
}

SourcePtr createNone(const std::string&) {
    return nullptr;
}

constexpr std::array<std::pair<hostguard::SourceKind, Factory>, 6> kFactories{{
    {hostguard::SourceKind::EtcHosts,   &create<EtcHostsSource>},
    {hostguard::SourceKind::SshConfig,  &create<SshConfigSource>},
    {hostguard::SourceKind::Ansible,    &create<AnsibleSource>},
    {hostguard::SourceKind::Cloud,      &create<CloudSource>},
    {hostguard::SourceKind::CustomFile, &createCustomFile},
    {hostguard::SourceKind::Manual,     &createNone},
}};

} // namespace

SourcePtr makeSource(hostguard::SourceKind kind, const std::string& path) {
    for (const auto& [k, factory] : kFactories) {
        if (k == kind) return factory(path);
    }
    return nullptr;
}

hostguard::Host toHost(const RawHostRecord& record, hostguard::SourceKind kind) {
    hostguard::Host host;
    host.hostname = hostguard::trim(record.name);
    if (record.address && !record.address->empty()) {
        host.ip_address = record.address;
    }
    for (const auto& alias : record.aliases) {
        std::string a = hostguard::trim(alias);
        if (!a.empty() && hostguard::toLower(a) != host.key()) {
            host.aliases.insert(std::move(a));
        }
    }
    host.groups.insert(record.groups.begin(), record.groups.end());
    host.source = kind;
    host.environment = record.environment;
    host.metadata = record.metadata;
    return host;
}

std::optional<std::string> inferEnvironment(std::string_view label) {
    std::string lower = hostguard::toLower(label);
    if (lower.find("prod") != std::string::npos) return std::string("production");
    if (lower.find("stag") != std::string::npos) return std::string("staging");
    if (lower.find("dev") != std::string::npos) return std::string("development");
    return std::nullopt;
}

bool isIpAddress(std::string_view s) {
    std::string text(s);
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, text.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, text.c_str(), buf) == 1;
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

} // namespace inventory
