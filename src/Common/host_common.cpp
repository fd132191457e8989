#include "host_common.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <utility>

namespace hostguard {

namespace {

constexpr std::array<std::pair<SourceKind, std::string_view>, 6> kSourceNames{{
    {SourceKind::EtcHosts,   "etc_hosts"},
    {SourceKind::SshConfig,  "ssh_config"},
    {SourceKind::Ansible,    "ansible"},
    {SourceKind::Cloud,      "cloud"},
    {SourceKind::CustomFile, "custom_file"},
    {SourceKind::Manual,     "manual"},
}};

constexpr std::array<std::pair<ErrorKind, std::string_view>, 7> kErrorNames{{
    {ErrorKind::None,              "none"},
    {ErrorKind::InvalidTarget,     "invalid_target"},
    {ErrorKind::SourceUnavailable, "source_unavailable"},
    {ErrorKind::Unreachable,       "unreachable"},
    {ErrorKind::InspectionFailed,  "inspection_failed"},
    {ErrorKind::RetriesExhausted,  "retries_exhausted"},
    {ErrorKind::CacheDegraded,     "cache_degraded"},
}};

} // namespace

std::string Host::key() const {
    return toLower(hostname);
}

bool Host::operator==(const Host& other) const {
    return key() == other.key() &&
           ip_address == other.ip_address &&
           aliases == other.aliases &&
           source == other.source &&
           environment == other.environment &&
           groups == other.groups &&
           metadata == other.metadata &&
           last_seen == other.last_seen &&
           accessible == other.accessible;
}

void mergeHost(Host& existing, const Host& incoming) {
    existing.aliases.insert(incoming.aliases.begin(), incoming.aliases.end());
    existing.groups.insert(incoming.groups.begin(), incoming.groups.end());

    for (const auto& [k, v] : incoming.metadata) {
        existing.metadata[k] = v;
    }

    if (!existing.ip_address && incoming.ip_address) {
        existing.ip_address = incoming.ip_address;
    }
    if (!existing.environment && incoming.environment) {
        existing.environment = incoming.environment;
    }
    if (!existing.accessible && incoming.accessible) {
        existing.accessible = incoming.accessible;
    }
    if (incoming.last_seen &&
        (!existing.last_seen || *incoming.last_seen > *existing.last_seen)) {
        existing.last_seen = incoming.last_seen;
    }
}

std::string_view sourceKindName(SourceKind kind) {
    for (const auto& [k, name] : kSourceNames) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::optional<SourceKind> parseSourceKind(std::string_view name) {
    std::string lowered = toLower(name);
    for (const auto& [k, n] : kSourceNames) {
        if (n == lowered) return k;
    }
    return std::nullopt;
}

std::string_view errorKindName(ErrorKind kind) {
    for (const auto& [k, name] : kErrorNames) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::string toLower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

std::string trim(std::string_view s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    return (start == std::string_view::npos) ? "" : std::string(s.substr(start, end - start + 1));
}

std::string formatTime(SystemTime t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer);
}

} // namespace hostguard
