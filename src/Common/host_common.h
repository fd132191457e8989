#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace hostguard {

/// Where a host record came from
enum class SourceKind : uint8_t {
    EtcHosts,
    SshConfig,
    Ansible,
    Cloud,
    CustomFile,
    Manual
};

/// Runtime failure taxonomy. Carried in results, never thrown.
enum class ErrorKind : uint8_t {
    None,
    InvalidTarget,
    SourceUnavailable,
    Unreachable,
    InspectionFailed,
    RetriesExhausted,
    CacheDegraded
};

using SystemTime = std::chrono::system_clock::time_point;

/**
 * A host known to the registry.
 * key() is the lowercased hostname; aliases and groups are stored as given.
 */
struct Host {
    std::string hostname;
    std::optional<std::string> ip_address;
    std::set<std::string> aliases;
    SourceKind source = SourceKind::Manual;
    std::optional<std::string> environment;   // production, staging, development...
    std::set<std::string> groups;
    std::map<std::string, std::string> metadata;
    std::optional<SystemTime> last_seen;
    std::optional<bool> accessible;

    std::string key() const;

    bool operator==(const Host& other) const;
    bool operator!=(const Host& other) const { return !(*this == other); }
};

/**
 * Merge incoming into existing (same key).
 * Sets union, metadata overlay with incoming winning, scalar fields filled only
 * when previously unset. Applying the same record twice changes nothing.
 */
void mergeHost(Host& existing, const Host& incoming);

std::string_view sourceKindName(SourceKind kind);
std::optional<SourceKind> parseSourceKind(std::string_view name);

std::string_view errorKindName(ErrorKind kind);

std::string toLower(std::string_view s);
std::string trim(std::string_view s);

/// ISO-8601 UTC rendering, e.g. 2026-10-17T08:30:00Z
std::string formatTime(SystemTime t);

} // namespace hostguard
