#ifndef host_registry_hpp
#define host_registry_hpp

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../Common/host_common.h"
#include "../Inventory/inventory_source.hpp"

namespace registry {

using HostPtr = std::shared_ptr<const hostguard::Host>;

/// Minimum similarity for a suggestion; matches must score strictly above it
constexpr double kSuggestionThreshold = 0.4;
constexpr size_t kMaxSuggestions = 5;

struct SourceSpec {
    hostguard::SourceKind kind = hostguard::SourceKind::CustomFile;
    std::string path;
};

/**
 * Which inventories to read. An empty path disables that source.
 */
struct RegistryConfig {
    std::chrono::seconds reload_ttl{15 * 60};
    std::string etc_hosts_path;
    std::string ssh_config_path;
    std::vector<std::string> ansible_paths;
    std::vector<std::string> cloud_paths;
    std::vector<SourceSpec> extra_sources;

    /// /etc/hosts, ~/.ssh/config and /etc/ansible/hosts
    static RegistryConfig systemDefaults();

    void validate() const;
};

struct Suggestion {
    std::string hostname;
    double score = 0.0;
};

struct HostValidationResult {
    bool valid = false;
    HostPtr host;       // record as of this call; later merges publish a new one
    std::string key;    // canonical key, for re-reading the current record with find()
    std::string query;
    std::vector<Suggestion> suggestions;    // invalid only, best first
    std::string error_message;

    /// "✓ Host 'x' is valid" or the not-found text listing suggestions
    std::string suggestionText() const;
};

struct SourceLoadReport {
    std::string source;
    hostguard::SourceKind kind = hostguard::SourceKind::Manual;
    size_t records = 0;
    hostguard::ErrorKind error_kind = hostguard::ErrorKind::None;
    std::string error;
};

struct HostFilter {
    std::optional<std::string> environment;
    std::optional<std::string> group;
    std::optional<hostguard::SourceKind> source;
    std::optional<std::string> pattern;     // case-insensitive regex searched in the hostname
};

struct RegistryStats {
    size_t total_hosts = 0;
    size_t total_aliases = 0;
    std::map<std::string, size_t> by_environment;
    std::map<std::string, size_t> by_source;
    std::vector<std::string> loaded_sources;
    std::optional<hostguard::SystemTime> last_refresh;

    nlohmann::json toJson() const;
};

/**
 * The set of hosts that exist.
 *
 * Hosts are keyed by lowercased hostname and only ever merged, never removed,
 * until reset(). Records are copy-on-write: a HostPtr handed out stays
 * unchanged while later loads merge into a fresh copy.
 * Reads take a shared lock; merges take it exclusively.
 */
class HostRegistry {
public:
    explicit HostRegistry(RegistryConfig config = {});

    HostRegistry(const HostRegistry&) = delete;
    HostRegistry& operator=(const HostRegistry&) = delete;

    /// Read on every load in addition to the configured files
    void addSource(inventory::SourcePtr source);

    /**
     * Parse every source and merge the records.
     * Within reload_ttl of the previous load nothing is read unless force is set.
     * A source that throws is logged and skipped.
     * @return number of hosts in the registry
     */
    size_t loadAllSources(bool force = false);

    HostValidationResult validate(std::string_view query);

    /// nullptr when validate() fails
    HostPtr get(std::string_view query);

    /// Local literal, exact key or alias match only; no suggestions are computed
    HostPtr find(std::string_view query);

    /// Throws std::out_of_range carrying suggestionText() when validate() fails
    HostPtr require(std::string_view query);

    /// Throws std::invalid_argument for a malformed pattern
    std::vector<HostPtr> filter(const HostFilter& criteria) const;

    hostguard::Host registerManualHost(const std::string& hostname,
                                       std::optional<std::string> ip_address = std::nullopt,
                                       std::optional<std::string> environment = std::nullopt);

    RegistryStats getStats() const;
    std::vector<SourceLoadReport> lastLoadReport() const;

    std::vector<std::string> hostnames() const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    /// Drop every host, alias and load record
    void reset();

    static bool isLocalTarget(std::string_view query);

private:
    struct Pending {
        SourceLoadReport report;
        std::vector<hostguard::Host> hosts;
    };

    Pending readSource(inventory::InventorySource& source);
    void registerLocked(const hostguard::Host& host);
    HostPtr lookupLocked(const std::string& key) const;
    std::vector<Suggestion> findSimilarLocked(const std::string& lowered) const;

private:
    RegistryConfig config_;
    std::vector<inventory::SourcePtr> injected_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, HostPtr> hosts_;
    std::unordered_map<std::string, std::string> aliases_;   // lowered alias -> key
    std::vector<SourceLoadReport> reports_;
    std::optional<hostguard::SystemTime> last_refresh_;
    std::optional<std::chrono::steady_clock::time_point> loaded_at_;

    std::mutex load_mutex_;     // one load at a time
    HostPtr local_host_;
};

} // namespace registry

#endif // host_registry_hpp
