#ifndef scan_types_hpp
#define scan_types_hpp

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../Cache/cache_category.h"
#include "../Common/host_common.h"

namespace scan {

/// Which facts a scan gathers
enum class ScanCategory : uint8_t {
    Basic,      // resolution and reachability only
    System,
    Services,
    Packages,
    Processes,
    Full,
    Count_
};

struct ScanCategoryInfo {
    ScanCategory category;
    std::string_view name;
    cache::CacheCategory cache_category;
    bool needs_inspection;
};

inline constexpr std::array<ScanCategoryInfo, static_cast<size_t>(ScanCategory::Count_)> kScanCategoryTable{{
    {ScanCategory::Basic,     "basic",     cache::CacheCategory::HostBasic,     false},
    {ScanCategory::System,    "system",    cache::CacheCategory::HostSystem,    true},
    {ScanCategory::Services,  "services",  cache::CacheCategory::HostServices,  true},
    {ScanCategory::Packages,  "packages",  cache::CacheCategory::HostPackages,  true},
    {ScanCategory::Processes, "processes", cache::CacheCategory::HostProcesses, true},
    {ScanCategory::Full,      "full",      cache::CacheCategory::HostFull,      true},
}};

constexpr const ScanCategoryInfo& scanCategoryInfo(ScanCategory category) {
    return kScanCategoryTable[static_cast<size_t>(category)];
}

constexpr bool scanTableOrdered() {
    for (size_t i = 0; i < kScanCategoryTable.size(); ++i) {
        if (static_cast<size_t>(kScanCategoryTable[i].category) != i) return false;
    }
    return true;
}
static_assert(scanTableOrdered(), "kScanCategoryTable must follow ScanCategory order");

inline std::string_view scanCategoryName(ScanCategory category) { return scanCategoryInfo(category).name; }
inline cache::CacheCategory cacheCategoryFor(ScanCategory category) { return scanCategoryInfo(category).cache_category; }
inline bool needsInspection(ScanCategory category) { return scanCategoryInfo(category).needs_inspection; }

std::optional<ScanCategory> parseScanCategory(std::string_view name);

// ===== Configuration =====

struct RateConfig {
    double requests_per_second = 5.0;
    uint32_t burst_size = 10;

    void validate() const;
};

/**
 * Attempt n (1-based) of a retry waits min(base_delay * 2^(n-1), max_delay)
 */
struct RetryConfig {
    uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};

    std::chrono::milliseconds backoff(uint32_t retry) const;
    void validate() const;
};

struct TimeoutConfig {
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds command{30000};

    void validate() const;
};

struct BatchConfig {
    size_t batch_size = 5;
    uint16_t management_port = 22;

    void validate() const;
};

struct ScanConfig {
    RetryConfig retry;
    TimeoutConfig timeouts;
    BatchConfig batch;

    /// Throws std::invalid_argument
    void validate() const;
};

// ===== Results =====

/**
 * Outcome of one scan request, after retries.
 * retries counts re-attempts: 0 when the first attempt succeeded,
 * max_retries when every attempt failed.
 */
struct ScanResult {
    std::string hostname;
    ScanCategory category = ScanCategory::Basic;
    bool success = false;
    nlohmann::json data;
    std::string error;
    hostguard::ErrorKind error_kind = hostguard::ErrorKind::None;
    uint64_t duration_ms = 0;
    uint32_t retries = 0;
    hostguard::SystemTime timestamp{};
    bool from_cache = false;

    nlohmann::json toJson() const;
};

/// (completed, total, hostname) after every finished host, cached or fresh
using ProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

/**
 * What to scan: the name results are cached under, and optionally a known
 * address that replaces name resolution.
 */
struct ScanTarget {
    std::string hostname;
    std::optional<std::string> address;
};

} // namespace scan

#endif // scan_types_hpp
