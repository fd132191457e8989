#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cache {

/// Kind of cached data. Selects the default TTL.
enum class CacheCategory : uint8_t {
    LocalContext,
    LocalServices,
    LocalProcesses,
    HostBasic,
    HostSystem,
    HostServices,
    HostPackages,
    HostProcesses,
    HostFull,
    HostMetrics,
    InventoryList,
    InventorySearch,
    Relations,
    Default,
    Count_
};

inline constexpr size_t kCategoryCount = static_cast<size_t>(CacheCategory::Count_);

struct CategoryInfo {
    CacheCategory category;
    std::string_view name;
    std::chrono::seconds default_ttl;
};

// Indexed by CacheCategory; the static_assert below keeps it complete
inline constexpr std::array<CategoryInfo, kCategoryCount> kCategoryTable{{
    {CacheCategory::LocalContext,    "local_context",    std::chrono::seconds(43200)},
    {CacheCategory::LocalServices,   "local_services",   std::chrono::seconds(3600)},
    {CacheCategory::LocalProcesses,  "local_processes",  std::chrono::seconds(300)},
    {CacheCategory::HostBasic,       "host_basic",       std::chrono::seconds(300)},
    {CacheCategory::HostSystem,      "host_system",      std::chrono::seconds(1800)},
    {CacheCategory::HostServices,    "host_services",    std::chrono::seconds(900)},
    {CacheCategory::HostPackages,    "host_packages",    std::chrono::seconds(3600)},
    {CacheCategory::HostProcesses,   "host_processes",   std::chrono::seconds(60)},
    {CacheCategory::HostFull,        "host_full",        std::chrono::seconds(600)},
    {CacheCategory::HostMetrics,     "host_metrics",     std::chrono::seconds(60)},
    {CacheCategory::InventoryList,   "inventory_list",   std::chrono::seconds(300)},
    {CacheCategory::InventorySearch, "inventory_search", std::chrono::seconds(120)},
    {CacheCategory::Relations,       "relations",        std::chrono::seconds(3600)},
    {CacheCategory::Default,         "default",          std::chrono::seconds(300)},
}};

constexpr bool categoryTableIsOrdered() {
    for (size_t i = 0; i < kCategoryTable.size(); ++i) {
        if (static_cast<size_t>(kCategoryTable[i].category) != i) return false;
    }
    return true;
}
static_assert(categoryTableIsOrdered(), "kCategoryTable must list every CacheCategory in order");

constexpr const CategoryInfo& categoryInfo(CacheCategory c) {
    return kCategoryTable[static_cast<size_t>(c)];
}

constexpr std::string_view categoryName(CacheCategory c) {
    return categoryInfo(c).name;
}

constexpr std::chrono::seconds defaultTtl(CacheCategory c) {
    return categoryInfo(c).default_ttl;
}

inline std::optional<CacheCategory> parseCategory(std::string_view name) {
    for (const auto& info : kCategoryTable) {
        if (info.name == name) return info.category;
    }
    return std::nullopt;
}

} // namespace cache
