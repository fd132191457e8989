#include "scan_types.hpp"

#include <algorithm>
#include <stdexcept>

namespace scan {

std::optional<ScanCategory> parseScanCategory(std::string_view name) {
    std::string lowered = hostguard::toLower(name);
    for (const auto& info : kScanCategoryTable) {
        if (info.name == lowered) return info.category;
    }
    return std::nullopt;
}

void RateConfig::validate() const {
    if (!(requests_per_second > 0.0)) {
        throw std::invalid_argument("rate.requests_per_second must be greater than 0");
    }
    if (burst_size == 0) {
        throw std::invalid_argument("rate.burst_size must be greater than 0");
    }
}

std::chrono::milliseconds RetryConfig::backoff(uint32_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds(0);
    }
    // doubling past max_delay is pointless, stop before the shift overflows
    std::chrono::milliseconds delay = base_delay;
    for (uint32_t i = 1; i < retry && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

void RetryConfig::validate() const {
    if (base_delay.count() < 0 || max_delay.count() < 0) {
        throw std::invalid_argument("retry delays must not be negative");
    }
    if (base_delay > max_delay) {
        throw std::invalid_argument("retry.base_delay must not exceed retry.max_delay");
    }
}

void TimeoutConfig::validate() const {
    if (connect.count() <= 0) {
        throw std::invalid_argument("timeouts.connect must be positive");
    }
    if (command.count() <= 0) {
        throw std::invalid_argument("timeouts.command must be positive");
    }
}

void BatchConfig::validate() const {
    if (batch_size == 0) {
        throw std::invalid_argument("batch.batch_size must be greater than 0");
    }
    if (management_port == 0) {
        throw std::invalid_argument("batch.management_port must be a valid port");
    }
}

void ScanConfig::validate() const {
    retry.validate();
    timeouts.validate();
    batch.validate();
}

nlohmann::json ScanResult::toJson() const {
    nlohmann::json j = {
        {"hostname", hostname},
        {"scan_type", std::string(scanCategoryName(category))},
        {"success", success},
        {"data", data.is_null() ? nlohmann::json::object() : data},
        {"duration_ms", duration_ms},
        {"retries", retries},
        {"timestamp", hostguard::formatTime(timestamp)},
        {"from_cache", from_cache},
    };
    if (!success) {
        j["error"] = error;
        j["error_kind"] = std::string(hostguard::errorKindName(error_kind));
    }
    return j;
}

} // namespace scan
