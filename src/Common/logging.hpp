#ifndef hostguard_logging_hpp
#define hostguard_logging_hpp

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace hostguard {

/**
 * Logging settings
 * level: trace, debug, info, warn, error, critical, off
 * file: empty means stderr only
 * max_file_size: rotate when exceeded, 0 disables rotation
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 3;
};

/**
 * Configure the shared "hostguard" logger. Replaces any previous one.
 * An unknown level name falls back to info.
 */
void initLogging(const LoggingConfig& config);

/// The shared logger, created with a stderr sink on first use
std::shared_ptr<spdlog::logger> logger();

} // namespace hostguard

#endif // hostguard_logging_hpp
