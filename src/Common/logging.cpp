#include "logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hostguard {

namespace {

constexpr const char* kLoggerName = "hostguard";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

} // namespace

void initLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            if (config.max_file_size > 0) {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file, config.max_file_size, config.max_files));
            } else {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
            }
        } catch (const spdlog::spdlog_ex& e) {
            // keep stderr logging when the file cannot be opened
            spdlog::warn("cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    created->set_pattern(config.pattern);

    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        level = spdlog::level::info;
    }
    created->set_level(level);

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(created);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = std::make_shared<spdlog::logger>(
            kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        g_logger->set_pattern(LoggingConfig{}.pattern);
    }
    return g_logger;
}

} // namespace hostguard
