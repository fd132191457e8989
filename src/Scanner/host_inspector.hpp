#ifndef host_inspector_hpp
#define host_inspector_hpp

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "remote_executor.hpp"
#include "scan_types.hpp"

namespace scan {

/// How a command's stdout is turned into a fact
enum class FactFormat : uint8_t {
    Text,
    Integer,
    ServiceList,
    PortList
};

struct InspectionCommand {
    std::string_view fact;
    std::string_view command;
    FactFormat format;
};

struct InspectionOutcome {
    bool ok = false;
    nlohmann::json facts = nlohmann::json::object();
    std::string error;
};

/**
 * Gathers read-only facts from a reachable host through a RemoteExecutor.
 *
 * system:    os, kernel, uptime, cpu_count, memory_mb, hostname_full
 * services:  running services (first 20), well-known listening ports
 * packages:  installed package count
 * processes: load average, root disk usage, process count
 * full:      all of the above
 *
 * The first failing command fails the whole inspection.
 */
class HostInspector {
public:
    HostInspector(std::shared_ptr<RemoteExecutor> executor, std::chrono::milliseconds command_timeout);

    InspectionOutcome inspect(const std::string& address, ScanCategory category) const;

    bool available() const { return executor_ != nullptr; }

    static std::vector<InspectionCommand> commandsFor(ScanCategory category);

    /// Parse stdout according to format; null when there is nothing to record
    static nlohmann::json parseFact(FactFormat format, const std::string& output);

private:
    std::shared_ptr<RemoteExecutor> executor_;
    std::chrono::milliseconds command_timeout_;
};

} // namespace scan

#endif // host_inspector_hpp
