#include "host_inspector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>

#include "../Common/logging.hpp"

namespace scan {

namespace {

constexpr std::array<InspectionCommand, 6> kSystemCommands{{
    {"os", "cat /etc/os-release 2>/dev/null | grep PRETTY_NAME | cut -d= -f2 | tr -d '\"'", FactFormat::Text},
    {"kernel", "uname -r", FactFormat::Text},
    {"uptime", "uptime -p 2>/dev/null || uptime", FactFormat::Text},
    {"cpu_count", "nproc 2>/dev/null || getconf _NPROCESSORS_ONLN", FactFormat::Integer},
    {"memory_mb", "free -m 2>/dev/null | awk '/^Mem:/{print $2}'", FactFormat::Integer},
    {"hostname_full", "hostname -f 2>/dev/null || hostname", FactFormat::Text},
}};

constexpr std::array<InspectionCommand, 2> kServiceCommands{{
    {"services", "systemctl list-units --type=service --state=running --no-pager --no-legend 2>/dev/null | head -20",
     FactFormat::ServiceList},
    {"open_ports", "ss -tlnH 2>/dev/null | awk '{print $4}' | grep -oE '[0-9]+$' | sort -un",
     FactFormat::PortList},
}};

constexpr std::array<InspectionCommand, 1> kPackageCommands{{
    {"package_count", "(dpkg-query -f '.\\n' -W 2>/dev/null || rpm -qa 2>/dev/null) | wc -l", FactFormat::Integer},
}};

constexpr std::array<InspectionCommand, 3> kProcessCommands{{
    {"load_average", "cut -d' ' -f1-3 /proc/loadavg", FactFormat::Text},
    {"disk_usage", "df -h / | tail -1 | awk '{print $5}'", FactFormat::Text},
    {"process_count", "ps -e --no-headers 2>/dev/null | wc -l", FactFormat::Integer},
}};

const std::set<long> kWellKnownPorts{22, 80, 443, 3306, 5432, 6379, 8080, 9000, 27017};

template <size_t N>
void append(std::vector<InspectionCommand>& out, const std::array<InspectionCommand, N>& commands) {
    out.insert(out.end(), commands.begin(), commands.end());
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = hostguard::trim(line);
        if (!line.empty()) out.push_back(std::move(line));
    }
    return out;
}

bool parseLong(const std::string& s, long& value) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        value = std::stol(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

HostInspector::HostInspector(std::shared_ptr<RemoteExecutor> executor, std::chrono::milliseconds command_timeout)
    : executor_(std::move(executor))
    , command_timeout_(command_timeout) {
}

std::vector<InspectionCommand> HostInspector::commandsFor(ScanCategory category) {
    std::vector<InspectionCommand> out;
    switch (category) {
    case ScanCategory::System:
        append(out, kSystemCommands);
        break;
    case ScanCategory::Services:
        append(out, kServiceCommands);
        break;
    case ScanCategory::Packages:
        append(out, kPackageCommands);
        break;
    case ScanCategory::Processes:
        append(out, kProcessCommands);
        break;
    case ScanCategory::Full:
        append(out, kSystemCommands);
        append(out, kServiceCommands);
        append(out, kPackageCommands);
        append(out, kProcessCommands);
        break;
    case ScanCategory::Basic:
    case ScanCategory::Count_:
        break;
    }
    return out;
}

InspectionOutcome HostInspector::inspect(const std::string& address, ScanCategory category) const {
    InspectionOutcome outcome;
    if (!executor_) {
        outcome.error = "no remote executor configured";
        return outcome;
    }

    for (const auto& cmd : commandsFor(category)) {
        CommandResult result;
        try {
            result = executor_->execute(address, std::string(cmd.command), command_timeout_);
        } catch (const std::exception& e) {
            outcome.error = std::string(cmd.fact) + ": " + e.what();
            return outcome;
        }

        if (result.exit_status != 0) {
            outcome.error = std::string(cmd.fact) + ": exit status " + std::to_string(result.exit_status);
            std::string err = hostguard::trim(result.err);
            if (!err.empty()) {
                outcome.error += " (" + err + ")";
            }
            return outcome;
        }

        auto fact = parseFact(cmd.format, result.out);
        if (!fact.is_null()) {
            outcome.facts[std::string(cmd.fact)] = std::move(fact);
        }
    }

    hostguard::logger()->debug("inspected {} ({}): {} facts", address, scanCategoryName(category),
                               outcome.facts.size());
    outcome.ok = true;
    return outcome;
}

nlohmann::json HostInspector::parseFact(FactFormat format, const std::string& output) {
    switch (format) {
    case FactFormat::Text: {
        std::string text = hostguard::trim(output);
        return text.empty() ? nlohmann::json() : nlohmann::json(text);
    }
    case FactFormat::Integer: {
        std::string text = hostguard::trim(output);
        long value = 0;
        if (parseLong(text, value)) return value;
        return text.empty() ? nlohmann::json() : nlohmann::json(text);
    }
    case FactFormat::ServiceList: {
        nlohmann::json services = nlohmann::json::array();
        for (const auto& line : lines(output)) {
            std::string unit = line.substr(0, line.find_first_of(" \t"));
            const std::string suffix = ".service";
            if (unit.size() > suffix.size() &&
                unit.compare(unit.size() - suffix.size(), suffix.size(), suffix) == 0) {
                unit.erase(unit.size() - suffix.size());
            }
            services.push_back(unit);
        }
        return services;
    }
    case FactFormat::PortList: {
        std::set<long> ports;
        for (const auto& line : lines(output)) {
            long port = 0;
            if (parseLong(line, port) && kWellKnownPorts.count(port)) {
                ports.insert(port);
            }
        }
        return nlohmann::json(std::vector<long>(ports.begin(), ports.end()));
    }
    }
    return nlohmann::json();
}

} // namespace scan
