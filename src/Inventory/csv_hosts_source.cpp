#include "csv_hosts_source.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../Common/logging.hpp"

namespace inventory {

namespace {

constexpr std::array<std::string_view, 7> kHostColumns{
    "hostname", "host", "name", "server", "fqdn", "node", "machine"};
constexpr std::array<std::string_view, 6> kAddressColumns{
    "ip", "ip_address", "ipaddress", "address", "addr", "ansible_host"};
constexpr std::array<std::string_view, 4> kEnvColumns{"environment", "env", "stage", "tier"};

template <size_t N>
std::optional<size_t> findColumn(const std::vector<std::string>& header,
                                 const std::array<std::string_view, N>& names) {
    for (auto name : names) {
        auto it = std::find(header.begin(), header.end(), name);
        if (it != header.end()) {
            return static_cast<size_t>(it - header.begin());
        }
    }
    return std::nullopt;
}

std::vector<std::string> parseList(const std::string& cell) {
    std::vector<std::string> out;
    std::string text = hostguard::trim(cell);
    if (text.empty()) {
        return out;
    }

    if (text.front() == '[') {
        auto doc = nlohmann::json::parse(text, nullptr, false);
        if (!doc.is_discarded() && doc.is_array()) {
            for (const auto& v : doc) {
                if (v.is_string() && !v.get<std::string>().empty()) out.push_back(v.get<std::string>());
            }
            return out;
        }
    }

    char sep = text.find('|') != std::string::npos ? '|' : ',';
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, sep)) {
        item = hostguard::trim(item);
        if (!item.empty()) out.push_back(std::move(item));
    }
    return out;
}

std::string portValue(const std::string& cell) {
    std::string text = hostguard::trim(cell);
    bool digits = !text.empty() && text.size() <= 5 &&
                  std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
    if (!digits || std::stol(text) == 0 || std::stol(text) > 65535) {
        return "22";
    }
    return text;
}

} // namespace

CsvHostsSource::CsvHostsSource(std::string path)
    : path_(std::move(path)) {
}

std::vector<RawHostRecord> CsvHostsSource::parse() {
    auto content = readFile(path_);
    if (!content) {
        hostguard::logger()->warn("host list not readable: {}", path_);
        return {};
    }

    auto records = parseContent(*content);
    hostguard::logger()->debug("loaded {} hosts from {}", records.size(), path_);
    return records;
}

std::vector<std::string> CsvHostsSource::splitRow(std::string_view line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(std::move(cell));
            cell.clear();
        } else if (c != '\r') {
            cell += c;
        }
    }
    cells.push_back(std::move(cell));
    return cells;
}

std::vector<RawHostRecord> CsvHostsSource::parseContent(std::string_view content) {
    std::vector<RawHostRecord> records;
    std::istringstream in{std::string(content)};
    std::string line;

    std::vector<std::string> header;
    std::vector<std::string> lowered;
    while (std::getline(in, line)) {
        if (!hostguard::trim(line).empty()) {
            header = splitRow(line);
            break;
        }
    }
    for (auto& h : header) {
        h = hostguard::trim(h);
        lowered.push_back(hostguard::toLower(h));
    }

    auto host_col = findColumn(lowered, kHostColumns);
    if (!host_col) {
        hostguard::logger()->warn("CSV host list has no hostname column");
        return records;
    }
    auto addr_col = findColumn(lowered, kAddressColumns);
    auto env_col = findColumn(lowered, kEnvColumns);

    while (std::getline(in, line)) {
        if (hostguard::trim(line).empty()) {
            continue;
        }
        auto row = splitRow(line);
        if (*host_col >= row.size() || hostguard::trim(row[*host_col]).empty()) {
            continue;
        }

        RawHostRecord record;
        record.name = hostguard::trim(row[*host_col]);

        for (size_t i = 0; i < row.size() && i < header.size(); ++i) {
            if (i == *host_col) continue;
            std::string value = hostguard::trim(row[i]);
            if (value.empty()) continue;

            const std::string& col = lowered[i];
            if (addr_col && i == *addr_col) {
                record.address = value;
            } else if (env_col && i == *env_col) {
                record.environment = value;
            } else if (col == "groups" || col == "group") {
                record.groups = parseList(value);
            } else if (col == "aliases" || col == "alias") {
                record.aliases = parseList(value);
            } else if (col == "port" || col == "ssh_port") {
                record.metadata["port"] = portValue(value);
            } else {
                record.metadata[header[i]] = value;
            }
        }
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace inventory
