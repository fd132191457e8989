#include "text_hosts_source.hpp"

#include <sstream>

#include "../Common/logging.hpp"

namespace inventory {

TextHostsSource::TextHostsSource(std::string path)
    : path_(std::move(path)) {
}

std::vector<RawHostRecord> TextHostsSource::parse() {
    auto content = readFile(path_);
    if (!content) {
        hostguard::logger()->warn("host list not readable: {}", path_);
        return {};
    }

    auto records = parseContent(*content);
    hostguard::logger()->debug("loaded {} hosts from {}", records.size(), path_);
    return records;
}

std::vector<RawHostRecord> TextHostsSource::parseContent(std::string_view content) {
    std::vector<RawHostRecord> records;
    std::istringstream in{std::string(content)};
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }

        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string field;
        while (fields >> field) {
            parts.push_back(field);
        }
        if (parts.empty()) {
            continue;
        }

        RawHostRecord record;
        if (parts.size() >= 2 && isIpAddress(parts[0])) {
            record.name = parts[1];
            record.address = parts[0];
        } else if (parts.size() >= 2 && isIpAddress(parts[1])) {
            record.name = parts[0];
            record.address = parts[1];
        } else {
            if (parts.size() >= 2) {
                hostguard::logger()->warn("line {}: neither '{}' nor '{}' is an IP address", line_no,
                                          parts[0], parts[1]);
            }
            record.name = parts[0];
        }
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace inventory
