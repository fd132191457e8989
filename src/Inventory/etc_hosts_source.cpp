#include "etc_hosts_source.hpp"

#include <arpa/inet.h>

#include <sstream>

#include "../Common/logging.hpp"

namespace inventory {

EtcHostsSource::EtcHostsSource(std::string path)
    : path_(std::move(path)) {
}

std::vector<RawHostRecord> EtcHostsSource::parse() {
    auto content = readFile(path_);
    if (!content) {
        hostguard::logger()->debug("hosts file not found: {}", path_);
        return {};
    }

    auto records = parseContent(*content);
    hostguard::logger()->debug("loaded {} hosts from {}", records.size(), path_);
    return records;
}

std::vector<RawHostRecord> EtcHostsSource::parseContent(std::string_view content) {
    std::vector<RawHostRecord> records;
    std::istringstream in{std::string(content)};
    std::string line;

    while (std::getline(in, line)) {
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
        if (parts.size() < 2) {
            continue;
        }

        const std::string& ip = parts[0];
        // scoped v6 addresses carry a %zone suffix
        const std::string bare = ip.substr(0, ip.find('%'));
        if (!isIpAddress(bare)) {
            hostguard::logger()->debug("hosts line without a leading address skipped: {}", line);
            continue;
        }
        if (isSpecialAddress(bare) || isSpecialName(parts[1])) {
            continue;
        }

        RawHostRecord record;
        record.name = parts[1];
        record.address = ip;
        for (size_t i = 2; i < parts.size(); ++i) {
            if (!isSpecialName(parts[i])) {
                record.aliases.push_back(parts[i]);
            }
        }
        records.push_back(std::move(record));
    }
    return records;
}

bool EtcHostsSource::isSpecialAddress(std::string_view ip) {
    std::string s(ip);
    struct in_addr v4;
    if (inet_pton(AF_INET, s.c_str(), &v4) == 1) {
        const auto* b = reinterpret_cast<const unsigned char*>(&v4.s_addr);
        // 0/8, loopback 127/8, link-local 169.254/16, multicast 224/4, broadcast
        return b[0] == 0 || b[0] == 127 ||
               (b[0] == 169 && b[1] == 254) ||
               (b[0] >= 224 && b[0] <= 239) ||
               s == "255.255.255.255";
    }

    struct in6_addr v6;
    if (inet_pton(AF_INET6, s.c_str(), &v6) == 1) {
        const unsigned char* b = v6.s6_addr;
        bool loopback = true;
        for (int i = 0; i < 15; ++i) {
            if (b[i] != 0) {
                loopback = false;
                break;
            }
        }
        // ::1, link-local fe80::/10, multicast ff00::/8
        return (loopback && b[15] == 1) ||
               (b[0] == 0xfe && (b[1] & 0xc0) == 0x80) ||
               b[0] == 0xff;
    }
    return false;
}

bool EtcHostsSource::isSpecialName(std::string_view name) {
    std::string lower = hostguard::toLower(name);
    return lower == "localhost" || lower == "broadcasthost" ||
           lower == "localhost.localdomain" ||
           lower.rfind("ip6-", 0) == 0;
}

} // namespace inventory
