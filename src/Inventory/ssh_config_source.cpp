#include "ssh_config_source.hpp"

#include <cstdlib>
#include <optional>
#include <sstream>

#include "../Common/logging.hpp"

namespace inventory {

namespace {

bool isPattern(const std::string& token) {
    return token.find_first_of("*?!") != std::string::npos;
}

// "Key value", "Key=value" and "Key = value" are all valid
bool splitKeyword(const std::string& line, std::string& keyword, std::string& value) {
    size_t end = line.find_first_of(" \t=");
    if (end == std::string::npos) {
        return false;
    }
    keyword = hostguard::toLower(line.substr(0, end));
    size_t start = line.find_first_not_of(" \t=", end);
    if (start == std::string::npos) {
        return false;
    }
    value = hostguard::trim(line.substr(start));
    return !value.empty();
}

} // namespace

SshConfigSource::SshConfigSource(std::string path)
    : path_(path.empty() ? defaultPath() : std::move(path)) {
}

std::string SshConfigSource::defaultPath() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return {};
    }
    return std::string(home) + "/.ssh/config";
}

std::vector<RawHostRecord> SshConfigSource::parse() {
    if (path_.empty()) {
        return {};
    }
    auto content = readFile(path_);
    if (!content) {
        hostguard::logger()->debug("ssh config not found: {}", path_);
        return {};
    }

    auto records = parseContent(*content);
    hostguard::logger()->debug("loaded {} hosts from ssh config {}", records.size(), path_);
    return records;
}

std::vector<RawHostRecord> SshConfigSource::parseContent(std::string_view content) {
    std::vector<RawHostRecord> records;
    std::optional<RawHostRecord> current;
    bool in_match = false;

    auto flush = [&]() {
        if (current && !current->name.empty()) {
            records.push_back(std::move(*current));
        }
        current.reset();
    };

    std::istringstream in{std::string(content)};
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = hostguard::trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::string keyword, value;
        if (!splitKeyword(line, keyword, value)) {
            continue;
        }

        if (keyword == "host") {
            flush();
            in_match = false;

            RawHostRecord record;
            std::istringstream patterns(value);
            std::string token;
            while (patterns >> token) {
                if (isPattern(token)) {
                    continue;
                }
                if (record.name.empty()) {
                    record.name = token;
                } else {
                    record.aliases.push_back(token);
                }
            }
            current = std::move(record);
            continue;
        }

        if (keyword == "match") {
            flush();
            in_match = true;
            continue;
        }

        if (in_match || !current) {
            continue;
        }

        if (keyword == "hostname") {
            current->address = value;
        } else if (keyword == "user") {
            current->metadata["ssh_user"] = value;
        } else if (keyword == "port") {
            current->metadata["ssh_port"] = value;
        } else if (keyword == "proxyjump") {
            current->metadata["proxy_jump"] = value;
        }
    }
    flush();
    return records;
}

} // namespace inventory
