#include "ansible_source.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <deque>
#include <sstream>

#include "../Common/logging.hpp"

namespace inventory {

namespace {

bool containsGroup(const std::vector<std::string>& groups, const std::string& g) {
    return std::find(groups.begin(), groups.end(), g) != groups.end();
}

bool looksLikeJson(std::string_view content) {
    size_t pos = content.find_first_not_of(" \t\r\n");
    return pos != std::string_view::npos && content[pos] == '{';
}

} // namespace

AnsibleSource::AnsibleSource(std::string path)
    : path_(std::move(path)) {
}

std::vector<RawHostRecord> AnsibleSource::parse() {
    auto content = readFile(path_);
    if (!content) {
        hostguard::logger()->debug("ansible inventory not found: {}", path_);
        return {};
    }

    std::vector<RawHostRecord> records;
    if (looksLikeJson(*content)) {
        auto doc = nlohmann::json::parse(*content, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            hostguard::logger()->warn("failed to parse ansible inventory {}: invalid JSON", path_);
            return {};
        }
        records = parseJson(doc);
    } else {
        records = parseIni(*content);
    }

    hostguard::logger()->debug("loaded {} hosts from ansible inventory {}", records.size(), path_);
    return records;
}

std::vector<RawHostRecord> AnsibleSource::parseIni(std::string_view content) {
    enum class Section { Hosts, Vars, Children };

    Inventory inv;
    std::string group = "ungrouped";
    Section section = Section::Hosts;

    std::istringstream in{std::string(content)};
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = hostguard::trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            std::string header = line.substr(1, line.size() - 2);
            auto colon = header.find(':');
            if (colon == std::string::npos) {
                group = header;
                section = Section::Hosts;
            } else {
                group = header.substr(0, colon);
                std::string kind = header.substr(colon + 1);
                section = kind == "vars" ? Section::Vars :
                          kind == "children" ? Section::Children : Section::Hosts;
            }
            continue;
        }

        std::istringstream fields(line);
        std::string first;
        fields >> first;

        if (section == Section::Children) {
            inv.parents[first].insert(group);
            continue;
        }

        if (section == Section::Vars) {
            auto eq = line.find('=');
            if (eq != std::string::npos) {
                inv.group_vars[group][hostguard::trim(line.substr(0, eq))] =
                    hostguard::trim(line.substr(eq + 1));
            }
            continue;
        }

        std::map<std::string, std::string> vars;
        std::string token;
        while (fields >> token) {
            auto eq = token.find('=');
            if (eq != std::string::npos) {
                vars[token.substr(0, eq)] = token.substr(eq + 1);
            }
        }

        for (const auto& hostname : expandHostPattern(first)) {
            RawHostRecord& record = inv.host(hostname);
            if (!containsGroup(record.groups, group)) {
                record.groups.push_back(group);
            }
            for (const auto& [k, v] : vars) {
                if (k == "ansible_host") {
                    record.address = v;
                } else {
                    record.metadata[k] = v;
                }
            }
        }
    }

    return inv.finish();
}

std::vector<RawHostRecord> AnsibleSource::parseJson(const nlohmann::json& doc) {
    Inventory inv;

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& group = it.key();
        const nlohmann::json& body = it.value();
        if (group == "_meta" || !body.is_object()) {
            continue;
        }

        if (auto hosts = body.find("hosts"); hosts != body.end() && hosts->is_array()) {
            for (const auto& h : *hosts) {
                if (!h.is_string()) continue;
                RawHostRecord& record = inv.host(h.get<std::string>());
                if (!containsGroup(record.groups, group)) {
                    record.groups.push_back(group);
                }
            }
        }
        if (auto children = body.find("children"); children != body.end() && children->is_array()) {
            for (const auto& c : *children) {
                if (c.is_string()) inv.parents[c.get<std::string>()].insert(group);
            }
        }
        if (auto vars = body.find("vars"); vars != body.end() && vars->is_object()) {
            for (auto v = vars->begin(); v != vars->end(); ++v) {
                inv.group_vars[group][v.key()] = scalarToString(v.value());
            }
        }
    }

    auto meta = doc.find("_meta");
    if (meta != doc.end() && meta->is_object()) {
        auto hostvars = meta->find("hostvars");
        if (hostvars != meta->end() && hostvars->is_object()) {
            for (auto h = hostvars->begin(); h != hostvars->end(); ++h) {
                if (!h.value().is_object()) continue;
                RawHostRecord& record = inv.host(h.key());
                for (auto v = h.value().begin(); v != h.value().end(); ++v) {
                    if (v.key() == "ansible_host" && v.value().is_string()) {
                        record.address = v.value().get<std::string>();
                    } else {
                        record.metadata[v.key()] = scalarToString(v.value());
                    }
                }
            }
        }
    }

    return inv.finish();
}

std::vector<std::string> AnsibleSource::expandHostPattern(const std::string& pattern) {
    auto open = pattern.find('[');
    auto close = pattern.find(']', open == std::string::npos ? 0 : open);
    auto colon = pattern.find(':', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || close == std::string::npos ||
        colon == std::string::npos || colon > close) {
        return {pattern};
    }

    std::string lo = pattern.substr(open + 1, colon - open - 1);
    std::string hi = pattern.substr(colon + 1, close - colon - 1);
    auto digit = [](unsigned char c) { return std::isdigit(c) != 0; };
    bool numeric = !lo.empty() && !hi.empty() &&
                   std::all_of(lo.begin(), lo.end(), digit) &&
                   std::all_of(hi.begin(), hi.end(), digit);
    if (!numeric) {
        return {pattern};
    }

    std::string prefix = pattern.substr(0, open);
    std::string suffix = pattern.substr(close + 1);
    long from = std::strtol(lo.c_str(), nullptr, 10);
    long to = std::strtol(hi.c_str(), nullptr, 10);
    size_t width = lo.size() > 1 && lo[0] == '0' ? lo.size() : 0;

    std::vector<std::string> names;
    for (long i = from; i <= to && names.size() < 10000; ++i) {
        std::string n = std::to_string(i);
        if (n.size() < width) {
            n.insert(0, width - n.size(), '0');
        }
        names.push_back(prefix + n + suffix);
    }
    return names;
}

RawHostRecord& AnsibleSource::Inventory::host(const std::string& name) {
    auto it = hosts.find(name);
    if (it == hosts.end()) {
        order.push_back(name);
        RawHostRecord record;
        record.name = name;
        it = hosts.emplace(name, std::move(record)).first;
    }
    return it->second;
}

std::vector<RawHostRecord> AnsibleSource::Inventory::finish() {
    std::vector<RawHostRecord> out;
    out.reserve(order.size());

    for (const auto& name : order) {
        RawHostRecord record = hosts[name];

        // walk parent groups breadth-first
        std::deque<std::string> pending(record.groups.begin(), record.groups.end());
        while (!pending.empty()) {
            std::string g = pending.front();
            pending.pop_front();
            auto p = parents.find(g);
            if (p == parents.end()) continue;
            for (const auto& parent : p->second) {
                if (!containsGroup(record.groups, parent)) {
                    record.groups.push_back(parent);
                    pending.push_back(parent);
                }
            }
        }
        record.groups.erase(std::remove(record.groups.begin(), record.groups.end(), "all"),
                            record.groups.end());

        // host variables win over group variables
        for (const auto& g : record.groups) {
            auto vars = group_vars.find(g);
            if (vars == group_vars.end()) continue;
            for (const auto& [k, v] : vars->second) {
                if (k != "ansible_host") record.metadata.emplace(k, v);
            }
        }

        for (const char* key : {"environment", "env"}) {
            auto it = record.metadata.find(key);
            if (it != record.metadata.end() && !it->second.empty()) {
                record.environment = inferEnvironment(it->second).value_or(it->second);
                break;
            }
        }
        if (!record.environment) {
            for (const auto& g : record.groups) {
                if (auto env = inferEnvironment(g)) {
                    record.environment = env;
                    break;
                }
            }
        }

        out.push_back(std::move(record));
    }
    return out;
}

std::string AnsibleSource::scalarToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

} // namespace inventory
