#ifndef json_hosts_source_hpp
#define json_hosts_source_hpp

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inventory_source.hpp"

namespace inventory {

/**
 * Operator-maintained JSON host list.
 *
 * Either a top-level array or {"hosts": [...]}. Each element is a bare hostname
 * string or an object:
 *   {"hostname"|"name": "...", "ip"|"address": "...", "aliases": [...],
 *    "environment": "...", "groups": [...], "metadata": {...}}
 */
class JsonHostsSource : public InventorySource {
public:
    explicit JsonHostsSource(std::string path);

    hostguard::SourceKind kind() const override { return hostguard::SourceKind::CustomFile; }
    std::string name() const override { return "json:" + path_; }
    std::vector<RawHostRecord> parse() override;

    static std::vector<RawHostRecord> parseDocument(const nlohmann::json& doc);

    /// One element of the host list; nullopt when it carries no usable name
    static std::optional<RawHostRecord> parseEntry(const nlohmann::json& entry);

private:
    std::string path_;
};

} // namespace inventory

#endif // json_hosts_source_hpp
