#ifndef ansible_source_hpp
#define ansible_source_hpp

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "inventory_source.hpp"

namespace inventory {

/**
 * Ansible inventory
 *
 * Supports the INI format ([group], [group:vars], [group:children], host ranges
 * like web[01:03]) and the JSON produced by `ansible-inventory --list`.
 * The format is detected from the content. ansible_host becomes the address,
 * other host variables go to metadata; the environment is inferred from group names.
 */
class AnsibleSource : public InventorySource {
public:
    explicit AnsibleSource(std::string path);

    hostguard::SourceKind kind() const override { return hostguard::SourceKind::Ansible; }
    std::string name() const override { return "ansible:" + path_; }
    std::vector<RawHostRecord> parse() override;

    static std::vector<RawHostRecord> parseIni(std::string_view content);
    static std::vector<RawHostRecord> parseJson(const nlohmann::json& doc);

    /// web[01:03].example.com -> web01, web02, web03 (.example.com)
    static std::vector<std::string> expandHostPattern(const std::string& pattern);

private:
    /**
     * Collected state shared by both formats before records are emitted
     */
    struct Inventory {
        std::vector<std::string> order;
        std::map<std::string, RawHostRecord> hosts;
        std::map<std::string, std::map<std::string, std::string>> group_vars;
        std::map<std::string, std::set<std::string>> parents;   // child -> parents

        RawHostRecord& host(const std::string& name);
        std::vector<RawHostRecord> finish();
    };

    static std::string scalarToString(const nlohmann::json& value);

private:
    std::string path_;
};

} // namespace inventory

#endif // ansible_source_hpp
