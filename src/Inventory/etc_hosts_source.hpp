#ifndef etc_hosts_source_hpp
#define etc_hosts_source_hpp

#include <string>
#include <string_view>
#include <vector>

#include "inventory_source.hpp"

namespace inventory {

/**
 * hosts(5) file
 * Format: <address> <canonical name> [aliases...]   # comment
 * Lines not starting with an IPv4/IPv6 address are ignored, as are loopback,
 * broadcast, link-local and multicast entries.
 */
class EtcHostsSource : public InventorySource {
public:
    explicit EtcHostsSource(std::string path = "/etc/hosts");

    hostguard::SourceKind kind() const override { return hostguard::SourceKind::EtcHosts; }
    std::string name() const override { return "etc_hosts:" + path_; }
    std::vector<RawHostRecord> parse() override;

    /// Parse file content directly
    static std::vector<RawHostRecord> parseContent(std::string_view content);

private:
    static bool isSpecialAddress(std::string_view ip);
    static bool isSpecialName(std::string_view name);

private:
    std::string path_;
};

} // namespace inventory

#endif // etc_hosts_source_hpp
