#ifndef ssh_config_source_hpp
#define ssh_config_source_hpp

#include <string>
#include <string_view>
#include <vector>

#include "inventory_source.hpp"

namespace inventory {

/**
 * OpenSSH client configuration
 *
 * Each "Host" line opens a block. The first concrete pattern is the host name,
 * the remaining concrete patterns are aliases; wildcard and negated patterns are
 * ignored. HostName becomes the address, User and Port go to metadata.
 * "Match" blocks are skipped.
 */
class SshConfigSource : public InventorySource {
public:
    explicit SshConfigSource(std::string path);

    hostguard::SourceKind kind() const override { return hostguard::SourceKind::SshConfig; }
    std::string name() const override { return "ssh_config:" + path_; }
    std::vector<RawHostRecord> parse() override;

    static std::vector<RawHostRecord> parseContent(std::string_view content);

    /// $HOME/.ssh/config, or empty when HOME is unset
    static std::string defaultPath();

private:
    std::string path_;
};

} // namespace inventory

#endif // ssh_config_source_hpp
