#ifndef text_hosts_source_hpp
#define text_hosts_source_hpp

#include <string>
#include <string_view>
#include <vector>

#include "inventory_source.hpp"

namespace inventory {

/**
 * Plain host list, one host per line: "host", "ip host" or "host ip".
 * '#' starts a comment.
 */
class TextHostsSource : public InventorySource {
public:
    explicit TextHostsSource(std::string path);

    hostguard::SourceKind kind() const override { return hostguard::SourceKind::CustomFile; }
    std::string name() const override { return "txt:" + path_; }
    std::vector<RawHostRecord> parse() override;

    static std::vector<RawHostRecord> parseContent(std::string_view content);

private:
    std::string path_;
};

} // namespace inventory

#endif // text_hosts_source_hpp
