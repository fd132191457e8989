#ifndef csv_hosts_source_hpp
#define csv_hosts_source_hpp

#include <string>
#include <string_view>
#include <vector>

#include "inventory_source.hpp"

namespace inventory {

/**
 * Spreadsheet export of hosts.
 *
 * The header row names the columns (case-insensitive). The first of
 * hostname/host/name/server/fqdn/node/machine is the host column; ip, env,
 * groups, aliases and port columns are recognized by their usual names and
 * every other non-empty cell lands in metadata under its header.
 * List cells are a JSON array or values separated by '|' or ','.
 */
class CsvHostsSource : public InventorySource {
public:
    explicit CsvHostsSource(std::string path);

    hostguard::SourceKind kind() const override { return hostguard::SourceKind::CustomFile; }
    std::string name() const override { return "csv:" + path_; }
    std::vector<RawHostRecord> parse() override;

    static std::vector<RawHostRecord> parseContent(std::string_view content);

    /// Split one record, honoring "quoted, fields" and doubled quotes
    static std::vector<std::string> splitRow(std::string_view line);

private:
    std::string path_;
};

} // namespace inventory

#endif // csv_hosts_source_hpp
