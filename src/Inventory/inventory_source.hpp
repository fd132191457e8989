#ifndef inventory_source_hpp
#define inventory_source_hpp

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../Common/host_common.h"

namespace inventory {

/**
 * One host as a source describes it, before registry normalization
 */
struct RawHostRecord {
    std::string name;
    std::optional<std::string> address;
    std::vector<std::string> aliases;
    std::vector<std::string> groups;
    std::optional<std::string> environment;
    std::map<std::string, std::string> metadata;
};

/**
 * A collaborator yielding raw host records.
 * parse() reports unreadable or malformed input by logging and returning an
 * empty list; it should not throw, and callers still guard against it.
 */
class InventorySource {
public:
    virtual ~InventorySource() = default;

    virtual hostguard::SourceKind kind() const = 0;
    virtual std::string name() const = 0;
    virtual std::vector<RawHostRecord> parse() = 0;
};

using SourcePtr = std::unique_ptr<InventorySource>;

/**
 * Build the file-backed source for kind reading path. Manual has no source: nullptr.
 * Custom files are read as CSV (.csv), plain host lists (.txt, .list) or JSON.
 */
SourcePtr makeSource(hostguard::SourceKind kind, const std::string& path);

/// Normalize a record into a registry Host tagged with kind
hostguard::Host toHost(const RawHostRecord& record, hostguard::SourceKind kind);

/// "production" / "staging" / "development" when the label suggests one
std::optional<std::string> inferEnvironment(std::string_view label);

/// Dotted IPv4 or textual IPv6 literal
bool isIpAddress(std::string_view s);

/// Whole file as a string; nullopt when it cannot be opened
std::optional<std::string> readFile(const std::string& path);

} // namespace inventory

#endif // inventory_source_hpp
