#ifndef cloud_source_hpp
#define cloud_source_hpp

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inventory_source.hpp"

namespace inventory {

/**
 * Saved cloud provider inventory export.
 *
 * Recognized shapes:
 *   - AWS `ec2 describe-instances` output (Reservations[].Instances[])
 *   - GCP `compute instances list --format=json` output (array with networkInterfaces)
 *   - a plain host list as accepted by JsonHostsSource
 * Only running instances are kept.
 */
class CloudSource : public InventorySource {
public:
    explicit CloudSource(std::string path);

    hostguard::SourceKind kind() const override { return hostguard::SourceKind::Cloud; }
    std::string name() const override { return "cloud:" + path_; }
    std::vector<RawHostRecord> parse() override;

    static std::vector<RawHostRecord> parseDocument(const nlohmann::json& doc);

    static std::vector<RawHostRecord> parseAws(const nlohmann::json& doc);
    static std::vector<RawHostRecord> parseGcp(const nlohmann::json& instances);

private:
    std::string path_;
};

} // namespace inventory

#endif // cloud_source_hpp
