#include "../src/Common/logging.hpp"
#include "../src/Engine/engine.hpp"
#include "../src/Engine/engine_config.hpp"
#include "test_support.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>

using namespace hostguard;
using test::TempDir;
using test::TestStats;
using std::chrono::milliseconds;
using nlohmann::json;

namespace {

class CountingProbe : public scan::NetworkProbe {
public:
    std::vector<std::string> resolve(const std::string& hostname) override {
        std::lock_guard<std::mutex> lock(mutex_);
        resolves[hostname]++;
        return {"10.200.0.1"};
    }

    bool connect(const std::string& address, uint16_t, milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connects++;
        return down.count(address) == 0;
    }

    std::mutex mutex_;
    std::map<std::string, int> resolves;
    std::set<std::string> down;
    int connects = 0;
};

EngineConfig engineConfig(const TempDir& dir) {
    json doc = {
        {"logging", {{"level", "off"}}},
        {"rate", {{"requests_per_second", 1000}, {"burst_size", 100}}},
        {"retry", {{"max_retries", 1}, {"base_delay", 0.005}, {"max_delay", 0.01}}},
        {"registry", {
            {"etc_hosts", dir.write("hosts", "10.0.0.1 web-01 web\n10.0.0.2 db-01\n")},
            {"ssh_config", ""},
            {"ansible", json::array({dir.write("inventory.ini", "[prod]\nweb-01\n")})},
        }},
    };
    return EngineConfig::fromJson(doc);
}

template <typename Ex, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

} // namespace

// =================== A. Configuration ===================
void testConfig(TestStats& stats) {
    std::cout << "\n[A. Configuration Tests]\n";

    EngineConfig defaults = EngineConfig::fromJson(json::object());
    stats.check(defaults.rate.requests_per_second == 5.0 && defaults.rate.burst_size == 10, "default rate 5/s burst 10");
    stats.check(defaults.scan.retry.max_retries == 3 && defaults.scan.batch.batch_size == 5, "default retry and batch");
    stats.check(defaults.registry.etc_hosts_path == "/etc/hosts", "system inventories by default");

    json doc = json::parse(R"({
        "rate": {"requests_per_second": 50, "burst_size": 20},
        "retry": {"max_retries": 1, "base_delay": 0.01, "max_delay": 0.05},
        "timeouts": {"connect": 0.2},
        "batch": {"batch_size": 4, "management_port": 2222},
        "cache": {"ttl": {"host_basic": 30, "bogus": 5}, "max_entries": 50},
        "registry": {"reload_ttl": 60, "etc_hosts": "/tmp/hosts", "ssh_config": "", "ansible": [],
                     "sources": [{"type": "custom_file", "path": "/tmp/hosts.json"}]}
    })");
    EngineConfig c = EngineConfig::fromJson(doc);
    stats.check(c.rate.requests_per_second == 50.0 && c.rate.burst_size == 20, "rate overridden");
    stats.check(c.scan.retry.max_retries == 1 && c.scan.retry.base_delay == milliseconds(10) &&
                c.scan.retry.max_delay == milliseconds(50), "retry delays read in seconds");
    stats.check(c.scan.timeouts.connect == milliseconds(200) && c.scan.timeouts.command == milliseconds(30000),
                "unset keys keep their defaults");
    stats.check(c.scan.batch.batch_size == 4 && c.scan.batch.management_port == 2222, "batch overridden");
    stats.check(c.cache.ttl_overrides.size() == 1 &&
                c.cache.ttl_overrides.at(cache::CacheCategory::HostBasic) == std::chrono::seconds(30),
                "known TTL categories applied, unknown ignored");
    stats.check(c.cache.max_entries == 50, "cache size overridden");
    stats.check(c.registry.reload_ttl == std::chrono::seconds(60) && c.registry.ssh_config_path.empty() &&
                c.registry.ansible_paths.empty(), "registry paths overridden");
    stats.check(c.registry.extra_sources.size() == 1 &&
                c.registry.extra_sources[0].kind == SourceKind::CustomFile, "extra sources read");

    stats.check(throws<std::invalid_argument>([] {
        EngineConfig::fromJson(json::parse(R"({"rate": {"burst_size": -1}})"));
    }), "negative count rejected");
    stats.check(throws<std::invalid_argument>([] {
        EngineConfig::fromJson(json::parse(R"({"rate": {"requests_per_second": "fast"}})"));
    }), "ill-typed value rejected");
    stats.check(throws<std::invalid_argument>([] {
        EngineConfig::fromJson(json::parse(R"({"batch": 5})"));
    }), "non-object section rejected");
    stats.check(throws<std::invalid_argument>([] {
        EngineConfig::fromJson(json::parse(R"({"registry": {"sources": [{"type": "ldap", "path": "x"}]}})"));
    }), "unknown source type rejected");
    stats.check(throws<std::invalid_argument>([] { EngineConfig::fromJson(json::array()); }),
                "non-object document rejected");

    EngineConfig zero_rate = EngineConfig::fromJson(json::parse(R"({"rate": {"requests_per_second": 0}})"));
    stats.check(throws<std::invalid_argument>([&] { zero_rate.validate(); }), "zero rate fails validation");
    EngineConfig inverted = EngineConfig::fromJson(json::parse(R"({"retry": {"base_delay": 10, "max_delay": 1}})"));
    stats.check(throws<std::invalid_argument>([&] { inverted.validate(); }), "base delay above max fails validation");
    stats.check(throws<std::invalid_argument>([&] { Engine engine(inverted); }), "engine refuses invalid config");

    TempDir dir;
    stats.check(throws<std::runtime_error>([&] { loadConfigFile(dir.file("missing.json")); }), "missing file reported");
    std::string broken = dir.write("broken.json", "{not json");
    stats.check(throws<std::runtime_error>([&] { loadConfigFile(broken); }), "malformed file reported");
    std::string good = dir.write("good.json", R"({"batch": {"batch_size": 2}})");
    stats.check(loadConfigFile(good).scan.batch.batch_size == 2, "config file loaded");
}

// =================== B. Target resolution ===================
void testResolution(TestStats& stats) {
    std::cout << "\n[B. Target Resolution Tests]\n";

    TempDir dir;
    auto probe = std::make_shared<CountingProbe>();
    Engine engine(engineConfig(dir), nullptr, probe, nullptr);
    engine.start();

    stats.check(engine.registry().size() == 2, "inventories loaded on start");
    stats.check(engine.cache().cleanupRunning(), "cache sweep running");

    auto port = engine.resolveTarget("web-01:22");
    stats.check(port.sanitized == "web-01" && port.sanitized_modified && port.validation.valid,
                "port suffix stripped before validation");

    auto alias = engine.resolveTarget("WEB");
    auto host = alias.validation.host;
    stats.check(alias.validation.valid && host && host->hostname == "web-01", "alias resolves to canonical host");
    stats.check(host && host->environment == std::optional<std::string>("production"),
                "environment inferred from ansible group");

    auto injected = engine.resolveTarget("db-01</parameter>");
    stats.check(injected.sanitized == "db-01" && injected.validation.valid, "markup removed from hostname");

    auto missing = engine.resolveTarget("web-0");
    stats.check(!missing.validation.valid && !missing.validation.suggestions.empty() &&
                missing.validation.suggestions[0].hostname == "web-01", "closest host suggested");
    stats.check(engine.cache().getInventorySearch("web-0").has_value(), "suggestions cached");

    auto again = engine.resolveTarget("web-0");
    stats.check(!again.validation.valid && again.validation.suggestions.size() == missing.validation.suggestions.size() &&
                again.validation.suggestions[0].hostname == "web-01", "cached suggestions reused");

    Host manual = engine.registerManualHost("web-0", std::string("10.0.0.3"));
    stats.check(manual.source == SourceKind::Manual, "manual host registered");
    stats.check(!engine.cache().getInventorySearch("web-0"), "registration drops cached suggestions");
    stats.check(engine.resolveTarget("web-0").validation.valid, "manual host now valid");

    engine.resolveTarget("nosuch-host");
    engine.reloadInventory();
    stats.check(!engine.cache().getInventorySearch("nosuch-host"), "reload drops cached suggestions");

    auto empty = engine.resolveTarget("  ");
    stats.check(!empty.validation.valid && empty.sanitized.empty(), "blank target invalid");

    engine.stop();
    stats.check(!engine.cache().cleanupRunning(), "stop ends the sweep");
    engine.stop();
}

// =================== C. Validate and scan ===================
void testValidateAndScan(TestStats& stats) {
    std::cout << "\n[C. Validate and Scan Tests]\n";

    TempDir dir;
    auto probe = std::make_shared<CountingProbe>();
    EngineConfig config = engineConfig(dir);
    config.cache_file = dir.file("scan-cache.json");

    {
        Engine engine(config, nullptr, probe, nullptr);
        engine.start();

        auto ok = engine.validateAndScan("web-01", scan::ScanCategory::Basic);
        stats.check(ok.target.validation.valid && ok.scan && ok.scan->success, "valid host scanned");
        stats.check(ok.scan && ok.scan->data["ip"] == "10.0.0.1" && probe->resolves["web-01"] == 0,
                    "inventory address used without DNS");

        auto rejected = engine.validateAndScan("nosuch-zz", scan::ScanCategory::Basic);
        stats.check(!rejected.scan && probe->resolves.count("nosuch-zz") == 0, "invalid host never scanned");
        json j = rejected.toJson();
        stats.check(j["valid"] == false && j.contains("message") && !j.contains("scan"), "rejection explained");

        auto local = engine.validateAndScan("localhost", scan::ScanCategory::Basic);
        stats.check(local.scan && local.scan->success && local.scan->data["ip"] == "127.0.0.1", "localhost scanned");

        auto deep = engine.validateAndScan("db-01", scan::ScanCategory::System);
        stats.check(deep.scan && !deep.scan->success && deep.scan->error_kind == ErrorKind::InspectionFailed,
                    "deep scan without executor fails");

        probe->down.insert("10.0.0.2");
        auto down = engine.validateAndScan("db-01", scan::ScanCategory::Basic);
        stats.check(down.scan && !down.scan->success && down.scan->retries == 1 &&
                    down.scan->error_kind == ErrorKind::RetriesExhausted, "unreachable host retried then failed");

        json s = engine.stats();
        stats.check(s["registry"]["total_hosts"] == 2 && s["rate_limiter"]["burst_size"] == 100 &&
                    s["cache"].contains("entries"), "engine stats");
        engine.stop();
    }

    stats.check(std::filesystem::exists(config.cache_file), "scan results persisted");

    int connects = probe->connects;
    Engine restarted(config, nullptr, probe, nullptr);
    auto cached = restarted.validateAndScan("web-01", scan::ScanCategory::Basic);
    stats.check(cached.scan && cached.scan->from_cache && probe->connects == connects,
                "restart served from durable cache");
}

// =================== Main ===================
int main() {
    std::cout << "========================================\n";
    std::cout << "  Engine Unit Tests\n";
    std::cout << "========================================\n";

    LoggingConfig quiet;
    quiet.level = "off";
    initLogging(quiet);

    TestStats stats;

    try {
        testConfig(stats);
        testResolution(stats);
        testValidateAndScan(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return stats.finish();
}
