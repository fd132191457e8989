#include "../src/Common/logging.hpp"
#include "../src/Registry/host_matcher.h"
#include "../src/Registry/host_registry.hpp"
#include "test_support.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace registry;
using test::TestStats;
using hostguard::SourceKind;

namespace {

// Source returning a fixed list and counting parses
class ListSource : public inventory::InventorySource {
public:
    ListSource(SourceKind kind, std::vector<inventory::RawHostRecord> records, std::shared_ptr<std::atomic<int>> parses)
        : kind_(kind), records_(std::move(records)), parses_(std::move(parses)) {}

    SourceKind kind() const override { return kind_; }
    std::string name() const override { return "list:" + std::string(hostguard::sourceKindName(kind_)); }
    std::vector<inventory::RawHostRecord> parse() override {
        if (parses_) (*parses_)++;
        return records_;
    }

private:
    SourceKind kind_;
    std::vector<inventory::RawHostRecord> records_;
    std::shared_ptr<std::atomic<int>> parses_;
};

class ThrowingSource : public inventory::InventorySource {
public:
    SourceKind kind() const override { return SourceKind::Cloud; }
    std::string name() const override { return "cloud:broken"; }
    std::vector<inventory::RawHostRecord> parse() override {
        throw std::runtime_error("credentials expired");
    }
};

inventory::RawHostRecord record(const std::string& name,
                                std::optional<std::string> ip = std::nullopt,
                                std::vector<std::string> aliases = {},
                                std::vector<std::string> groups = {},
                                std::optional<std::string> env = std::nullopt) {
    inventory::RawHostRecord r;
    r.name = name;
    r.address = std::move(ip);
    r.aliases = std::move(aliases);
    r.groups = std::move(groups);
    r.environment = std::move(env);
    return r;
}

RegistryConfig emptyConfig() {
    RegistryConfig config;   // no file sources
    return config;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

} // namespace

// =================== A. Similarity and sanitizing ===================
void testMatcher(TestStats& stats) {
    std::cout << "\n[A. Matcher Tests]\n";

    stats.check(similarityRatio("web-0", "web-01") > 0.9, "web-0 vs web-01 scores 10/11");
    stats.check(std::abs(similarityRatio("abcd", "bcde") - 0.75) < 1e-9, "Ratcliff/Obershelp ratio 2*3/8");
    stats.check(similarityRatio("", "") == 1.0 && similarityRatio("abc", "") == 0.0, "empty inputs");
    stats.check(similarityRatio("xyz", "web-01") == 0.0, "disjoint strings score 0");

    auto s1 = sanitizeHostname("MYSQL8CLUSTER4-1</parameter name=\"path\">/etc/mysql/conf.d/*");
    stats.check(s1.hostname == "MYSQL8CLUSTER4-1" && s1.modified, "markup and path suffix stripped");
    stats.check(sanitizeHostname("SERVER_123").hostname == "SERVER123", "invalid characters dropped");
    stats.check(sanitizeHostname("web-01:22").hostname == "web-01", "port suffix dropped");
    stats.check(sanitizeHostname("-web-01.").hostname == "web-01", "edge dots and hyphens trimmed");
    auto v6 = sanitizeHostname("fe80::1");
    stats.check(v6.hostname == "fe80::1" && !v6.modified, "IP literals untouched");
    stats.check(!sanitizeHostname("db-01.example.com").modified, "clean name reported unmodified");
}

// =================== B. Validation ===================
void testValidate(TestStats& stats) {
    std::cout << "\n[B. Validation Tests]\n";

    HostRegistry reg(emptyConfig());
    reg.addSource(std::make_unique<ListSource>(SourceKind::SshConfig, std::vector<inventory::RawHostRecord>{
        record("web-01", "10.0.0.1", {"www"}),
        record("db-01", "10.0.0.2", {}, {"databases"}, "production"),
        record("Cache-Primary", std::nullopt, {"redis"}),
    }, nullptr));

    auto www = reg.validate("WWW");
    auto www_host = www.host;
    stats.check(www.valid && www_host && www_host->hostname == "web-01", "alias WWW resolves to web-01 (lazy load)");

    bool all_case_insensitive = true;
    for (const auto& name : reg.hostnames()) {
        auto lower = reg.validate(name);
        auto up = reg.validate(upper(name));
        if (!lower.valid || !up.valid || lower.host != up.host) {
            all_case_insensitive = false;
        }
    }
    stats.check(all_case_insensitive, "every host validates as given and uppercased, same record");

    auto near = reg.validate("web-0");
    stats.check(!near.valid && !near.suggestions.empty(), "web-0 invalid with suggestions");
    stats.check(!near.suggestions.empty() && near.suggestions[0].hostname == "web-01" && near.suggestions[0].score > 0.4,
                "web-01 suggested first with score > 0.4");
    bool sorted = std::is_sorted(near.suggestions.begin(), near.suggestions.end(),
                                 [](const Suggestion& a, const Suggestion& b) { return a.score > b.score; });
    stats.check(sorted, "suggestions best first");
    stats.check(near.suggestionText().find("Did you mean") != std::string::npos, "suggestion text lists candidates");

    auto far = reg.validate("zzzzzzzzqqq");
    stats.check(!far.valid && far.suggestions.empty(), "dissimilar query: invalid, no suggestions");
    stats.check(far.suggestionText().find("No similar hosts") != std::string::npos, "no-suggestion text");

    auto redis = reg.validate("rediss");
    stats.check(!redis.valid && !redis.suggestions.empty() && redis.suggestions[0].hostname == "Cache-Primary",
                "alias similarity suggests the canonical hostname");

    auto empty = reg.validate("");
    stats.check(!empty.valid && empty.error_message == "Empty hostname provided", "empty query invalid");

    for (const char* local : {"local", "localhost", "127.0.0.1", "::1", "LOCALHOST"}) {
        auto r = reg.validate(local);
        if (!stats.check(r.valid && r.host != nullptr, std::string("local literal ") + local + " valid")) break;
    }

    stats.check(reg.get("db-01") != nullptr && reg.get("nope") == nullptr, "get returns null when invalid");
    stats.check(reg.find("WEB-01") != nullptr && reg.find("web-0") == nullptr, "find: exact or alias only");

    bool threw = false;
    try {
        reg.require("web-0");
    } catch (const std::out_of_range& e) {
        threw = std::string(e.what()).find("web-01") != std::string::npos;
    }
    stats.check(threw, "require throws with suggestions");

    // a merge after validation publishes a new record; the earlier result stays usable
    auto held = reg.validate("WWW");
    reg.registerManualHost("web-01", "10.0.0.1", "staging");
    stats.check(held.host && held.host->hostname == "web-01" && !held.host->environment,
                "validated record survives a later merge unchanged");
    auto current = reg.find(held.key);
    stats.check(held.key == "web-01" && current && current != held.host &&
                current->environment == std::optional<std::string>("staging"),
                "key re-reads the merged record");
    stats.check(reg.get("www") != nullptr && reg.require("WWW") == current, "get and require see the merged record");
}

// =================== C. Suggestion cap ===================
void testSuggestionCap(TestStats& stats) {
    std::cout << "\n[C. Suggestion Cap Tests]\n";

    std::vector<inventory::RawHostRecord> many;
    for (int i = 1; i <= 9; ++i) {
        many.push_back(record("node-0" + std::to_string(i)));
    }

    HostRegistry reg(emptyConfig());
    reg.addSource(std::make_unique<ListSource>(SourceKind::Ansible, many, nullptr));
    reg.loadAllSources();

    auto r = reg.validate("node-0");
    stats.check(!r.valid && r.suggestions.size() == kMaxSuggestions, "at most 5 suggestions");
    bool above = std::all_of(r.suggestions.begin(), r.suggestions.end(),
                             [](const Suggestion& s) { return s.score > kSuggestionThreshold; });
    stats.check(above, "every suggestion above threshold");
}

// =================== D. Loading and merge ===================
void testLoading(TestStats& stats) {
    std::cout << "\n[D. Loading Tests]\n";

    auto parses = std::make_shared<std::atomic<int>>(0);
    RegistryConfig config = emptyConfig();

    test::TempDir dir;
    config.etc_hosts_path = dir.write("hosts", "10.0.0.1 web-01 web\n10.0.0.9 mon-01\n");
    config.ansible_paths = {dir.write("inventory.ini", "[prod_web]\nweb-01 ansible_user=deploy\n")};
    config.cloud_paths = {dir.file("missing.json")};

    HostRegistry reg(config);
    reg.addSource(std::make_unique<ListSource>(SourceKind::SshConfig, std::vector<inventory::RawHostRecord>{
        record("WEB-01", "192.168.1.1", {"frontend"}),
    }, parses));
    reg.addSource(std::make_unique<ThrowingSource>());

    size_t n = reg.loadAllSources();
    stats.check(n == 2, "records for the same host merged into one");

    auto web = reg.get("web-01");
    stats.check(web && web->ip_address == "10.0.0.1", "first known IP kept");
    stats.check(web && web->aliases.count("web") && web->aliases.count("frontend"), "aliases unioned");
    stats.check(web && web->groups.count("prod_web") && web->metadata.at("ansible_user") == "deploy",
                "groups and metadata merged");
    stats.check(web && web->environment == "production", "environment from ansible group");

    auto reports = reg.lastLoadReport();
    auto failed = std::find_if(reports.begin(), reports.end(),
                               [](const SourceLoadReport& r) { return r.source == "cloud:broken"; });
    stats.check(reports.size() == 5, "one report per source");
    stats.check(failed != reports.end() && failed->error_kind == hostguard::ErrorKind::SourceUnavailable &&
                failed->error == "credentials expired", "throwing source reported and skipped");

    reg.loadAllSources();
    stats.check(*parses == 1, "reload within TTL reads nothing");
    reg.loadAllSources(true);
    stats.check(*parses == 2 && reg.size() == 2, "forced reload merges idempotently");

    // copy-on-write: an earlier handle is not changed by later merges
    reg.registerManualHost("web-01", "10.9.9.9", "staging");
    auto after = reg.get("web-01");
    stats.check(web && !web->last_seen && after && after->last_seen, "held record unchanged, new record merged");
    stats.check(after && after->ip_address == "10.0.0.1" && after->environment == "production",
                "manual registration does not replace known IP or environment");

    auto stats_now = reg.getStats();
    stats.check(stats_now.total_hosts == 2 && stats_now.by_environment["unknown"] == 1, "stats by environment");
    stats.check(stats_now.by_source["etc_hosts"] == 2, "source tag is the first source that yielded the host");
    stats.check(std::find(stats_now.loaded_sources.begin(), stats_now.loaded_sources.end(), "cloud:broken") ==
                    stats_now.loaded_sources.end(), "failed source not listed as loaded");
    stats.check(stats_now.last_refresh.has_value() && stats_now.toJson().contains("last_refresh"), "last refresh recorded");

    reg.reset();
    stats.check(reg.size() == 0 && reg.getStats().total_aliases == 0, "reset drops hosts and aliases");
    stats.check(web != nullptr && web->hostname == "web-01", "handles outlive reset");
}

// =================== E. Merge idempotence ===================
void testMerge(TestStats& stats) {
    std::cout << "\n[E. Merge Tests]\n";

    hostguard::Host a;
    a.hostname = "app-01";
    a.aliases = {"app"};
    a.groups = {"web"};
    a.metadata = {{"owner", "team-a"}};

    hostguard::Host b;
    b.hostname = "APP-01";
    b.ip_address = "10.5.0.1";
    b.aliases = {"api"};
    b.groups = {"backend"};
    b.metadata = {{"owner", "team-b"}, {"tier", "1"}};

    hostguard::Host once = a;
    hostguard::mergeHost(once, b);
    hostguard::Host twice = once;
    hostguard::mergeHost(twice, b);
    stats.check(once == twice, "merge(merge(A,B),B) == merge(A,B)");
    stats.check(once.aliases.size() == 2 && once.groups.size() == 2, "sets unioned");
    stats.check(once.metadata.at("owner") == "team-b", "incoming metadata wins");
    stats.check(once.ip_address == "10.5.0.1", "IP filled when unset");

    hostguard::Host ab = a;
    hostguard::mergeHost(ab, b);
    hostguard::Host ba = b;
    hostguard::mergeHost(ba, a);
    stats.check(ab.aliases == ba.aliases && ab.groups == ba.groups, "set fields commutative");
}

// =================== F. Filter and manual hosts ===================
void testFilter(TestStats& stats) {
    std::cout << "\n[F. Filter Tests]\n";

    HostRegistry reg(emptyConfig());
    reg.addSource(std::make_unique<ListSource>(SourceKind::Ansible, std::vector<inventory::RawHostRecord>{
        record("web-01", std::nullopt, {}, {"web"}, "production"),
        record("web-02", std::nullopt, {}, {"web"}, "staging"),
        record("db-01", std::nullopt, {}, {"db"}, "production"),
    }, nullptr));
    reg.loadAllSources();
    reg.registerManualHost("Jump-Box", "10.0.0.99");

    HostFilter prod;
    prod.environment = "production";
    stats.check(reg.filter(prod).size() == 2, "filter by environment");

    HostFilter web_prod;
    web_prod.environment = "production";
    web_prod.group = "web";
    auto wp = reg.filter(web_prod);
    stats.check(wp.size() == 1 && wp[0]->hostname == "web-01", "predicates compose");

    HostFilter manual;
    manual.source = SourceKind::Manual;
    auto m = reg.filter(manual);
    stats.check(m.size() == 1 && m[0]->hostname == "Jump-Box" && m[0]->ip_address == "10.0.0.99",
                "manual host registered with its IP");

    HostFilter pattern;
    pattern.pattern = "^WEB-\\d+$";
    stats.check(reg.filter(pattern).size() == 2, "pattern is a case-insensitive regex");

    HostFilter bad;
    bad.pattern = "web-(";
    bool threw = false;
    try {
        reg.filter(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    stats.check(threw, "malformed pattern rejected");

    stats.check(reg.validate("jump-box").valid, "manual host validates");
}

// =================== G. Concurrency ===================
void testConcurrency(TestStats& stats) {
    std::cout << "\n[G. Concurrency Tests]\n";

    std::vector<inventory::RawHostRecord> hosts;
    for (int i = 0; i < 200; ++i) {
        hosts.push_back(record("srv-" + std::to_string(i), "10.1.0." + std::to_string(i % 250)));
    }

    HostRegistry reg(emptyConfig());
    reg.addSource(std::make_unique<ListSource>(SourceKind::Cloud, hosts, nullptr));
    reg.loadAllSources();

    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&reg, &errors, t] {
            for (int i = 0; i < 300; ++i) {
                if (t == 0 && i % 50 == 0) {
                    reg.loadAllSources(true);
                } else if (t == 1) {
                    reg.registerManualHost("srv-" + std::to_string(i % 200));
                } else if (!reg.validate("SRV-" + std::to_string(i % 200)).valid) {
                    errors++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    stats.check(errors == 0, "validation stays correct during concurrent merges");
    stats.check(reg.size() == 200, "no duplicate keys created");
}

// =================== Main ===================
int main() {
    std::cout << "========================================\n";
    std::cout << "  Host Registry Unit Tests\n";
    std::cout << "========================================\n";

    hostguard::LoggingConfig quiet;
    quiet.level = "off";
    hostguard::initLogging(quiet);

    TestStats stats;

    try {
        testMatcher(stats);
        testValidate(stats);
        testSuggestionCap(stats);
        testLoading(stats);
        testMerge(stats);
        testFilter(stats);
        testConcurrency(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return stats.finish();
}
