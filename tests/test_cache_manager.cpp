#include "../src/Cache/cache_manager.hpp"
#include "../src/Cache/durable_backing.hpp"
#include "../src/Common/logging.hpp"
#include "test_support.h"

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace cache;
using test::TestStats;
using std::chrono::seconds;

namespace {

// Backing whose every call fails
class BrokenBacking : public DurableCacheBacking {
public:
    std::optional<DurableRecord> get(const std::string&, CacheCategory) override {
        throw std::runtime_error("disk unavailable");
    }
    void set(const std::string&, CacheCategory, const nlohmann::json&, seconds) override {
        throw std::runtime_error("disk full");
    }
    void clearHost(const std::string&) override {
        throw std::runtime_error("disk unavailable");
    }
};

// In-memory backing with a controllable record age
class FakeBacking : public DurableCacheBacking {
public:
    std::optional<DurableRecord> get(const std::string& hostname, CacheCategory) override {
        gets++;
        if (hostname != stored_host) return std::nullopt;
        return record;
    }
    void set(const std::string& hostname, CacheCategory, const nlohmann::json& data, seconds) override {
        stored_host = hostname;
        record = DurableRecord{data, std::chrono::system_clock::now()};
    }
    void clearHost(const std::string&) override { stored_host.clear(); }

    std::string stored_host;
    std::optional<DurableRecord> record;
    int gets = 0;
};

} // namespace

// =================== A. Category TTLs ===================
void testCategoryTtl(TestStats& stats) {
    std::cout << "\n[A. Category TTL Tests]\n";

    test::ManualClock clock;
    CacheManager manager({}, nullptr, clock.source());

    stats.check(manager.ttlFor(CacheCategory::HostMetrics) == seconds(60), "host_metrics default TTL 60s");
    stats.check(manager.ttlFor(CacheCategory::LocalContext) == seconds(43200), "local_context default TTL 12h");
    stats.check(manager.ttlFor(CacheCategory::InventorySearch) == seconds(120), "inventory_search default TTL 120s");

    manager.set("cpu", 42, CacheCategory::HostMetrics);
    clock.advance(seconds(30));
    auto cpu = manager.get("cpu", CacheCategory::HostMetrics);
    stats.check(cpu && *cpu == 42, "host_metrics hit at t+30s");

    clock.advance(seconds(60));
    stats.check(manager.cleanupExpired() == 1, "sweep at t+90s purges the entry");
    stats.check(!manager.get("cpu", CacheCategory::HostMetrics), "host_metrics miss at t+90s");

    manager.set("long", 1, CacheCategory::HostMetrics, seconds(600));
    clock.advance(seconds(300));
    stats.check(manager.get("long").has_value(), "explicit TTL overrides the category default");

    manager.set("neg", 1, CacheCategory::Default, seconds(-5));
    stats.check(!manager.get("neg"), "negative per-call TTL stored as already expired");

    CacheManagerConfig config;
    config.ttl_overrides[CacheCategory::HostBasic] = seconds(10);
    CacheManager tuned(config, nullptr, clock.source());
    stats.check(tuned.ttlFor(CacheCategory::HostBasic) == seconds(10), "configured override replaces table TTL");
    stats.check(tuned.ttlFor(CacheCategory::HostSystem) == seconds(1800), "other categories keep table TTL");

    bool threw = false;
    try {
        CacheManagerConfig bad;
        bad.ttl_overrides[CacheCategory::HostBasic] = seconds(-1);
        CacheManager rejected(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    stats.check(threw, "negative configured TTL rejected at construction");
}

// =================== B. getOrSet ===================
void testGetOrSet(TestStats& stats) {
    std::cout << "\n[B. getOrSet Tests]\n";

    CacheManager manager;
    int calls = 0;
    auto factory = [&calls] { calls++; return nlohmann::json{{"os", "debian"}}; };

    auto a = manager.getOrSet("facts", CacheCategory::HostSystem, factory);
    auto b = manager.getOrSet("facts", CacheCategory::HostSystem, factory);
    stats.check(calls == 1 && a == b && a["os"] == "debian", "factory invoked once, value cached");

    int null_calls = 0;
    auto null_factory = [&null_calls] { null_calls++; return nlohmann::json(); };
    manager.getOrSet("nothing", CacheCategory::Default, null_factory);
    manager.getOrSet("nothing", CacheCategory::Default, null_factory);
    stats.check(null_calls == 2, "null result is not cached");

    auto failed = manager.getOrSet("boom", CacheCategory::Default,
                                   []() -> nlohmann::json { throw std::runtime_error("factory failed"); });
    stats.check(failed.is_null() && !manager.get("boom"), "throwing factory yields null without caching");
}

// =================== C. Host helpers and durable backing ===================
void testHostData(TestStats& stats) {
    std::cout << "\n[C. Host Data Tests]\n";

    auto backing = std::make_shared<FakeBacking>();
    CacheManager manager({}, backing);

    manager.cacheHostData("Web-01", {{"kernel", "6.1"}}, CacheCategory::HostSystem);
    auto hit = manager.getHostData("web-01", CacheCategory::HostSystem);
    stats.check(hit && (*hit)["kernel"] == "6.1", "host data keyed case-insensitively");
    stats.check(backing->stored_host == "Web-01", "host data written through to backing");
    stats.check(CacheManager::hostKey("Web-01", CacheCategory::HostSystem) == "host:web-01:host_system",
                "host key format");

    manager.invalidateHost("WEB-01");
    stats.check(backing->stored_host.empty(), "invalidateHost clears the backing");

    // a fresh manager reads a young record through from the backing
    backing->set("db-01", CacheCategory::HostSystem, {{"os", "rhel"}}, seconds(1800));
    CacheManager cold({}, backing);
    auto through = cold.getHostData("db-01", CacheCategory::HostSystem);
    stats.check(through && (*through)["os"] == "rhel", "durable record younger than TTL is served");

    backing->record->cached_at -= std::chrono::hours(2);
    CacheManager stale({}, backing);
    int before = backing->gets;
    stats.check(!stale.getHostData("db-01", CacheCategory::HostSystem), "durable record older than TTL is ignored");
    stale.getHostData("db-01", CacheCategory::HostSystem);
    stats.check(backing->gets == before + 1, "known miss is not re-read from the backing");

    CacheManagerConfig lenient;
    lenient.stale_multiplier = 5.0;
    CacheManager tolerant(lenient, backing);
    stats.check(tolerant.getHostData("db-01", CacheCategory::HostSystem).has_value(),
                "stale_multiplier widens the accepted age");

    manager.cacheInventorySearch("WEB", nlohmann::json::array({"web-01"}));
    stats.check(manager.getInventorySearch("web").has_value(), "inventory search keyed lowercase");

    manager.cacheLocalContext({{"hostname", "ops-box"}});
    stats.check(manager.getLocalContext().has_value(), "local context round trip");
}

// =================== D. Degraded backing ===================
void testDegradedBacking(TestStats& stats) {
    std::cout << "\n[D. Degraded Backing Tests]\n";

    CacheManager manager({}, std::make_shared<BrokenBacking>());

    bool threw = false;
    try {
        manager.cacheHostData("web-01", {{"up", true}}, CacheCategory::HostBasic);
        manager.invalidateHost("db-01");
        manager.getHostData("db-01", CacheCategory::HostBasic);
    } catch (const std::exception&) {
        threw = true;
    }
    stats.check(!threw, "backing failures never reach the caller");
    stats.check(manager.getHostData("web-01", CacheCategory::HostBasic).has_value(),
                "memory cache keeps working");
    stats.check(manager.getStats().backing_failures == 3, "each backing failure counted");
}

// =================== E. JSON file backing ===================
void testJsonFileBacking(TestStats& stats) {
    std::cout << "\n[E. JSON File Backing Tests]\n";

    test::TempDir dir;
    std::string path = dir.file("cache.json");

    {
        CacheManager writer({}, std::make_shared<JsonFileBacking>(path));
        writer.cacheHostData("app-01", {{"services", {"nginx"}}}, CacheCategory::HostServices);
    }
    CacheManager reader({}, std::make_shared<JsonFileBacking>(path));
    auto data = reader.getHostData("APP-01", CacheCategory::HostServices);
    stats.check(data && (*data)["services"][0] == "nginx", "record survives a restart");

    std::string corrupt = dir.write("corrupt.json", "{not json");
    JsonFileBacking broken(corrupt);
    bool threw = false;
    try {
        broken.get("x", CacheCategory::HostBasic);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    stats.check(threw, "corrupt file reported by the backing");

    CacheManager degraded({}, std::make_shared<JsonFileBacking>(corrupt));
    stats.check(!degraded.getHostData("x", CacheCategory::HostBasic) && degraded.getStats().backing_failures == 1,
                "corrupt file degrades the manager to memory only");
    for (int i = 0; i < 5; ++i) {
        degraded.getHostData("x", CacheCategory::HostBasic);
    }
    stats.check(degraded.getStats().backing_failures == 1, "failed read remembered as a miss");

    // the corrupt document is not parsed again, and never overwritten
    dir.write("corrupt.json", R"({"x": {"host_basic": {"data": 1, "cached_at": 0}}})");
    threw = false;
    try {
        broken.get("x", CacheCategory::HostBasic);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    stats.check(threw, "load failure latched");
    threw = false;
    try {
        broken.set("y", CacheCategory::HostBasic, 2, seconds(60));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    stats.check(threw && test::readText(corrupt).find("\"x\"") != std::string::npos, "latched backing refuses writes");
}

// =================== F. Background sweep ===================
void testSweep(TestStats& stats) {
    std::cout << "\n[F. Background Sweep Tests]\n";

    test::ManualClock clock;
    CacheManagerConfig config;
    config.cleanup_interval = seconds(1);
    CacheManager manager(config, nullptr, clock.source());

    manager.set("a", 1, CacheCategory::Default, seconds(5));
    manager.set("b", 2, CacheCategory::Default, seconds(500));
    clock.advance(seconds(10));

    manager.startCleanup();
    manager.startCleanup();
    stats.check(manager.cleanupRunning(), "sweep running after start");

    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    auto st = manager.getStats();
    stats.check(st.cleanups >= 1, "sweep ran on its interval");
    stats.check(st.store.entries == 1 && !manager.entryInfo("a"), "expired entry purged without a read");

    manager.stopCleanup();
    stats.check(!manager.cleanupRunning(), "sweep stopped and joined");
    manager.stopCleanup();

    manager.startCleanup();
    stats.check(manager.cleanupRunning(), "sweep can be restarted");
    // destructor stops it
}

// =================== G. Stats ===================
void testStats(TestStats& stats) {
    std::cout << "\n[G. Stats Tests]\n";

    test::ManualClock clock;
    CacheManager manager({}, nullptr, clock.source());

    manager.set("h1", 1, CacheCategory::HostBasic);
    manager.set("h2", 2, CacheCategory::HostBasic);
    manager.set("m1", 3, CacheCategory::HostMetrics);
    manager.get("h1");
    manager.get("missing");

    auto st = manager.getStats();
    stats.check(st.store.by_category[static_cast<size_t>(CacheCategory::HostBasic)] == 2, "per-category count");
    stats.check(st.hit_rate == 0.5, "hit rate 1/2");

    auto j = st.toJson();
    stats.check(j["entries_by_type"]["host_basic"] == 2 && j["stats"]["hits"] == 1,
                "stats rendered as JSON");
    stats.check(j["average_ttl_remaining"] == 220.0, "average remaining TTL (300+300+60)/3");

    manager.clear(CacheCategory::HostBasic);
    stats.check(manager.getStats().store.entries == 1, "clear by category");
}

// =================== Main ===================
int main() {
    std::cout << "========================================\n";
    std::cout << "  Cache Manager Unit Tests\n";
    std::cout << "========================================\n";

    hostguard::LoggingConfig quiet;
    quiet.level = "off";
    hostguard::initLogging(quiet);

    TestStats stats;

    try {
        testCategoryTtl(stats);
        testGetOrSet(stats);
        testHostData(stats);
        testDegradedBacking(stats);
        testJsonFileBacking(stats);
        testSweep(stats);
        testStats(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return stats.finish();
}
