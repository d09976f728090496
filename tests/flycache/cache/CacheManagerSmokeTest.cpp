#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include "flycache/cache/manager/CacheManager.hpp"
#include "flycache/cache/manager/CacheKeys.hpp"
#include "flycache/support/FakeRespServer.hpp"

using namespace flycache::cache;
using namespace std::chrono;

CacheConfig memoryConfig() {
    auto config = CacheConfig::defaults();
    config.enabled = true;
    return config;
}

void testFailOpenHelpers() {
    auto manager = CacheManager::create(memoryConfig());
    assert(manager->backendName() == "memory");
    assert(manager->isAvailable());

    assert(manager->set("k", toBytes("v"), seconds(10)));
    assert(manager->get("k") && toString(*manager->get("k")) == "v");
    assert(manager->exists("k"));
    assert(!manager->setIfNotExists("k", toBytes("other"), seconds(10)));
    assert(toString(*manager->get("k")) == "v");
    assert(manager->setIfNotExists("fresh", toBytes("1"), seconds(10)));
    assert(manager->remove("k"));
    assert(!manager->get("k"));
    assert(manager->clear("*"));
    assert(!manager->exists("fresh"));

    std::map<std::string, bool> flags{{"beta", true}, {"dark", false}};
    assert(manager->setJson(keys::FEATURE_FLAGS, flags, manager->ttlFor(TtlDomain::Default)));
    auto loaded = manager->getJson<std::map<std::string, bool>>(keys::FEATURE_FLAGS);
    assert(loaded && loaded->at("beta") && !loaded->at("dark"));
    assert(!manager->getJson<int>("absent"));

    manager->set("garbage", toBytes("{oops"), seconds(10));
    bool thrown = false;
    try {
        manager->getJson<int>("garbage");
    } catch (const SerializationError&) {
        thrown = true;
    }
    assert(thrown);

    assert(manager->ttlFor(TtlDomain::Session) == minutes(15));
    auto metrics = manager->backend()->snapshot();
    assert(metrics.hits > 0 && metrics.misses > 0);
    manager->close();
    std::cout << "[OK] CacheManager fail-open helpers\n";
}

void testHealth() {
    auto manager = CacheManager::create(memoryConfig());
    auto healthy = manager->checkHealth();
    assert(healthy.name == "cache" && healthy.status == "healthy");
    assert(healthy.toJson()["status"] == "healthy");

    auto disabledConfig = CacheConfig::defaults();
    auto disabled = CacheManager::create(disabledConfig);
    assert(disabled->backendName() == "noop");
    auto degraded = disabled->checkHealth();
    assert(degraded.status == "degraded");
    assert(!disabled->get("k"));
    assert(disabled->set("k", toBytes("v"), seconds(1)));
    assert(!disabled->exists("k"));

    manager->close();
    manager->close();
    assert(manager->checkHealth().status == "unhealthy");
    std::cout << "[OK] CacheManager health\n";
}

void testRemoteFailOpen() {
    auto server = std::make_unique<flycache::test::FakeRespServer>();
    auto config = memoryConfig();
    config.type = BackendType::Remote;
    config.remoteUrl = server->url();
    config.ioTimeout = milliseconds(300);
    config.connectTimeout = milliseconds(300);
    auto manager = CacheManager::create(config);
    assert(manager->backendName() == "remote");
    assert(manager->set(keys::user(uint64_t(1)), toBytes("u"), seconds(10)));
    assert(server->rawValue("app:user:1"));
    assert(manager->checkHealth().status == "healthy");

    server->stop();
    server.reset();
    assert(!manager->get(keys::user(uint64_t(1))));
    assert(!manager->set("k", toBytes("v"), seconds(1)));
    assert(!manager->exists("k"));
    assert(!manager->isAvailable());
    assert(manager->checkHealth().status == "degraded");
    manager->close();
    std::cout << "[OK] CacheManager remote fail-open\n";
}

void testAsideAndBus() {
    auto manager = CacheManager::create(memoryConfig());
    int loads = 0;
    auto v = manager->aside().getOrLoadSync(keys::session("abc"), manager->ttlFor(TtlDomain::Session), [&] {
        ++loads;
        return toBytes("session-data");
    });
    assert(toString(v) == "session-data");
    assert(manager->exists(keys::session("abc")));

    manager->set(keys::user("7"), toBytes("u"), seconds(10));
    manager->invalidation().publish(InvalidationEvent::userUpdated("7"));
    assert(!manager->exists(keys::user("7")));

    assert(keys::orgBySlug("acme") == "org:slug:acme");
    assert(keys::orgById(uint64_t(3)) == "org:id:3");
    assert(keys::membership(uint64_t(3), uint64_t(9)) == "membership:3:9");
    assert(keys::blacklist("abcd") == "blacklist:abcd");

    manager->warmer().registerTask(WarmingTask{"flags", keys::FEATURE_FLAGS,
        [](const CancellationToken&) { return toBytes("[]"); }, minutes(5)});
    auto results = manager->warmer().warm();
    assert(results.size() == 1 && results[0].success);
    assert(manager->exists(keys::FEATURE_FLAGS));
    std::cout << "[OK] CacheManager layers\n";
}

int main() {
    testFailOpenHelpers();
    testHealth();
    testRemoteFailOpen();
    testAsideAndBus();
    std::cout << "All CacheManager tests passed!\n";
    return 0;
}
