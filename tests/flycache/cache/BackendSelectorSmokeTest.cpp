#include <cassert>
#include <iostream>
#include <memory>
#include "flycache/cache/manager/BackendSelector.hpp"
#include "flycache/cache/backend/MemoryBackend.hpp"
#include "flycache/cache/backend/NoOpBackend.hpp"
#include "flycache/cache/backend/RemoteBackend.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include "flycache/support/FakeRespServer.hpp"

using namespace flycache::cache;
using namespace std::chrono;

void testDisabled() {
    auto config = CacheConfig::defaults();
    config.enabled = false;
    config.type = BackendType::Remote;
    config.remoteUrl = "redis://127.0.0.1:1";
    auto backend = BackendSelector::initialize(config);
    assert(std::dynamic_pointer_cast<NoOpBackend>(backend));
    assert(!backend->isAvailable());
    std::cout << "[OK] Selector: disabled -> noop\n";
}

void testMemory() {
    auto config = CacheConfig::defaults();
    config.enabled = true;
    auto backend = BackendSelector::initialize(config);
    assert(backend->name() == "memory");
    assert(backend->isAvailable());

    // Тип remote без строки подключения
    config.type = BackendType::Remote;
    backend = BackendSelector::initialize(config);
    assert(backend->name() == "memory");
    std::cout << "[OK] Selector: memory\n";
}

void testRemote() {
    flycache::test::FakeRespServer server;
    auto config = CacheConfig::defaults();
    config.enabled = true;
    config.type = BackendType::Remote;
    config.remoteUrl = server.url();
    auto backend = BackendSelector::initialize(config);
    assert(std::dynamic_pointer_cast<RemoteBackend>(backend));
    assert(backend->isAvailable());
    backend->set("k", toBytes("v"), Ttl(0));
    assert(server.rawValue("app:k"));
    backend->close();
    std::cout << "[OK] Selector: remote\n";
}

void testFallback() {
    auto config = CacheConfig::defaults();
    config.enabled = true;
    config.type = BackendType::Remote;
    config.remoteUrl = "redis://127.0.0.1:1";
    config.pingTimeout = milliseconds(500);
    config.connectTimeout = milliseconds(500);

    auto start = steady_clock::now();
    auto backend = BackendSelector::initialize(config);
    assert(steady_clock::now() - start < seconds(2));
    assert(backend->name() == "memory");
    assert(backend->isAvailable());
    std::cout << "[OK] Selector: unreachable remote -> memory\n";
}

void testConfigurationErrors() {
    auto config = CacheConfig::defaults();
    config.enabled = true;
    config.type = BackendType::Remote;
    config.remoteUrl = "http://not-a-cache";
    bool thrown = false;
    try {
        BackendSelector::initialize(config);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);

    config.remoteUrl = "redis://localhost";
    config.poolSize = 0;
    thrown = false;
    try {
        BackendSelector::initialize(config);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Selector: configuration errors\n";
}

int main() {
    testDisabled();
    testMemory();
    testRemote();
    testFallback();
    testConfigurationErrors();
    std::cout << "All BackendSelector tests passed!\n";
    return 0;
}
