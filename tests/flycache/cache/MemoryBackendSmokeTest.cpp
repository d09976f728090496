#include <cassert>
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "flycache/cache/backend/MemoryBackend.hpp"

using namespace flycache::cache;
using namespace std::chrono;

void smokeTestMemoryBackend() {
    MemoryBackend cache("app", 100, minutes(1));
    assert(cache.isAvailable());
    assert(cache.name() == "memory");

    assert(!cache.get("missing"));
    cache.set("k", toBytes("v"), Ttl(0));
    auto v = cache.get("k");
    assert(v && toString(*v) == "v");
    assert(cache.exists("k"));

    cache.set("k", toBytes("v2"), Ttl(0));
    assert(toString(*cache.get("k")) == "v2");
    assert(cache.size() == 1);

    cache.remove("k");
    assert(!cache.get("k"));
    assert(!cache.exists("k"));
    cache.remove("k");

    cache.ping();
    std::cout << "[OK] MemoryBackend smoke test\n";
}

void testTtl() {
    MemoryBackend cache("", 100, minutes(1));
    cache.set("short", toBytes("x"), milliseconds(50));
    cache.set("forever", toBytes("y"), Ttl(0));
    assert(cache.get("short"));
    std::this_thread::sleep_for(milliseconds(80));
    assert(!cache.get("short"));
    assert(!cache.exists("short"));
    assert(cache.get("forever"));
    assert(cache.removeExpired() == 1);
    assert(cache.size() == 1);
    std::cout << "[OK] MemoryBackend TTL\n";
}

void testBackgroundCleanup() {
    MemoryBackend cache("", 100, milliseconds(20));
    for (int i = 0; i < 10; ++i) {
        cache.set("e" + std::to_string(i), toBytes("x"), milliseconds(10));
    }
    assert(cache.size() == 10);
    auto deadline = steady_clock::now() + seconds(2);
    while (cache.size() > 0 && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    assert(cache.size() == 0);

    auto start = steady_clock::now();
    cache.close();
    assert(steady_clock::now() - start < seconds(1));
    assert(!cache.isAvailable());
    cache.close();
    std::cout << "[OK] MemoryBackend background cleanup\n";
}

void testClearPattern() {
    MemoryBackend cache("app", 100, minutes(1));
    cache.set("user:1", toBytes("a"), Ttl(0));
    cache.set("user:2", toBytes("b"), Ttl(0));
    cache.set("users:list", toBytes("c"), Ttl(0));
    cache.set("org:1", toBytes("d"), Ttl(0));

    cache.clear("user:*");
    assert(!cache.get("user:1"));
    assert(!cache.get("user:2"));
    assert(cache.get("users:list"));
    assert(cache.get("org:1"));

    cache.clear("org:1");
    assert(!cache.get("org:1"));
    assert(cache.get("users:list"));

    cache.clear("*");
    assert(cache.size() == 0);
    std::cout << "[OK] MemoryBackend clear by pattern\n";
}

void testEviction() {
    MemoryBackend cache("", 3, minutes(1));
    cache.set("a", toBytes("1"), Ttl(0));
    cache.set("b", toBytes("2"), Ttl(0));
    cache.set("c", toBytes("3"), Ttl(0));
    cache.set("d", toBytes("4"), Ttl(0));
    assert(cache.size() == 3);
    assert(cache.get("d"));
    assert(cache.evictionCount() == 1);

    // Перезапись существующего ключа не вытесняет
    cache.set("d", toBytes("5"), Ttl(0));
    assert(cache.size() == 3);
    assert(cache.evictionCount() == 1);

    // Сначала вытесняются просроченные записи
    MemoryBackend expiring("", 2, minutes(1));
    expiring.set("old", toBytes("x"), milliseconds(10));
    expiring.set("keep", toBytes("y"), Ttl(0));
    std::this_thread::sleep_for(milliseconds(30));
    expiring.set("new", toBytes("z"), Ttl(0));
    assert(expiring.get("keep"));
    assert(expiring.get("new"));
    assert(expiring.size() == 2);
    std::cout << "[OK] MemoryBackend eviction\n";
}

void testPrefixIsolation() {
    MemoryBackend a("tenantA", 100, minutes(1));
    a.set("k", toBytes("a"), Ttl(0));
    a.clear("tenantA:*");
    assert(a.get("k"));
    a.clear("*");
    assert(!a.get("k"));
    std::cout << "[OK] MemoryBackend key prefix\n";
}

void stressTestMemoryBackend() {
    MemoryBackend cache("app", 128, milliseconds(5));
    std::vector<std::thread> threads;
    std::atomic<int> reads{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, &reads, t] {
            for (int i = 0; i < 2000; ++i) {
                std::string key = "k" + std::to_string((t * 2000 + i) % 300);
                cache.set(key, toBytes(key), milliseconds(i % 3 == 0 ? 1 : 0));
                if (auto v = cache.get(key)) {
                    assert(toString(*v) == key);
                    ++reads;
                }
                if (i % 50 == 0) {
                    cache.remove(key);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    assert(cache.size() <= 128);
    assert(reads.load() > 0);
    std::cout << "[OK] MemoryBackend concurrent stress test\n";
}

int main() {
    smokeTestMemoryBackend();
    testTtl();
    testBackgroundCleanup();
    testClearPattern();
    testEviction();
    testPrefixIsolation();
    stressTestMemoryBackend();
    std::cout << "All MemoryBackend tests passed!\n";
    return 0;
}
