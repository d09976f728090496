#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include "flycache/cache/metrics/MetricsBackend.hpp"
#include "flycache/cache/backend/MemoryBackend.hpp"
#include "flycache/cache/base/CacheError.hpp"

using namespace flycache::cache;
using namespace std::chrono;

// Бэкенд, который отказывает на каждой операции
class FailingBackend : public CacheBackend {
public:
    std::optional<Bytes> get(const std::string& key, const Deadline&) override {
        throw BackendUnavailableError("get", key, "down");
    }
    void set(const std::string& key, const Bytes&, Ttl, const Deadline&) override {
        throw BackendUnavailableError("set", key, "down");
    }
    void remove(const std::string& key, const Deadline&) override {
        throw BackendUnavailableError("delete", key, "down");
    }
    bool exists(const std::string&, const Deadline&) override { return false; }
    void clear(const std::string& pattern, const Deadline&) override {
        throw BackendUnavailableError("clear", pattern, "down");
    }
    void ping(const Deadline&) override {}
    bool isAvailable() const override { return false; }
    void close() override {}
    std::string name() const override { return "failing"; }
};

void testHitRate() {
    MetricsBackend cache(std::make_shared<MemoryBackend>("app", 100, minutes(1)));
    assert(cache.hitRate() == 0.0);

    cache.set("a", toBytes("1"), Ttl(0));
    assert(cache.get("a"));
    assert(cache.get("a"));
    assert(!cache.get("b"));
    assert(cache.hits() == 2);
    assert(cache.misses() == 1);
    assert(std::fabs(cache.hitRate() - 66.6667) < 0.01);

    auto snapshot = cache.snapshot();
    assert(snapshot.getTiming.count == 3);
    assert(snapshot.setTiming.count == 1);
    assert(snapshot.getTiming.maxMicros >= snapshot.getTiming.totalMicros / 3);
    auto json = snapshot.toJson();
    assert(json["hits"] == 2);
    assert(json["get"]["count"] == 3);

    cache.remove("a");
    cache.clear("*");
    snapshot = cache.snapshot();
    assert(snapshot.deleteTiming.count == 1);
    assert(snapshot.clearTiming.count == 1);

    cache.resetCounters();
    assert(cache.hits() == 0 && cache.misses() == 0);
    assert(cache.hitRate() == 0.0);
    assert(cache.snapshot().getTiming.count == 0);
    std::cout << "[OK] MetricsBackend hit rate and timings\n";
}

void testErrorsPassThrough() {
    MetricsBackend cache(std::make_shared<FailingBackend>());
    bool thrown = false;
    try {
        cache.get("k");
    } catch (const BackendUnavailableError& e) {
        thrown = e.op() == "get" && e.key() == "k";
    }
    assert(thrown);

    thrown = false;
    try {
        cache.set("k", toBytes("v"), Ttl(0));
    } catch (const BackendUnavailableError&) {
        thrown = true;
    }
    assert(thrown);

    auto snapshot = cache.snapshot();
    assert(snapshot.errors == 2);
    assert(snapshot.hits == 0 && snapshot.misses == 0);
    assert(cache.name() == "failing");
    assert(!cache.isAvailable());
    std::cout << "[OK] MetricsBackend error pass-through\n";
}

int main() {
    testHitRate();
    testErrorsPassThrough();
    std::cout << "All MetricsBackend tests passed!\n";
    return 0;
}
