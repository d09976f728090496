#include <cassert>
#include <iostream>
#include "flycache/cache/backend/NoOpBackend.hpp"

using namespace flycache::cache;

int main() {
    NoOpBackend cache;
    cache.set("k", toBytes("v"), Ttl(1000));
    assert(!cache.get("k"));
    assert(!cache.exists("k"));
    cache.remove("k");
    cache.clear("*");
    cache.ping();
    assert(!cache.isAvailable());
    assert(cache.name() == "noop");
    cache.close();
    std::cout << "[OK] NoOpBackend smoke test\n";
    return 0;
}
