#include <cassert>
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include "flycache/thread/ThreadPool.hpp"

using namespace flycache::thread;

void smokeTestThreadPool() {
    ThreadPoolConfig config;
    config.threadCount = 4;
    config.queueSize = 1000;
    ThreadPool pool(config);

    std::atomic<int> counter{0};
    for (int i = 0; i < 500; ++i) {
        pool.enqueue([&counter] { ++counter; });
    }
    pool.waitForCompletion();
    assert(counter.load() == 500);
    assert(pool.isQueueEmpty());
    auto metrics = pool.getMetrics();
    assert(metrics.totalThreads == 4);
    assert(metrics.completedTasks == 500);

    // Исключение задачи не останавливает рабочий поток
    pool.enqueue([] { throw std::runtime_error("task failed"); });
    pool.enqueue([&counter] { ++counter; });
    pool.waitForCompletion();
    assert(counter.load() == 501);
    std::cout << "[OK] ThreadPool smoke test\n";
}

void testBoundedQueue() {
    ThreadPoolConfig config;
    config.threadCount = 1;
    config.queueSize = 2;
    ThreadPool pool(config);

    std::atomic<bool> release{false};
    pool.enqueue([&release] {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    while (pool.getActiveThreadCount() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(pool.tryEnqueue([] {}));
    assert(pool.tryEnqueue([] {}));
    assert(!pool.tryEnqueue([] {}));
    bool thrown = false;
    try {
        pool.enqueue([] {});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    release = true;
    pool.waitForCompletion();
    std::cout << "[OK] ThreadPool bounded queue\n";
}

void testStop() {
    ThreadPoolConfig config;
    config.threadCount = 2;
    ThreadPool pool(config);
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        pool.enqueue([&counter] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++counter;
        });
    }
    pool.stop();
    assert(counter.load() == 20);
    assert(pool.isStopped());
    assert(!pool.tryEnqueue([] {}));
    pool.stop();

    bool thrown = false;
    try {
        ThreadPoolConfig bad;
        bad.threadCount = 0;
        ThreadPool invalid(bad);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] ThreadPool stop drains queue\n";
}

int main() {
    smokeTestThreadPool();
    testBoundedQueue();
    testStop();
    std::cout << "All ThreadPool tests passed!\n";
    return 0;
}
