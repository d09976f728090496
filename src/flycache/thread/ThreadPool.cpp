#include "flycache/thread/ThreadPool.hpp"
#include "flycache/util/Logging.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace flycache {
namespace thread {

struct ThreadPool::Impl {
    std::vector<std::thread> workers;           // Рабочие потоки
    std::queue<std::function<void()>> tasks;    // Очередь задач
    mutable std::mutex queueMutex;
    std::condition_variable condition;          // Появилась задача или стоп
    std::condition_variable idle;               // Задача завершена
    std::mutex joinMutex;
    bool stop = false;
    std::atomic<size_t> activeThreads{0};
    std::atomic<size_t> completedTasks{0};
    ThreadPoolConfig config;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const ThreadPoolConfig& cfg)
        : config(cfg), logger(util::componentLogger("threadpool")) {
        if (!config.validate()) {
            throw std::invalid_argument("Некорректная конфигурация пула потоков");
        }
        workers.reserve(config.threadCount);
        for (size_t i = 0; i < config.threadCount; ++i) {
            workers.emplace_back([this] { processTasks(); });
        }
        logger->debug("Пул потоков инициализирован: {} потоков", workers.size());
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            stop = true;
        }
        condition.notify_all();

        std::lock_guard<std::mutex> joinLock(joinMutex);
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    void processTasks() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                condition.wait(lock, [this] { return stop || !tasks.empty(); });
                if (stop && tasks.empty()) {
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }

            try {
                task();
            } catch (const std::exception& e) {
                logger->error("Ошибка выполнения задачи: {}", e.what());
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex);
                --activeThreads;
                ++completedTasks;
            }
            idle.notify_all();
        }
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
}

ThreadPool::~ThreadPool() {
    pImpl->shutdown();
}

void ThreadPool::enqueue(std::function<void()> task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stop) {
            throw std::runtime_error("Пул потоков остановлен");
        }
        if (pImpl->tasks.size() >= pImpl->config.queueSize) {
            pImpl->logger->error("Очередь задач переполнена: {}", pImpl->tasks.size());
            throw std::runtime_error("Очередь задач переполнена");
        }
        pImpl->tasks.push(std::move(task));
    }
    pImpl->condition.notify_one();
}

bool ThreadPool::tryEnqueue(std::function<void()> task) {
    if (!task) return false;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stop || pImpl->tasks.size() >= pImpl->config.queueSize) {
            return false;
        }
        pImpl->tasks.push(std::move(task));
    }
    pImpl->condition.notify_one();
    return true;
}

size_t ThreadPool::getActiveThreadCount() const {
    return pImpl->activeThreads.load();
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.empty();
}

bool ThreadPool::isStopped() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->stop;
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->idle.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads.load() == 0;
    });
}

void ThreadPool::stop() {
    pImpl->shutdown();
    pImpl->logger->debug("Пул потоков остановлен, выполнено задач: {}", pImpl->completedTasks.load());
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeThreads.load();
    metrics.queueSize = getQueueSize();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks.load();
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace flycache
