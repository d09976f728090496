#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace flycache {
namespace thread {

// Метрики пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;    // Потоков, выполняющих задачу
    size_t queueSize = 0;        // Задач в очереди
    size_t totalThreads = 0;     // Всего рабочих потоков
    size_t completedTasks = 0;   // Выполнено задач с момента запуска
};

// Конфигурация пула потоков
struct ThreadPoolConfig {
    size_t threadCount = 4;      // Количество рабочих потоков
    size_t queueSize = 1024;     // Максимальный размер очереди

    bool validate() const {
        if (threadCount == 0) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Пул потоков фиксированного размера с ограниченной очередью
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавление задачи; std::runtime_error при переполнении очереди или после stop()
    void enqueue(std::function<void()> task);

    // Неблокирующий вариант: false при переполнении или остановленном пуле
    bool tryEnqueue(std::function<void()> task);

    size_t getActiveThreadCount() const;
    size_t getQueueSize() const;
    bool isQueueEmpty() const;
    bool isStopped() const;

    // Ожидание, пока очередь опустеет и все потоки освободятся
    void waitForCompletion();

    // Остановка: задачи из очереди дорабатываются, затем потоки завершаются
    void stop();

    ThreadPoolMetrics getMetrics() const;
    ThreadPoolConfig getConfiguration() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace flycache
