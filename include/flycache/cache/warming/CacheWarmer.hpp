#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "flycache/cache/base/CacheBackend.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Конфигурация прогрева кэша
 */
struct WarmingConfig {
    bool enabled = true;                            ///< Выполнять прогрев
    size_t concurrency = 5;                         ///< Одновременно выполняемых задач
    std::chrono::milliseconds timeout{30000};       ///< Общий лимит времени прогрева

    bool validate() const {
        return concurrency > 0 && timeout.count() > 0;
    }
};

/**
 * @brief Признак отмены, общий для всех копий.
 *
 * Загрузчик прогрева получает токен и может проверять его в длительных
 * операциях. После истечения срока прогрева токен отменяется.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    bool isCancelled() const { return cancelled_->load(); }
    void cancel() { cancelled_->store(true); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

/**
 * @brief Задача прогрева: загрузить значение и записать его по ключу.
 *
 * Загрузчик сообщает об ошибке исключением. Задача не хранит состояния и
 * может выполняться повторно.
 */
struct WarmingTask {
    using Loader = std::function<Bytes(const CancellationToken&)>;

    std::string name;
    std::string cacheKey;
    Loader loader;
    Ttl ttl{0};
};

struct WarmingResult {
    std::string name;
    bool success = false;
    std::string error;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief Предварительная загрузка часто используемых данных в кэш.
 *
 * warm() выполняет все зарегистрированные задачи не более чем в
 * concurrency потоков под общим сроком min(deadline, now + timeout) и
 * возвращает ровно один результат на задачу в порядке регистрации.
 * Задачи, не завершившиеся к сроку, получают ошибку "deadline exceeded";
 * их токен отменяется, ещё не начатые задачи пропускаются, а уже
 * выполняющиеся могут доработать в фоне. Запись в кэш идёт под блокировкой
 * запуска, поэтому задача с ошибкой "deadline exceeded" ничего не записывает.
 *
 * registerTask() не потокобезопасен относительно warm(): задачи
 * регистрируются при старте.
 */
class CacheWarmer {
public:
    static constexpr const char* kDeadlineExceeded = "deadline exceeded";

    CacheWarmer(std::shared_ptr<CacheBackend> backend, WarmingConfig config);

    void registerTask(WarmingTask task);
    void registerTasks(std::vector<WarmingTask> tasks);
    size_t taskCount() const;

    /// Пустой результат, если прогрев выключен или кэш недоступен.
    std::vector<WarmingResult> warm(const Deadline& deadline = Deadline::none());

    /**
     * @brief Прогреть один ключ немедленно.
     *
     * @return false если кэш недоступен и прогрев пропущен
     * @throws исключение загрузчика или CacheError записи
     */
    bool warmKey(const std::string& key, Ttl ttl, const std::function<Bytes()>& loader);

    const WarmingConfig& config() const { return config_; }

private:
    struct Batch;

    static void runWorker(const std::shared_ptr<Batch>& batch);

    std::shared_ptr<CacheBackend> backend_;
    WarmingConfig config_;
    mutable std::mutex tasksMutex_;
    std::vector<WarmingTask> tasks_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace flycache
