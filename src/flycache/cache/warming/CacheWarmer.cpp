#include "flycache/cache/warming/CacheWarmer.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include "flycache/util/Logging.hpp"
#include <algorithm>
#include <condition_variable>
#include <optional>
#include <stdexcept>
#include <thread>

namespace flycache {
namespace cache {

// Состояние одного запуска warm(); разделяется с рабочими потоками,
// которые могут пережить вызов при истечении срока
struct CacheWarmer::Batch {
    std::shared_ptr<CacheBackend> backend;
    std::vector<WarmingTask> tasks;
    Deadline deadline;
    CancellationToken token;
    std::shared_ptr<spdlog::logger> logger;

    std::mutex mutex;
    std::condition_variable finished;
    std::vector<std::optional<WarmingResult>> results;
    size_t next = 0;
    size_t done = 0;
};

CacheWarmer::CacheWarmer(std::shared_ptr<CacheBackend> backend, WarmingConfig config)
    : backend_(std::move(backend))
    , config_(config)
    , logger_(util::componentLogger("cachewarmer")) {
    if (!backend_) {
        throw std::invalid_argument("CacheWarmer: пустой бэкенд");
    }
    if (!config_.validate()) {
        throw ConfigurationError("warming", "concurrency and timeout must be positive");
    }
}

void CacheWarmer::registerTask(WarmingTask task) {
    if (!task.loader) {
        throw std::invalid_argument("CacheWarmer: задача '" + task.name + "' без загрузчика");
    }
    std::lock_guard<std::mutex> lock(tasksMutex_);
    tasks_.push_back(std::move(task));
}

void CacheWarmer::registerTasks(std::vector<WarmingTask> tasks) {
    for (auto& task : tasks) {
        registerTask(std::move(task));
    }
}

size_t CacheWarmer::taskCount() const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    return tasks_.size();
}

std::vector<WarmingResult> CacheWarmer::warm(const Deadline& deadline) {
    if (!config_.enabled || !backend_->isAvailable()) {
        logger_->info("CacheWarmer: прогрев пропущен (выключен или кэш недоступен)");
        return {};
    }

    auto batch = std::make_shared<Batch>();
    batch->backend = backend_;
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        batch->tasks = tasks_;
    }
    batch->deadline = Deadline::earliest(deadline, Deadline::after(config_.timeout));
    batch->logger = logger_;
    batch->results.resize(batch->tasks.size());

    const size_t total = batch->tasks.size();
    const size_t workerCount = std::min(config_.concurrency, total);
    logger_->info("CacheWarmer: старт прогрева, задач={}, потоков={}", total, workerCount);

    auto start = Clock::now();
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back([batch] { runWorker(batch); });
    }

    bool completed = true;
    {
        std::unique_lock<std::mutex> lock(batch->mutex);
        auto allDone = [&] { return batch->done == total; };
        auto until = batch->deadline.timePoint();
        if (until) {
            completed = batch->finished.wait_until(lock, *until, allDone);
        } else {
            batch->finished.wait(lock, allDone);
        }
        if (!completed) {
            batch->token.cancel();
        }
    }

    for (auto& worker : workers) {
        if (completed) {
            worker.join();
        } else {
            // Выполняющиеся загрузчики дорабатывают в фоне и видят отменённый токен
            worker.detach();
        }
    }

    std::vector<WarmingResult> results;
    results.reserve(total);
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        for (size_t i = 0; i < total; ++i) {
            if (batch->results[i]) {
                results.push_back(*batch->results[i]);
            } else {
                WarmingResult timedOut;
                timedOut.name = batch->tasks[i].name;
                timedOut.error = kDeadlineExceeded;
                timedOut.latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
                results.push_back(std::move(timedOut));
            }
        }
    }

    size_t succeeded = static_cast<size_t>(
        std::count_if(results.begin(), results.end(), [](const WarmingResult& r) { return r.success; }));
    logger_->info("CacheWarmer: прогрев завершён, всего={}, успешно={}, ошибок={}, время={} мс",
                  total, succeeded, total - succeeded,
                  std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
    return results;
}

void CacheWarmer::runWorker(const std::shared_ptr<Batch>& batch) {
    while (true) {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(batch->mutex);
            if (batch->token.isCancelled() || batch->next >= batch->tasks.size()) {
                return;
            }
            index = batch->next++;
        }

        const WarmingTask& task = batch->tasks[index];
        WarmingResult result;
        result.name = task.name;
        auto started = Clock::now();
        std::optional<Bytes> value;
        try {
            value = task.loader(batch->token);
        } catch (const std::exception& e) {
            result.error = e.what();
            batch->logger->warn("CacheWarmer: задача '{}' завершилась ошибкой: {}", task.name, e.what());
        }

        {
            // Проверка срока и запись под одной блокировкой: итог задачи совпадает с содержимым кэша
            std::lock_guard<std::mutex> lock(batch->mutex);
            if (batch->token.isCancelled()) {
                batch->logger->debug("CacheWarmer: задача '{}' завершилась после срока", task.name);
            } else {
                if (value) {
                    try {
                        batch->backend->set(task.cacheKey, *value, task.ttl, batch->deadline);
                        result.success = true;
                        batch->logger->debug("CacheWarmer: задача '{}' записана в '{}'", task.name, task.cacheKey);
                    } catch (const std::exception& e) {
                        result.error = e.what();
                        batch->logger->warn("CacheWarmer: не удалось записать '{}': {}", task.cacheKey, e.what());
                    }
                }
                result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
                batch->results[index] = std::move(result);
            }
            ++batch->done;
        }
        batch->finished.notify_all();
    }
}

bool CacheWarmer::warmKey(const std::string& key, Ttl ttl, const std::function<Bytes()>& loader) {
    if (!backend_->isAvailable()) {
        return false;
    }
    Bytes value = loader();
    backend_->set(key, value, ttl);
    logger_->debug("CacheWarmer: ключ '{}' прогрет", key);
    return true;
}

} // namespace cache
} // namespace flycache
