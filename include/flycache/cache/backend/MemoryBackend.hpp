#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "flycache/cache/base/CacheBackend.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Кэш в памяти с TTL, фоновой очисткой и ограничением размера.
 *
 * Одна общая хеш-таблица под std::shared_mutex: чтения идут параллельно,
 * запись эксклюзивна. Фоновый поток раз в cleanupInterval удаляет
 * просроченные записи и останавливается в close() или деструкторе.
 *
 * При заполнении (maxSize > 0) set() сначала удаляет просроченные записи,
 * затем, если места всё ещё нет, одну произвольную запись.
 * @note Это не LRU: вытесняемая запись выбирается произвольно.
 */
class MemoryBackend : public CacheBackend {
public:
    MemoryBackend(std::string keyPrefix, size_t maxSize, std::chrono::milliseconds cleanupInterval);
    ~MemoryBackend() override;

    MemoryBackend(const MemoryBackend&) = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;

    std::optional<Bytes> get(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    void set(const std::string& key, const Bytes& value, Ttl ttl,
             const Deadline& deadline = Deadline::none()) override;
    void remove(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    bool exists(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    void clear(const std::string& pattern, const Deadline& deadline = Deadline::none()) override;
    void ping(const Deadline& deadline = Deadline::none()) override;
    bool isAvailable() const override;
    void close() override;
    std::string name() const override { return "memory"; }

    // Количество хранимых записей (включая ещё не удалённые просроченные)
    size_t size() const;
    size_t maxSize() const { return maxSize_; }
    size_t evictionCount() const { return evictions_.load(); }

    /// Немедленно удалить просроченные записи. Возвращает число удалённых.
    size_t removeExpired();

private:
    void cleanupThreadFunc();
    void evictIfNeeded(Clock::time_point now);

    std::string keyPrefix_;
    size_t maxSize_;
    std::chrono::milliseconds cleanupInterval_;

    std::unordered_map<std::string, CacheEntry> entries_;
    mutable std::shared_mutex mutex_;

    std::thread cleanupThread_;
    std::mutex cleanupMutex_;
    std::condition_variable cleanupCv_;
    bool stopCleanup_ = false;
    std::atomic<bool> closed_{false};
    std::atomic<size_t> evictions_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace flycache
