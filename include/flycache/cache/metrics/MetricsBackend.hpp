#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "flycache/cache/base/CacheBackend.hpp"
#include "flycache/cache/metrics/CacheMetrics.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Декоратор, собирающий метрики любого бэкенда.
 *
 * Считает попадания и промахи get(), время get/set/remove/clear и ошибки.
 * Контракт и исключения внутреннего бэкенда не меняются: ошибки
 * пробрасываются как есть, промах остаётся std::nullopt.
 */
class MetricsBackend : public CacheBackend {
public:
    explicit MetricsBackend(std::shared_ptr<CacheBackend> inner);

    std::optional<Bytes> get(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    void set(const std::string& key, const Bytes& value, Ttl ttl,
             const Deadline& deadline = Deadline::none()) override;
    void remove(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    bool exists(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    void clear(const std::string& pattern, const Deadline& deadline = Deadline::none()) override;
    void ping(const Deadline& deadline = Deadline::none()) override;
    bool isAvailable() const override;
    void close() override;
    std::string name() const override;

    /// Доля попаданий в процентах; 0 если обращений не было.
    double hitRate() const;
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

    CacheMetrics snapshot() const;
    /// Явный сброс счётчиков.
    void resetCounters();

    const std::shared_ptr<CacheBackend>& inner() const { return inner_; }

private:
    struct AtomicTiming {
        std::atomic<uint64_t> count{0};
        std::atomic<uint64_t> totalMicros{0};
        std::atomic<uint64_t> maxMicros{0};

        void record(uint64_t micros);
        OperationTiming load() const;
        void reset();
    };

    template<typename Fn>
    auto timed(AtomicTiming& timing, Fn&& fn) -> decltype(fn());

    std::shared_ptr<CacheBackend> inner_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> errors_{0};
    AtomicTiming getTiming_;
    AtomicTiming setTiming_;
    AtomicTiming deleteTiming_;
    AtomicTiming clearTiming_;
};

} // namespace cache
} // namespace flycache
