#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "flycache/cache/CacheConfig.hpp"
#include "flycache/cache/aside/CacheAside.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include "flycache/cache/invalidation/InvalidationBus.hpp"
#include "flycache/cache/metrics/MetricsBackend.hpp"
#include "flycache/cache/warming/CacheWarmer.hpp"
#include "flycache/thread/ThreadPool.hpp"

namespace flycache {
namespace cache {

// Состояние компонента для проверки здоровья сервиса
struct ComponentStatus {
    std::string name;
    std::string status;     // healthy | degraded | unhealthy
    std::string message;
    std::chrono::microseconds latency{0};

    nlohmann::json toJson() const {
        nlohmann::json j = {{"name", name}, {"status", status}, {"message", message}};
        if (latency.count() > 0) {
            j["latencyMicros"] = latency.count();
        }
        return j;
    }
};

/**
 * @brief Кэш приложения: выбранный бэкенд и построенные поверх него слои.
 *
 * Создаётся один раз при старте через create() и закрывается один раз при
 * завершении. Вспомогательные операции работают по принципу fail-open:
 * сбой кэша журналируется и превращается в промах или false, но не в
 * исключение для вызывающего.
 */
class CacheManager {
public:
    static constexpr std::chrono::seconds kHealthCheckTimeout{2};

    /// @throws ConfigurationError при некорректной конфигурации
    static std::shared_ptr<CacheManager> create(const CacheConfig& config,
                                                const WarmingConfig& warmingConfig = WarmingConfig{});

    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    std::optional<Bytes> get(const std::string& key);
    bool set(const std::string& key, const Bytes& value, Ttl ttl);
    bool remove(const std::string& key);
    bool clear(const std::string& pattern);
    bool exists(const std::string& key);

    /// Записать, только если ключа нет. Проверка и запись не атомарны.
    bool setIfNotExists(const std::string& key, const Bytes& value, Ttl ttl);

    /**
     * @brief Прочитать JSON-значение.
     * @return std::nullopt при промахе или сбое кэша
     * @throws SerializationError если сохранённое значение не декодируется в T
     */
    template<typename T>
    std::optional<T> getJson(const std::string& key) {
        auto raw = get(key);
        if (!raw) {
            return std::nullopt;
        }
        try {
            return nlohmann::json::parse(raw->begin(), raw->end()).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError("get", key, e.what());
        }
    }

    /// @throws SerializationError если значение не кодируется в JSON
    template<typename T>
    bool setJson(const std::string& key, const T& value, Ttl ttl) {
        std::string encoded;
        try {
            encoded = nlohmann::json(value).dump();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError("set", key, e.what());
        }
        return set(key, toBytes(encoded), ttl);
    }

    ComponentStatus checkHealth();

    Ttl ttlFor(TtlDomain domain) const { return config_.ttlFor(domain); }
    bool isAvailable() const { return metrics_->isAvailable(); }
    std::string backendName() const { return metrics_->name(); }
    const CacheConfig& config() const { return config_; }

    /// Бэкенд с метриками; все слои работают через него.
    std::shared_ptr<MetricsBackend> backend() const { return metrics_; }
    CacheAside& aside() { return *aside_; }
    CacheWarmer& warmer() { return *warmer_; }
    InvalidationBus& invalidation() { return *invalidation_; }

    /// Идемпотентно: дожидается отложенных записей и закрывает бэкенд.
    void close();

private:
    CacheManager(const CacheConfig& config, const WarmingConfig& warmingConfig,
                 std::shared_ptr<CacheBackend> selected);

    CacheConfig config_;
    std::shared_ptr<MetricsBackend> metrics_;
    std::shared_ptr<thread::ThreadPool> writePool_;
    std::unique_ptr<CacheAside> aside_;
    std::unique_ptr<CacheWarmer> warmer_;
    std::unique_ptr<InvalidationBus> invalidation_;
    std::atomic<bool> closed_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace flycache
