#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "flycache/cache/aside/SingleFlightGroup.hpp"
#include "flycache/cache/base/CacheBackend.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include "flycache/thread/ThreadPool.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Шаблон cache-aside с защитой от "лавины" промахов.
 *
 * При попадании значение возвращается сразу. При промахе одновременные
 * запросы одного ключа объединяются: загрузчик вызывается один раз, его
 * результат получают все ожидающие. Внутри объединённого вызова кэш
 * проверяется повторно.
 *
 * Ошибки чтения кэша считаются промахом, ошибки записи журналируются и
 * игнорируются. Исключение загрузчика получают все объединённые вызовы,
 * в кэш ничего не записывается.
 *
 * getOrLoad/cacheAside записывают результат асинхронно через пул потоков
 * с собственным сроком kAsyncWriteTimeout. Варианты *Sync записывают до
 * возврата значения.
 */
class CacheAside {
public:
    using Loader = std::function<Bytes()>;

    static constexpr std::chrono::seconds kAsyncWriteTimeout{2};

    /// writePool может быть nullptr: тогда запись всегда синхронная.
    CacheAside(std::shared_ptr<CacheBackend> backend, std::shared_ptr<thread::ThreadPool> writePool);

    Bytes getOrLoad(const std::string& key, Ttl ttl, const Loader& loader);
    Bytes getOrLoadSync(const std::string& key, Ttl ttl, const Loader& loader);

    /// Типизированный вариант; T должен иметь преобразования nlohmann::json.
    template<typename T, typename Fn>
    T cacheAside(const std::string& key, Ttl ttl, Fn&& loader) {
        return loadTyped<T>(key, ttl, std::forward<Fn>(loader), false);
    }

    template<typename T, typename Fn>
    T cacheAsideSync(const std::string& key, Ttl ttl, Fn&& loader) {
        return loadTyped<T>(key, ttl, std::forward<Fn>(loader), true);
    }

    /// Сколько вызовов присоединились к уже выполняющейся загрузке.
    uint64_t coalescedCount() const { return coalesced_.load(); }

    size_t inFlight() const { return flights_.inFlight(); }

private:
    using Validator = std::function<bool(const Bytes&)>;

    template<typename T>
    static std::optional<T> decode(const Bytes& raw) {
        try {
            return nlohmann::json::parse(raw.begin(), raw.end()).get<T>();
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    template<typename T>
    static Bytes encode(const std::string& key, const T& value) {
        try {
            return toBytes(nlohmann::json(value).dump());
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError("encode", key, e.what());
        }
    }

    template<typename T, typename Fn>
    T loadTyped(const std::string& key, Ttl ttl, Fn&& loader, bool sync) {
        Validator decodable = [](const Bytes& raw) { return decode<T>(raw).has_value(); };
        if (auto cached = readCache(key, decodable)) {
            return *decode<T>(*cached);
        }
        Bytes raw = load(key, ttl, [&]() { return encode<T>(key, loader()); }, decodable, sync);
        auto value = decode<T>(raw);
        if (!value) {
            throw SerializationError("decode", key, "loaded value cannot be decoded");
        }
        return std::move(*value);
    }

    // Чтение с проверкой значения; любая ошибка или непригодное значение дают промах
    std::optional<Bytes> readCache(const std::string& key, const Validator& validator);
    Bytes load(const std::string& key, Ttl ttl, const Loader& loader, const Validator& validator, bool sync);
    void store(const std::string& key, const Bytes& value, Ttl ttl, bool sync);

    std::shared_ptr<CacheBackend> backend_;
    std::shared_ptr<thread::ThreadPool> writePool_;
    SingleFlightGroup<Bytes> flights_;
    std::atomic<uint64_t> coalesced_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace flycache
