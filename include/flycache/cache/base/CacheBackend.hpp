#pragma once
#include <optional>
#include <string>
#include "flycache/cache/base/CacheTypes.hpp"
#include "flycache/cache/base/CacheError.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Базовый интерфейс бэкенда кэша для всех реализаций.
 *
 * Промах возвращается как std::nullopt. Прочие сбои сообщаются исключениями
 * CacheError (BackendError, BackendUnavailableError). Все методы
 * потокобезопасны.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /// Получить значение по ключу. Просроченные записи никогда не возвращаются.
    virtual std::optional<Bytes> get(const std::string& key,
                                     const Deadline& deadline = Deadline::none()) = 0;
    /// Сохранить значение. ttl <= 0 означает бессрочную запись.
    virtual void set(const std::string& key, const Bytes& value, Ttl ttl,
                     const Deadline& deadline = Deadline::none()) = 0;
    /// Удалить значение по ключу (отсутствие ключа не ошибка).
    virtual void remove(const std::string& key,
                        const Deadline& deadline = Deadline::none()) = 0;
    /// Проверить наличие непросроченного ключа.
    virtual bool exists(const std::string& key,
                        const Deadline& deadline = Deadline::none()) = 0;
    /// Удалить ключи по шаблону: точный ключ или префикс с '*' в конце.
    virtual void clear(const std::string& pattern,
                       const Deadline& deadline = Deadline::none()) = 0;
    /// Проверить соединение с бэкендом.
    virtual void ping(const Deadline& deadline = Deadline::none()) = 0;
    /// Доступен ли бэкенд.
    virtual bool isAvailable() const = 0;
    /// Освободить ресурсы бэкенда. Повторный вызов безопасен.
    virtual void close() = 0;
    /// Имя реализации для логов и health-check.
    virtual std::string name() const = 0;
};

} // namespace cache
} // namespace flycache
