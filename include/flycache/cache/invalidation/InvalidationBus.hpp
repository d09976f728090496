#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "flycache/cache/base/CacheBackend.hpp"
#include "flycache/cache/invalidation/CacheBroadcaster.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Событие изменения данных, требующее инвалидации кэша.
 */
struct InvalidationEvent {
    std::string type;                           // Метка события, например "feature_flags:updated"
    std::vector<std::string> keys;              // Точные ключи для удаления
    std::string pattern;                        // Шаблон для clear(), может быть пустым
    bool broadcast = false;                     // Уведомлять клиентов
    std::vector<std::string> notificationKeys;  // Ключи клиентских кэшей

    static InvalidationEvent userUpdated(const std::string& userId);
    static InvalidationEvent featureFlagsUpdated();
    static InvalidationEvent settingsUpdated();
    static InvalidationEvent announcementsUpdated();
};

struct InvalidationFailure {
    std::string target;     // Ключ или шаблон
    std::string error;
};

// Итог публикации события
struct InvalidationReport {
    std::vector<std::string> invalidated;       // Удалённые ключи и очищенные шаблоны
    std::vector<InvalidationFailure> failures;
    bool broadcasted = false;

    bool ok() const { return failures.empty(); }
};

/**
 * @brief Шина событий инвалидации.
 *
 * publish() удаляет ключи события, очищает шаблон и, если нужно,
 * уведомляет зарегистрированный CacheBroadcaster. Ошибка бэкенда по
 * одному ключу журналируется и не прерывает остальные удаления.
 */
class InvalidationBus {
public:
    explicit InvalidationBus(std::shared_ptr<CacheBackend> backend);

    InvalidationReport publish(const InvalidationEvent& event);

    /// Потокобезопасно; nullptr снимает регистрацию.
    void setBroadcaster(std::shared_ptr<CacheBroadcaster> broadcaster);
    bool hasBroadcaster() const;

private:
    std::shared_ptr<CacheBroadcaster> broadcaster() const;

    std::shared_ptr<CacheBackend> backend_;
    mutable std::mutex broadcasterMutex_;
    std::shared_ptr<CacheBroadcaster> broadcaster_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace flycache
