#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flycache {
namespace cache {

// Уведомление клиентов об инвалидации серверного кэша
struct InvalidatePayload {
    std::vector<std::string> notificationKeys;  // Ключи клиентских кэшей (например, "featureFlags")
    std::string event;                          // Тип события, может быть пустым
    int64_t timestamp = 0;                      // Unix-время, секунды

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["queryKeys"] = notificationKeys;
        if (!event.empty()) {
            j["event"] = event;
        }
        j["timestamp"] = timestamp;
        return j;
    }
};

/**
 * @brief Получатель уведомлений об инвалидации (например, WebSocket-хаб).
 *
 * Регистрируется в InvalidationBus после старта. Исключения реализации
 * журналируются шиной и дальше не распространяются.
 */
class CacheBroadcaster {
public:
    virtual ~CacheBroadcaster() = default;
    virtual void broadcastInvalidation(const InvalidatePayload& payload) = 0;
};

} // namespace cache
} // namespace flycache
