#include "flycache/cache/invalidation/InvalidationBus.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include "flycache/util/Logging.hpp"
#include <chrono>
#include <stdexcept>

namespace flycache {
namespace cache {

InvalidationEvent InvalidationEvent::userUpdated(const std::string& userId) {
    InvalidationEvent event;
    event.type = "user:updated";
    event.keys = {"user:" + userId};
    return event;
}

InvalidationEvent InvalidationEvent::featureFlagsUpdated() {
    InvalidationEvent event;
    event.type = "feature_flags:updated";
    event.pattern = "feature_flags:*";
    event.broadcast = true;
    event.notificationKeys = {"featureFlags"};
    return event;
}

InvalidationEvent InvalidationEvent::settingsUpdated() {
    InvalidationEvent event;
    event.type = "settings:updated";
    event.pattern = "settings:*";
    event.broadcast = true;
    event.notificationKeys = {"settings"};
    return event;
}

InvalidationEvent InvalidationEvent::announcementsUpdated() {
    InvalidationEvent event;
    event.type = "announcements:updated";
    event.keys = {"announcements:active"};
    event.broadcast = true;
    event.notificationKeys = {"announcements"};
    return event;
}

InvalidationBus::InvalidationBus(std::shared_ptr<CacheBackend> backend)
    : backend_(std::move(backend))
    , logger_(util::componentLogger("invalidation")) {
    if (!backend_) {
        throw std::invalid_argument("InvalidationBus: empty backend");
    }
}

InvalidationReport InvalidationBus::publish(const InvalidationEvent& event) {
    InvalidationReport report;

    for (const auto& key : event.keys) {
        try {
            backend_->remove(key);
            report.invalidated.push_back(key);
        } catch (const CacheError& e) {
            logger_->warn("Failed to invalidate key '{}' for event '{}': {}", key, event.type, e.what());
            report.failures.push_back({key, e.what()});
        }
    }

    if (!event.pattern.empty()) {
        try {
            backend_->clear(event.pattern);
            report.invalidated.push_back(event.pattern);
        } catch (const CacheError& e) {
            logger_->warn("Failed to invalidate pattern '{}' for event '{}': {}", event.pattern, event.type, e.what());
            report.failures.push_back({event.pattern, e.what()});
        }
    }

    if (event.broadcast && !event.notificationKeys.empty()) {
        if (auto target = broadcaster()) {
            InvalidatePayload payload;
            payload.notificationKeys = event.notificationKeys;
            payload.event = event.type;
            payload.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            try {
                target->broadcastInvalidation(payload);
                report.broadcasted = true;
            } catch (const std::exception& e) {
                logger_->error("Broadcast of event '{}' failed: {}", event.type, e.what());
            }
        }
    }

    logger_->debug("Event '{}' published: invalidated={}, failures={}, broadcast={}",
                   event.type, report.invalidated.size(), report.failures.size(), report.broadcasted);
    return report;
}

void InvalidationBus::setBroadcaster(std::shared_ptr<CacheBroadcaster> broadcaster) {
    std::lock_guard<std::mutex> lock(broadcasterMutex_);
    broadcaster_ = std::move(broadcaster);
    if (broadcaster_) {
        logger_->info("Cache broadcaster registered");
    } else {
        logger_->info("Cache broadcaster unregistered");
    }
}

bool InvalidationBus::hasBroadcaster() const {
    return broadcaster() != nullptr;
}

std::shared_ptr<CacheBroadcaster> InvalidationBus::broadcaster() const {
    std::lock_guard<std::mutex> lock(broadcasterMutex_);
    return broadcaster_;
}

} // namespace cache
} // namespace flycache
