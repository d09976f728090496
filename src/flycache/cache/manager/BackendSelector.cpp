#include "flycache/cache/manager/BackendSelector.hpp"
#include "flycache/cache/backend/MemoryBackend.hpp"
#include "flycache/cache/backend/NoOpBackend.hpp"
#include "flycache/cache/backend/RemoteBackend.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include "flycache/util/Logging.hpp"

namespace flycache {
namespace cache {

std::shared_ptr<CacheBackend> BackendSelector::initialize(const CacheConfig& config) {
    auto logger = util::componentLogger("cachemanager");

    if (!config.enabled) {
        logger->info("Кэширование выключено, используется NoOpBackend");
        return std::make_shared<NoOpBackend>();
    }
    if (!config.validate()) {
        throw ConfigurationError("cache", "invalid cache configuration");
    }

    if (config.type == BackendType::Remote && !config.remoteUrl.empty()) {
        // Ошибка разбора строки подключения фатальна и уходит вызывающему
        auto options = remote::RemoteClientOptions::fromConfig(config);
        const std::string endpoint = options.target.host + ":" + std::to_string(options.target.port);
        auto remote = std::make_shared<RemoteBackend>(std::move(options), config.keyPrefix, config.retryInterval);
        try {
            remote->ping(Deadline::after(config.pingTimeout));
            logger->info("Используется удалённый кэш {} (db {})", endpoint, RemoteTarget::parse(config.remoteUrl).db);
            return remote;
        } catch (const BackendError& e) {
            remote->close();
            logger->warn("Удалённый кэш {} недоступен, используется кэш в памяти: {}", endpoint, e.what());
        }
    }

    return makeMemory(config);
}

std::shared_ptr<CacheBackend> BackendSelector::makeMemory(const CacheConfig& config) {
    auto logger = util::componentLogger("cachemanager");
    logger->info("Используется кэш в памяти (maxSize={}, cleanupInterval={} мс)",
                 config.memoryMaxSize, config.memoryCleanupInterval.count());
    return std::make_shared<MemoryBackend>(config.keyPrefix, config.memoryMaxSize, config.memoryCleanupInterval);
}

} // namespace cache
} // namespace flycache
