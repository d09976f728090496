#include "flycache/cache/manager/CacheManager.hpp"
#include "flycache/cache/manager/BackendSelector.hpp"
#include "flycache/util/Logging.hpp"

namespace flycache {
namespace cache {

namespace {

thread::ThreadPoolConfig writePoolConfig() {
    thread::ThreadPoolConfig config;
    config.threadCount = 2;
    config.queueSize = 1024;
    return config;
}

} // namespace

std::shared_ptr<CacheManager> CacheManager::create(const CacheConfig& config, const WarmingConfig& warmingConfig) {
    auto selected = BackendSelector::initialize(config);
    return std::shared_ptr<CacheManager>(new CacheManager(config, warmingConfig, std::move(selected)));
}

CacheManager::CacheManager(const CacheConfig& config, const WarmingConfig& warmingConfig,
                           std::shared_ptr<CacheBackend> selected)
    : config_(config)
    , metrics_(std::make_shared<MetricsBackend>(std::move(selected)))
    , writePool_(std::make_shared<thread::ThreadPool>(writePoolConfig()))
    , aside_(std::make_unique<CacheAside>(metrics_, writePool_))
    , warmer_(std::make_unique<CacheWarmer>(metrics_, warmingConfig))
    , invalidation_(std::make_unique<InvalidationBus>(metrics_))
    , logger_(util::componentLogger("cachemanager")) {
    logger_->info("CacheManager: бэкенд '{}', доступен={}", metrics_->name(), metrics_->isAvailable());
}

CacheManager::~CacheManager() {
    close();
}

std::optional<Bytes> CacheManager::get(const std::string& key) {
    try {
        return metrics_->get(key);
    } catch (const CacheError& e) {
        logger_->debug("CacheManager: ошибка чтения '{}': {}", key, e.what());
        return std::nullopt;
    }
}

bool CacheManager::set(const std::string& key, const Bytes& value, Ttl ttl) {
    try {
        metrics_->set(key, value, ttl);
        return true;
    } catch (const CacheError& e) {
        logger_->debug("CacheManager: ошибка записи '{}': {}", key, e.what());
        return false;
    }
}

bool CacheManager::remove(const std::string& key) {
    try {
        metrics_->remove(key);
        return true;
    } catch (const CacheError& e) {
        logger_->debug("CacheManager: ошибка удаления '{}': {}", key, e.what());
        return false;
    }
}

bool CacheManager::clear(const std::string& pattern) {
    try {
        metrics_->clear(pattern);
        return true;
    } catch (const CacheError& e) {
        logger_->debug("CacheManager: ошибка очистки '{}': {}", pattern, e.what());
        return false;
    }
}

bool CacheManager::exists(const std::string& key) {
    try {
        return metrics_->exists(key);
    } catch (const CacheError& e) {
        logger_->debug("CacheManager: ошибка проверки '{}': {}", key, e.what());
        return false;
    }
}

bool CacheManager::setIfNotExists(const std::string& key, const Bytes& value, Ttl ttl) {
    if (exists(key)) {
        return false;
    }
    return set(key, value, ttl);
}

ComponentStatus CacheManager::checkHealth() {
    ComponentStatus status;
    status.name = "cache";

    if (closed_.load()) {
        status.status = "unhealthy";
        status.message = "cache closed";
        return status;
    }
    if (!metrics_->isAvailable()) {
        status.status = "degraded";
        status.message = "cache unavailable (no-op mode)";
        return status;
    }

    auto start = Clock::now();
    try {
        metrics_->ping(Deadline::after(kHealthCheckTimeout));
    } catch (const CacheError& e) {
        status.status = "unhealthy";
        status.message = std::string("failed to ping cache: ") + e.what();
        return status;
    }
    status.latency = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    status.status = "healthy";
    status.message = "cache responding normally";
    return status;
}

void CacheManager::close() {
    if (closed_.exchange(true)) {
        return;
    }
    // Отложенные записи завершаются до закрытия бэкенда
    writePool_->stop();
    metrics_->close();
    auto snapshot = metrics_->snapshot();
    logger_->info("CacheManager: закрыт, попаданий={}, промахов={}, hitRate={:.2f}%",
                  snapshot.hits, snapshot.misses, snapshot.hitRate);
}

} // namespace cache
} // namespace flycache
