#include "flycache/cache/aside/CacheAside.hpp"
#include "flycache/util/Logging.hpp"
#include <stdexcept>

namespace flycache {
namespace cache {

CacheAside::CacheAside(std::shared_ptr<CacheBackend> backend, std::shared_ptr<thread::ThreadPool> writePool)
    : backend_(std::move(backend))
    , writePool_(std::move(writePool))
    , logger_(util::componentLogger("cacheaside")) {
    if (!backend_) {
        throw std::invalid_argument("CacheAside: пустой бэкенд");
    }
}

Bytes CacheAside::getOrLoad(const std::string& key, Ttl ttl, const Loader& loader) {
    if (auto cached = readCache(key, nullptr)) {
        return *cached;
    }
    return load(key, ttl, loader, nullptr, false);
}

Bytes CacheAside::getOrLoadSync(const std::string& key, Ttl ttl, const Loader& loader) {
    if (auto cached = readCache(key, nullptr)) {
        return *cached;
    }
    return load(key, ttl, loader, nullptr, true);
}

std::optional<Bytes> CacheAside::readCache(const std::string& key, const Validator& validator) {
    std::optional<Bytes> cached;
    try {
        cached = backend_->get(key);
    } catch (const CacheError& e) {
        logger_->warn("CacheAside: ошибка чтения '{}', загрузка из источника: {}", key, e.what());
        return std::nullopt;
    }
    if (cached && validator && !validator(*cached)) {
        logger_->debug("CacheAside: значение '{}' не декодируется, перезагрузка", key);
        return std::nullopt;
    }
    return cached;
}

Bytes CacheAside::load(const std::string& key, Ttl ttl, const Loader& loader,
                       const Validator& validator, bool sync) {
    auto result = flights_.run(key, [&]() -> Bytes {
        // Пока мы ждали, значение мог записать другой вызов
        if (auto cached = readCache(key, validator)) {
            return *cached;
        }
        Bytes loaded = loader();
        store(key, loaded, ttl, sync);
        return loaded;
    });

    if (result.shared) {
        coalesced_.fetch_add(1, std::memory_order_relaxed);
        logger_->debug("CacheAside: запрос '{}' объединён с выполняющейся загрузкой", key);
    }
    return std::move(result.value);
}

void CacheAside::store(const std::string& key, const Bytes& value, Ttl ttl, bool sync) {
    if (sync || !writePool_) {
        try {
            backend_->set(key, value, ttl);
        } catch (const CacheError& e) {
            logger_->debug("CacheAside: не удалось записать '{}': {}", key, e.what());
        }
        return;
    }

    auto backend = backend_;
    auto logger = logger_;
    // Срок отсчитывается от постановки в очередь, а не от начала выполнения
    const Deadline deadline = Deadline::after(kAsyncWriteTimeout);
    bool queued = writePool_->tryEnqueue([backend, logger, key, value, ttl, deadline]() {
        try {
            backend->set(key, value, ttl, deadline);
        } catch (const CacheError& e) {
            logger->debug("CacheAside: не удалось записать '{}': {}", key, e.what());
        }
    });
    if (!queued) {
        logger_->debug("CacheAside: очередь записи недоступна, '{}' не закэширован", key);
    }
}

} // namespace cache
} // namespace flycache
