#include "flycache/cache/backend/MemoryBackend.hpp"
#include "flycache/cache/base/KeyPattern.hpp"
#include "flycache/util/Logging.hpp"

namespace flycache {
namespace cache {

MemoryBackend::MemoryBackend(std::string keyPrefix, size_t maxSize, std::chrono::milliseconds cleanupInterval)
    : keyPrefix_(std::move(keyPrefix))
    , maxSize_(maxSize)
    , cleanupInterval_(cleanupInterval.count() > 0 ? cleanupInterval : std::chrono::minutes(1))
    , logger_(util::componentLogger("memorycache")) {
    if (maxSize_ > 0) {
        entries_.reserve(maxSize_);
    }
    cleanupThread_ = std::thread([this] { cleanupThreadFunc(); });
    logger_->info("MemoryBackend: создан, maxSize={}, cleanupInterval={}ms, prefix='{}'",
                  maxSize_, cleanupInterval_.count(), keyPrefix_);
}

MemoryBackend::~MemoryBackend() {
    close();
}

std::optional<Bytes> MemoryBackend::get(const std::string& key, const Deadline&) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(prefixKey(keyPrefix_, key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    // Запись могла истечь между проходами очистки
    if (it->second.isExpired(Clock::now())) {
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryBackend::set(const std::string& key, const Bytes& value, Ttl ttl, const Deadline&) {
    auto now = Clock::now();
    CacheEntry entry{value, std::nullopt};
    if (ttl.count() > 0) {
        entry.expiresAt = now + ttl;
    }

    auto fullKey = prefixKey(keyPrefix_, key);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(fullKey);
    if (it != entries_.end()) {
        it->second = std::move(entry);
        return;
    }
    evictIfNeeded(now);
    entries_.emplace(std::move(fullKey), std::move(entry));
}

void MemoryBackend::remove(const std::string& key, const Deadline&) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(prefixKey(keyPrefix_, key));
}

bool MemoryBackend::exists(const std::string& key, const Deadline&) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(prefixKey(keyPrefix_, key));
    return it != entries_.end() && !it->second.isExpired(Clock::now());
}

void MemoryBackend::clear(const std::string& pattern, const Deadline&) {
    KeyPattern matcher(prefixKey(keyPrefix_, pattern));
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!matcher.isPrefix()) {
            removed = entries_.erase(matcher.stem());
        } else {
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (matcher.matches(it->first)) {
                    it = entries_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
    }
    logger_->debug("MemoryBackend: очистка по шаблону '{}', удалено {} записей", pattern, removed);
}

void MemoryBackend::ping(const Deadline&) {
}

bool MemoryBackend::isAvailable() const {
    return !closed_.load();
}

void MemoryBackend::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        stopCleanup_ = true;
    }
    cleanupCv_.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    logger_->info("MemoryBackend: закрыт, поток очистки остановлен");
}

size_t MemoryBackend::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

size_t MemoryBackend::removeExpired() {
    auto now = Clock::now();
    size_t removed = 0;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.isExpired(now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void MemoryBackend::cleanupThreadFunc() {
    std::unique_lock<std::mutex> lock(cleanupMutex_);
    while (!stopCleanup_) {
        if (cleanupCv_.wait_for(lock, cleanupInterval_, [this] { return stopCleanup_; })) {
            break;
        }
        lock.unlock();
        try {
            size_t removed = removeExpired();
            if (removed > 0) {
                logger_->debug("MemoryBackend: удалено {} просроченных записей", removed);
            }
        } catch (const std::exception& e) {
            logger_->error("MemoryBackend: ошибка очистки: {}", e.what());
        }
        lock.lock();
    }
}

// Вызывается под эксклюзивной блокировкой
void MemoryBackend::evictIfNeeded(Clock::time_point now) {
    if (maxSize_ == 0 || entries_.size() < maxSize_) {
        return;
    }

    for (auto it = entries_.begin(); it != entries_.end() && entries_.size() >= maxSize_;) {
        if (it->second.isExpired(now)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    // Произвольная запись, не LRU
    if (entries_.size() >= maxSize_) {
        entries_.erase(entries_.begin());
        ++evictions_;
    }
}

} // namespace cache
} // namespace flycache
