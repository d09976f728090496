#include "flycache/cache/backend/RemoteBackend.hpp"
#include "flycache/cache/base/KeyPattern.hpp"
#include "flycache/util/Logging.hpp"
#include <type_traits>

namespace flycache {
namespace cache {

RemoteBackend::RemoteBackend(remote::RemoteClientOptions options, std::string keyPrefix,
                             std::chrono::milliseconds retryInterval)
    : client_(std::make_unique<remote::RemoteClient>(std::move(options)))
    , keyPrefix_(std::move(keyPrefix))
    , retryInterval_(retryInterval)
    , logger_(util::componentLogger("remotecache")) {
}

RemoteBackend::~RemoteBackend() {
    close();
}

template<typename Fn>
auto RemoteBackend::guarded(const char* op, const std::string& key, Fn&& fn) -> decltype(fn()) {
    if (closed_.load()) {
        throw BackendUnavailableError(op, key, "backend is closed");
    }
    if (!available_.load()) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (Clock::now() - lastFailure_ < retryInterval_) {
            throw BackendUnavailableError(op, key, "backend marked unavailable");
        }
        // Разрешаем одну попытку после retryInterval; следующий сбой продлит паузу
        lastFailure_ = Clock::now();
    }

    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            markAvailable();
        } else {
            auto result = fn();
            markAvailable();
            return result;
        }
    } catch (const BackendUnavailableError& e) {
        markUnavailable(e.what());
        throw;
    }
}

std::optional<Bytes> RemoteBackend::get(const std::string& key, const Deadline& deadline) {
    auto value = guarded("get", key, [&] { return client_->get(prefixKey(keyPrefix_, key), deadline); });
    if (!value) {
        return std::nullopt;
    }
    return toBytes(*value);
}

void RemoteBackend::set(const std::string& key, const Bytes& value, Ttl ttl, const Deadline& deadline) {
    guarded("set", key, [&] { client_->set(prefixKey(keyPrefix_, key), toString(value), ttl, deadline); });
}

void RemoteBackend::remove(const std::string& key, const Deadline& deadline) {
    guarded("delete", key, [&] { client_->del({prefixKey(keyPrefix_, key)}, deadline); });
}

bool RemoteBackend::exists(const std::string& key, const Deadline& deadline) {
    return guarded("exists", key, [&] { return client_->exists(prefixKey(keyPrefix_, key), deadline); });
}

void RemoteBackend::clear(const std::string& pattern, const Deadline& deadline) {
    KeyPattern matcher(prefixKey(keyPrefix_, pattern));
    if (!matcher.isPrefix()) {
        guarded("clear", pattern, [&] { client_->del({matcher.stem()}, deadline); });
        return;
    }

    const std::string glob = matcher.toGlob();
    std::string cursor = "0";
    size_t removed = 0;
    do {
        auto page = guarded("clear", pattern, [&] {
            return client_->scan(cursor, glob, kScanBatch, deadline);
        });
        cursor = page.first;
        for (const auto& key : page.second) {
            // SCAN может вернуть ключ повторно; DEL отсутствующего ключа безвреден
            removed += static_cast<size_t>(guarded("clear", key, [&] { return client_->del({key}, deadline); }));
        }
    } while (cursor != "0");

    logger_->debug("RemoteBackend: очистка по шаблону '{}', удалено {} ключей", pattern, removed);
}

void RemoteBackend::ping(const Deadline& deadline) {
    if (closed_.load()) {
        available_ = false;
        throw BackendUnavailableError("ping", "", "backend is closed");
    }
    try {
        client_->ping(deadline);
    } catch (const PoolTimeoutError&) {
        // Занятость пула не говорит о недоступности сервера
        throw;
    } catch (const BackendError& e) {
        markUnavailable(e.what());
        throw;
    }
    markAvailable();
    client_->fillIdle(deadline);
}

bool RemoteBackend::isAvailable() const {
    return available_.load() && !closed_.load();
}

void RemoteBackend::close() {
    if (closed_.exchange(true)) {
        return;
    }
    client_->close();
    logger_->info("RemoteBackend: соединения закрыты");
}

void RemoteBackend::markUnavailable(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        lastFailure_ = Clock::now();
    }
    if (available_.exchange(false)) {
        logger_->warn("RemoteBackend: сервер недоступен: {}", reason);
    }
}

void RemoteBackend::markAvailable() {
    if (!available_.exchange(true)) {
        logger_->info("RemoteBackend: соединение с сервером восстановлено");
    }
}

} // namespace cache
} // namespace flycache
