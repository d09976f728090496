#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include "flycache/cache/base/CacheBackend.hpp"
#include "flycache/cache/remote/RemoteClient.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Адаптер удалённого key/value сервера (протокол RESP) к контракту кэша.
 *
 * Отсутствие ключа превращается в промах, любые другие сбои клиента в
 * BackendError/BackendUnavailableError. clear() с '*' выполняется через
 * пошаговый SCAN и удаление каждого найденного ключа, без атомарности.
 *
 * Сбой соединения помечает адаптер недоступным. Пока он недоступен,
 * операции сразу завершаются BackendUnavailableError, не обращаясь к сети,
 * пока с момента сбоя не пройдёт retryInterval. ping() всегда обращается
 * к серверу и обновляет флаг доступности.
 */
class RemoteBackend : public CacheBackend {
public:
    RemoteBackend(remote::RemoteClientOptions options, std::string keyPrefix,
                  std::chrono::milliseconds retryInterval);
    ~RemoteBackend() override;

    std::optional<Bytes> get(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    void set(const std::string& key, const Bytes& value, Ttl ttl,
             const Deadline& deadline = Deadline::none()) override;
    void remove(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    bool exists(const std::string& key, const Deadline& deadline = Deadline::none()) override;
    void clear(const std::string& pattern, const Deadline& deadline = Deadline::none()) override;
    void ping(const Deadline& deadline = Deadline::none()) override;
    bool isAvailable() const override;
    void close() override;
    std::string name() const override { return "remote"; }

    remote::PoolStats poolStats() const { return client_->stats(); }

    /// Ключей, запрашиваемых за одну итерацию SCAN.
    static constexpr size_t kScanBatch = 100;

private:
    // Выполнить операцию с учётом флага доступности
    template<typename Fn>
    auto guarded(const char* op, const std::string& key, Fn&& fn) -> decltype(fn());

    void markUnavailable(const std::string& reason);
    void markAvailable();

    std::unique_ptr<remote::RemoteClient> client_;
    std::string keyPrefix_;
    std::chrono::milliseconds retryInterval_;

    std::atomic<bool> available_{true};
    std::atomic<bool> closed_{false};
    mutable std::mutex stateMutex_;
    Clock::time_point lastFailure_{};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace flycache
