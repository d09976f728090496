#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "flycache/cache/CacheConfig.hpp"
#include "flycache/cache/base/CacheTypes.hpp"
#include "flycache/cache/remote/RespCodec.hpp"

namespace flycache {
namespace cache {
namespace remote {

/**
 * @brief Одно блокирующее TCP-соединение с сервером RESP.
 *
 * Все операции ограничены сроком: min(deadline, ioTimeout) для обмена и
 * min(deadline, connectTimeout) для подключения. После любого сбоя
 * ввода-вывода соединение помечается как сломанное и не возвращается в пул.
 */
class RemoteConnection {
public:
    /**
     * @brief Установить соединение.
     * @throws BackendUnavailableError если подключиться не удалось
     */
    static std::unique_ptr<RemoteConnection> open(const RemoteTarget& target,
                                                  std::chrono::milliseconds connectTimeout,
                                                  std::chrono::milliseconds ioTimeout,
                                                  const Deadline& deadline);

    ~RemoteConnection();

    RemoteConnection(const RemoteConnection&) = delete;
    RemoteConnection& operator=(const RemoteConnection&) = delete;

    /**
     * @brief Отправить команду и дождаться ответа.
     *
     * Ответ-ошибка сервера (-ERR) возвращается как RespValue::Type::Error.
     * @throws BackendUnavailableError при сбое или таймауте ввода-вывода
     * @throws BackendError при нарушении протокола
     */
    RespValue execute(const std::vector<std::string>& args, const Deadline& deadline);

    bool isBroken() const { return broken_; }
    Clock::time_point createdAt() const { return createdAt_; }
    Clock::time_point lastUsed() const { return lastUsed_; }

private:
    RemoteConnection(int fd, std::chrono::milliseconds ioTimeout, std::string endpoint);

    void sendAll(const std::string& data, const Deadline& deadline);
    void receiveSome(const Deadline& deadline);
    int waitFor(short events, const Deadline& deadline);

    int fd_;
    std::chrono::milliseconds ioTimeout_;
    std::string endpoint_;
    RespReader reader_;
    bool broken_ = false;
    Clock::time_point createdAt_;
    Clock::time_point lastUsed_;
};

} // namespace remote
} // namespace cache
} // namespace flycache
