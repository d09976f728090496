#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "flycache/cache/CacheConfig.hpp"
#include "flycache/cache/base/CacheTypes.hpp"
#include "flycache/cache/remote/RemoteConnection.hpp"

namespace flycache {
namespace cache {
namespace remote {

/**
 * @brief Параметры клиента удалённого кэша.
 */
struct RemoteClientOptions {
    RemoteTarget target;                       ///< Адрес, учётные данные, номер БД
    size_t poolSize = 10;                      ///< Максимум соединений
    size_t minIdleConns = 2;                   ///< Сколько соединений держать открытыми заранее
    size_t maxIdleConns = 5;                   ///< Максимум простаивающих соединений
    std::chrono::milliseconds connMaxIdleTime = std::chrono::minutes(5);
    std::chrono::milliseconds connMaxLifetime = std::chrono::minutes(30);
    std::chrono::milliseconds connectTimeout = std::chrono::seconds(3);
    std::chrono::milliseconds ioTimeout = std::chrono::seconds(3);

    /// @throws ConfigurationError если строка подключения некорректна
    static RemoteClientOptions fromConfig(const CacheConfig& config);
};

/// Состояние пула соединений.
struct PoolStats {
    size_t open = 0;   ///< Всего открытых соединений
    size_t idle = 0;   ///< Из них свободных
    size_t created = 0; ///< Создано за всё время
};

/**
 * @brief Клиент RESP-сервера с ограниченным пулом соединений.
 *
 * Соединение берётся из пула на время одной команды. Если все poolSize
 * соединений заняты, вызов ждёт освобождения до истечения срока.
 * Новые соединения проходят AUTH и SELECT.
 *
 * @note Потокобезопасен
 */
class RemoteClient {
public:
    explicit RemoteClient(RemoteClientOptions options);
    ~RemoteClient();

    RemoteClient(const RemoteClient&) = delete;
    RemoteClient& operator=(const RemoteClient&) = delete;

    /**
     * @brief Выполнить произвольную команду.
     * @throws BackendUnavailableError, BackendError
     */
    RespValue execute(const std::vector<std::string>& args, const Deadline& deadline);

    /// GET; std::nullopt если ключа нет.
    std::optional<std::string> get(const std::string& key, const Deadline& deadline);
    /// SET с PX при ttl > 0.
    void set(const std::string& key, const std::string& value, Ttl ttl, const Deadline& deadline);
    /// DEL; возвращает число удалённых ключей.
    long long del(const std::vector<std::string>& keys, const Deadline& deadline);
    bool exists(const std::string& key, const Deadline& deadline);

    /**
     * @brief Одна итерация SCAN.
     * @return Следующий курсор ("0" если обход завершён) и найденные ключи
     */
    std::pair<std::string, std::vector<std::string>> scan(const std::string& cursor,
                                                          const std::string& match,
                                                          size_t count,
                                                          const Deadline& deadline);
    void ping(const Deadline& deadline);

    /// Открыть соединения до minIdleConns. Ошибки только логируются.
    void fillIdle(const Deadline& deadline);

    /// Закрыть все свободные соединения; занятые закроются при возврате.
    void close();

    PoolStats stats() const;
    const RemoteClientOptions& options() const { return options_; }

private:
    class Lease;

    std::unique_ptr<RemoteConnection> acquire(const Deadline& deadline);
    void release(std::unique_ptr<RemoteConnection> conn);
    std::unique_ptr<RemoteConnection> connect(const Deadline& deadline);
    bool isStale(const RemoteConnection& conn, Clock::time_point now) const;
    RespValue expectOk(const RespValue& reply, const char* op, const std::string& key) const;

    RemoteClientOptions options_;
    std::string endpoint_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::deque<std::unique_ptr<RemoteConnection>> idle_;
    size_t open_ = 0;
    size_t created_ = 0;
    bool closed_ = false;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace remote
} // namespace cache
} // namespace flycache
