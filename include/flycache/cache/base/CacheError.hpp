#pragma once

#include <stdexcept>
#include <string>

namespace flycache {
namespace cache {

/**
 * @brief Базовая ошибка кэша.
 *
 * Промах (отсутствующий или просроченный ключ) ошибкой не является и
 * возвращается как std::nullopt. Исключения используются только для
 * настоящих сбоев бэкенда, сериализации и конфигурации.
 */
class CacheError : public std::runtime_error {
public:
    CacheError(const std::string& op, const std::string& key, const std::string& reason);

    const std::string& op() const noexcept { return op_; }
    const std::string& key() const noexcept { return key_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string op_;
    std::string key_;
    std::string reason_;
};

/// Сбой бэкенда при выполнении операции (ошибка протокола, ввода-вывода).
class BackendError : public CacheError {
public:
    using CacheError::CacheError;
};

/// Все соединения пула заняты до истечения срока. Сервер при этом исправен.
class PoolTimeoutError : public BackendError {
public:
    using BackendError::BackendError;
};

/// Бэкенд недоступен (нет соединения, не прошёл ping).
class BackendUnavailableError : public BackendError {
public:
    using BackendError::BackendError;
};

/// Ошибка кодирования или декодирования структурированного значения.
class SerializationError : public CacheError {
public:
    using CacheError::CacheError;
};

/// Некорректная конфигурация (например, строка подключения) при старте.
class ConfigurationError : public CacheError {
public:
    ConfigurationError(const std::string& setting, const std::string& reason);
};

} // namespace cache
} // namespace flycache
