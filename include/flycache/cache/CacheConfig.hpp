#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace flycache {
namespace cache {

enum class BackendType {
    Memory,
    Remote
};

/// Предметные области с собственным TTL по умолчанию.
enum class TtlDomain {
    Default,
    HealthCheck,
    UserProfile,
    Session,
    Organization,
    Membership
};

BackendType parseBackendType(const std::string& value);
std::string toString(BackendType type);

/**
 * @brief Разобранная строка подключения удалённого кэша.
 *
 * Формат: redis://[[user]:password@]host[:port][/db]
 */
struct RemoteTarget {
    std::string host;
    uint16_t port = 6379;
    std::string username;
    std::string password;
    uint32_t db = 0;

    /// @throws ConfigurationError если строка некорректна
    static RemoteTarget parse(const std::string& url);
};

// Унифицированная конфигурация кэша. Неизменяема после создания бэкенда.
struct CacheConfig {
    // общие параметры
    bool enabled = false;
    BackendType type = BackendType::Memory;
    std::string keyPrefix = "app";

    // удалённый бэкенд
    std::string remoteUrl;
    size_t poolSize = 10;
    size_t minIdleConns = 2;
    size_t maxIdleConns = 5;
    std::chrono::milliseconds connMaxIdleTime = std::chrono::minutes(5);
    std::chrono::milliseconds connMaxLifetime = std::chrono::minutes(30);
    std::chrono::milliseconds connectTimeout = std::chrono::seconds(3);
    std::chrono::milliseconds ioTimeout = std::chrono::seconds(3);
    std::chrono::milliseconds pingTimeout = std::chrono::seconds(5);
    std::chrono::milliseconds retryInterval = std::chrono::seconds(5);

    // кэш в памяти
    size_t memoryMaxSize = 10000;
    std::chrono::milliseconds memoryCleanupInterval = std::chrono::minutes(1);

    // TTL по умолчанию
    std::chrono::milliseconds defaultTTL = std::chrono::minutes(5);
    std::chrono::milliseconds healthCheckTTL = std::chrono::seconds(30);
    std::chrono::milliseconds userProfileTTL = std::chrono::minutes(2);
    std::chrono::milliseconds sessionTTL = std::chrono::minutes(15);
    std::chrono::milliseconds organizationTTL = std::chrono::minutes(5);
    std::chrono::milliseconds membershipTTL = std::chrono::minutes(5);

    static CacheConfig defaults() { return CacheConfig{}; }

    /**
     * @brief Загрузка из переменных окружения поверх значений по умолчанию.
     *
     * Некорректные и неположительные числа игнорируются. REDIS_URL
     * автоматически переключает тип на удалённый.
     *
     * @throws ConfigurationError при неизвестном CACHE_TYPE
     */
    static CacheConfig fromEnvironment();

    /**
     * @brief Загрузка из JSON. Отсутствующие поля сохраняют значения по умолчанию.
     * @throws ConfigurationError при неверных типах полей или значениях
     */
    static CacheConfig fromJson(const nlohmann::json& j);

    /// @throws ConfigurationError если файл не читается или не является JSON
    static CacheConfig loadFromFile(const std::string& path);

    nlohmann::json toJson() const;

    /// TTL для предметной области.
    std::chrono::milliseconds ttlFor(TtlDomain domain) const;

    bool validate() const {
        if (memoryCleanupInterval.count() <= 0) return false;
        if (type == BackendType::Remote) {
            if (poolSize == 0) return false;
            if (minIdleConns > poolSize || maxIdleConns > poolSize) return false;
            if (pingTimeout.count() <= 0) return false;
        }
        return defaultTTL.count() > 0;
    }
};

} // namespace cache
} // namespace flycache
