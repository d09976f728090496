#pragma once

#include <memory>
#include "flycache/cache/CacheConfig.hpp"
#include "flycache/cache/base/CacheBackend.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Выбор бэкенда кэша по конфигурации (однократно при старте).
 *
 * - кэш выключен: NoOpBackend;
 * - тип remote и задан remoteUrl: RemoteBackend, проверенный ping в пределах
 *   pingTimeout; если сервер недоступен, MemoryBackend с предупреждением;
 * - иначе MemoryBackend.
 *
 * @throws ConfigurationError при некорректной конфигурации или строке подключения
 */
class BackendSelector {
public:
    static std::shared_ptr<CacheBackend> initialize(const CacheConfig& config);

private:
    static std::shared_ptr<CacheBackend> makeMemory(const CacheConfig& config);
};

} // namespace cache
} // namespace flycache
