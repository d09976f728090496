#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace flycache {
namespace util {

/**
 * @brief Получить именованный логгер компонента.
 *
 * Если логгер с таким именем ещё не зарегистрирован, создаётся ротируемый
 * файловый логгер `logs/<name>.log` (5 МБ × 3 файла). Если файл открыть не
 * удалось, возвращается логгер по умолчанию, поэтому результат никогда не
 * бывает nullptr.
 *
 * @param name Имя компонента (например, "memorycache")
 * @return Логгер компонента
 */
std::shared_ptr<spdlog::logger> componentLogger(const std::string& name);

} // namespace util
} // namespace flycache
