#pragma once

#include <string>

namespace flycache {
namespace cache {

/**
 * @brief Шаблон очистки кэша.
 *
 * Поддерживается только точное совпадение и один '*' в конце
 * ("user:*"). Любые другие символы, включая '*' в середине, сравниваются
 * буквально.
 */
class KeyPattern {
public:
    explicit KeyPattern(const std::string& pattern);

    bool isPrefix() const { return prefix_; }
    /// Точный ключ или префикс (без завершающей '*').
    const std::string& stem() const { return stem_; }

    bool matches(const std::string& key) const;

    /// Шаблон с экранированными glob-символами для SCAN MATCH удалённого сервера.
    std::string toGlob() const;

private:
    std::string stem_;
    bool prefix_ = false;
};

/// Добавить префикс пространства имён: "prefix:key" или key без префикса.
std::string prefixKey(const std::string& prefix, const std::string& key);

} // namespace cache
} // namespace flycache
