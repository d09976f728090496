#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace flycache {
namespace cache {
namespace remote {

/**
 * @brief Ответ сервера в протоколе RESP2.
 */
struct RespValue {
    enum class Type {
        SimpleString,
        Error,
        Integer,
        BulkString,
        Array,
        Null
    };

    Type type = Type::Null;
    std::string str;          ///< SimpleString, Error, BulkString
    long long integer = 0;    ///< Integer
    std::vector<RespValue> elements; ///< Array

    bool isNull() const { return type == Type::Null; }
    bool isError() const { return type == Type::Error; }
};

/// Закодировать команду как массив bulk-строк.
std::string encodeCommand(const std::vector<std::string>& args);

/**
 * @brief Инкрементальный разборщик ответов RESP2.
 *
 * Данные подаются через feed(), next() возвращает очередной полностью
 * полученный ответ или std::nullopt, если данных пока недостаточно.
 * @throws std::runtime_error при нарушении протокола
 */
class RespReader {
public:
    void feed(const char* data, size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    std::optional<RespValue> next();

    size_t buffered() const { return buffer_.size() - pos_; }

private:
    // false если данных недостаточно; pos продвигается только при успехе
    bool parseValue(size_t& pos, RespValue& out, int depth) const;
    bool readLine(size_t& pos, std::string& line) const;

    std::string buffer_;
    size_t pos_ = 0;
};

} // namespace remote
} // namespace cache
} // namespace flycache
