#include "flycache/cache/remote/RespCodec.hpp"
#include <stdexcept>

namespace flycache {
namespace cache {
namespace remote {

namespace {

constexpr int kMaxDepth = 16;
constexpr long long kMaxBulkLength = 512LL * 1024 * 1024;
constexpr long long kMaxArrayLength = 1024LL * 1024;

long long parseInteger(const std::string& text) {
    if (text.empty()) {
        throw std::runtime_error("RESP: пустое целое");
    }
    size_t idx = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &idx);
    } catch (const std::exception&) {
        throw std::runtime_error("RESP: некорректное целое '" + text + "'");
    }
    if (idx != text.size()) {
        throw std::runtime_error("RESP: некорректное целое '" + text + "'");
    }
    return value;
}

} // namespace

std::string encodeCommand(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a;
        out += "\r\n";
    }
    return out;
}

void RespReader::feed(const char* data, size_t size) {
    // Сжимаем буфер, когда обработанная часть стала большой
    if (pos_ > 0 && pos_ >= buffer_.size() / 2) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    buffer_.append(data, size);
}

std::optional<RespValue> RespReader::next() {
    size_t pos = pos_;
    RespValue value;
    if (!parseValue(pos, value, 0)) {
        return std::nullopt;
    }
    pos_ = pos;
    return value;
}

bool RespReader::readLine(size_t& pos, std::string& line) const {
    auto crlf = buffer_.find("\r\n", pos);
    if (crlf == std::string::npos) {
        return false;
    }
    line = buffer_.substr(pos, crlf - pos);
    pos = crlf + 2;
    return true;
}

bool RespReader::parseValue(size_t& pos, RespValue& out, int depth) const {
    if (depth > kMaxDepth) {
        throw std::runtime_error("RESP: превышена глубина вложенности");
    }
    if (pos >= buffer_.size()) {
        return false;
    }

    char marker = buffer_[pos];
    size_t cursor = pos + 1;
    std::string line;
    if (!readLine(cursor, line)) {
        return false;
    }

    switch (marker) {
        case '+':
            out.type = RespValue::Type::SimpleString;
            out.str = std::move(line);
            break;
        case '-':
            out.type = RespValue::Type::Error;
            out.str = std::move(line);
            break;
        case ':':
            out.type = RespValue::Type::Integer;
            out.integer = parseInteger(line);
            break;
        case '$': {
            long long len = parseInteger(line);
            if (len == -1) {
                out.type = RespValue::Type::Null;
                break;
            }
            if (len < 0 || len > kMaxBulkLength) {
                throw std::runtime_error("RESP: недопустимая длина bulk-строки " + line);
            }
            size_t end = cursor + static_cast<size_t>(len);
            if (end + 2 > buffer_.size()) {
                return false;
            }
            if (buffer_.compare(end, 2, "\r\n") != 0) {
                throw std::runtime_error("RESP: bulk-строка без завершающего CRLF");
            }
            out.type = RespValue::Type::BulkString;
            out.str = buffer_.substr(cursor, static_cast<size_t>(len));
            cursor = end + 2;
            break;
        }
        case '*': {
            long long count = parseInteger(line);
            if (count == -1) {
                out.type = RespValue::Type::Null;
                break;
            }
            if (count < 0 || count > kMaxArrayLength) {
                throw std::runtime_error("RESP: недопустимая длина массива " + line);
            }
            out.type = RespValue::Type::Array;
            out.elements.clear();
            out.elements.reserve(static_cast<size_t>(count));
            for (long long i = 0; i < count; ++i) {
                RespValue element;
                if (!parseValue(cursor, element, depth + 1)) {
                    return false;
                }
                out.elements.push_back(std::move(element));
            }
            break;
        }
        default:
            throw std::runtime_error(std::string("RESP: неизвестный тип ответа '") + marker + "'");
    }

    pos = cursor;
    return true;
}

} // namespace remote
} // namespace cache
} // namespace flycache
