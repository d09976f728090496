#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flycache {
namespace cache {

using Bytes = std::vector<uint8_t>;
using Clock = std::chrono::steady_clock;
using Ttl = std::chrono::milliseconds;

inline Bytes toBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

inline std::string toString(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

/**
 * @brief Крайний срок операции с кэшем.
 *
 * Пустой Deadline означает "без ограничения". Каждая операция контракта
 * принимает Deadline; локальные бэкенды его игнорируют, удалённый
 * использует для таймаутов соединения и ввода-вывода.
 */
class Deadline {
public:
    Deadline() = default;

    static Deadline none() { return Deadline(); }

    static Deadline at(Clock::time_point tp) {
        Deadline d;
        d.at_ = tp;
        return d;
    }

    template<typename Rep, typename Period>
    static Deadline after(std::chrono::duration<Rep, Period> timeout) {
        return at(Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout));
    }

    /// Более ранний из двух сроков (отсутствующий срок считается бесконечным).
    static Deadline earliest(const Deadline& a, const Deadline& b) {
        if (!a.at_) return b;
        if (!b.at_) return a;
        return *a.at_ < *b.at_ ? a : b;
    }

    bool isSet() const { return at_.has_value(); }

    bool expired() const { return at_ && Clock::now() >= *at_; }

    /// Оставшееся время; std::nullopt если срок не задан, ноль если истёк.
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!at_) return std::nullopt;
        auto now = Clock::now();
        if (now >= *at_) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(*at_ - now);
    }

    std::optional<Clock::time_point> timePoint() const { return at_; }

private:
    std::optional<Clock::time_point> at_;
};

/**
 * @brief Запись кэша.
 *
 * Принадлежит бэкенду, копируется при чтении и записи.
 * expiresAt == std::nullopt означает бессрочную запись.
 */
struct CacheEntry {
    Bytes value;
    std::optional<Clock::time_point> expiresAt;

    bool isExpired(Clock::time_point now) const {
        return expiresAt && now >= *expiresAt;
    }
};

} // namespace cache
} // namespace flycache
