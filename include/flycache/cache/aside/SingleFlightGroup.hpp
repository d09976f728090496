#pragma once

#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace flycache {
namespace cache {

/**
 * @brief Объединение одновременных вызовов с одинаковым ключом.
 *
 * Первый вызывающий выполняет функцию, остальные ждут её результата на
 * std::shared_future. Исключение функции получают все ожидающие.
 * Запись о вызове удаляется сразу по завершении, поэтому следующий
 * вызов с тем же ключом выполняется заново. Разные ключи не блокируют
 * друг друга.
 */
template<typename T>
class SingleFlightGroup {
public:
    struct Result {
        T value;
        bool shared;    // Результат получен из чужого вызова
    };

    template<typename Fn>
    Result run(const std::string& key, Fn&& fn) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        if (it != calls_.end()) {
            auto future = it->second;
            lock.unlock();
            return Result{future.get(), true};
        }

        std::promise<T> promise;
        calls_.emplace(key, promise.get_future().share());
        lock.unlock();

        try {
            T value = fn();
            forget(key);
            promise.set_value(value);
            return Result{std::move(value), false};
        } catch (...) {
            forget(key);
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    size_t inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    void forget(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.erase(key);
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<T>> calls_;
};

} // namespace cache
} // namespace flycache
