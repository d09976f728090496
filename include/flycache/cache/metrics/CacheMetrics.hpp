#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

namespace flycache {
namespace cache {

// Агрегат времени выполнения одной операции
struct OperationTiming {
    uint64_t count = 0;              // Количество вызовов
    uint64_t totalMicros = 0;        // Суммарное время (мкс)
    uint64_t maxMicros = 0;          // Максимальное время (мкс)

    double averageMicros() const {
        return count == 0 ? 0.0 : static_cast<double>(totalMicros) / static_cast<double>(count);
    }

    nlohmann::json toJson() const {
        return {
            {"count", count},
            {"totalMicros", totalMicros},
            {"maxMicros", maxMicros},
            {"averageMicros", averageMicros()}
        };
    }
};

struct CacheMetrics {
    uint64_t hits = 0;              // Попадания
    uint64_t misses = 0;            // Промахи
    uint64_t errors = 0;            // Ошибки бэкенда (любой операции)
    double hitRate = 0.0;           // Доля попаданий, %
    OperationTiming getTiming;
    OperationTiming setTiming;
    OperationTiming deleteTiming;
    OperationTiming clearTiming;
    std::chrono::steady_clock::time_point lastUpdate; // Время снимка

    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"errors", errors},
            {"hitRate", hitRate},
            {"get", getTiming.toJson()},
            {"set", setTiming.toJson()},
            {"delete", deleteTiming.toJson()},
            {"clear", clearTiming.toJson()},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

/// Процент попаданий; 0 если обращений не было.
inline double computeHitRate(uint64_t hits, uint64_t misses) {
    const uint64_t total = hits + misses;
    if (total == 0) return 0.0;
    return static_cast<double>(hits) / static_cast<double>(total) * 100.0;
}

} // namespace cache
} // namespace flycache
