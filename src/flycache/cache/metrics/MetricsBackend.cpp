#include "flycache/cache/metrics/MetricsBackend.hpp"
#include <stdexcept>
#include <type_traits>

namespace flycache {
namespace cache {

void MetricsBackend::AtomicTiming::record(uint64_t micros) {
    count.fetch_add(1, std::memory_order_relaxed);
    totalMicros.fetch_add(micros, std::memory_order_relaxed);
    uint64_t current = maxMicros.load(std::memory_order_relaxed);
    while (micros > current && !maxMicros.compare_exchange_weak(current, micros, std::memory_order_relaxed)) {
    }
}

OperationTiming MetricsBackend::AtomicTiming::load() const {
    OperationTiming t;
    t.count = count.load(std::memory_order_relaxed);
    t.totalMicros = totalMicros.load(std::memory_order_relaxed);
    t.maxMicros = maxMicros.load(std::memory_order_relaxed);
    return t;
}

void MetricsBackend::AtomicTiming::reset() {
    count = 0;
    totalMicros = 0;
    maxMicros = 0;
}

MetricsBackend::MetricsBackend(std::shared_ptr<CacheBackend> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        throw std::invalid_argument("MetricsBackend: пустой внутренний бэкенд");
    }
}

template<typename Fn>
auto MetricsBackend::timed(AtomicTiming& timing, Fn&& fn) -> decltype(fn()) {
    auto start = Clock::now();
    auto elapsed = [&] {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count());
    };
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            timing.record(elapsed());
        } else {
            auto result = fn();
            timing.record(elapsed());
            return result;
        }
    } catch (...) {
        timing.record(elapsed());
        errors_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

std::optional<Bytes> MetricsBackend::get(const std::string& key, const Deadline& deadline) {
    auto value = timed(getTiming_, [&] { return inner_->get(key, deadline); });
    if (value) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return value;
}

void MetricsBackend::set(const std::string& key, const Bytes& value, Ttl ttl, const Deadline& deadline) {
    timed(setTiming_, [&] { inner_->set(key, value, ttl, deadline); });
}

void MetricsBackend::remove(const std::string& key, const Deadline& deadline) {
    timed(deleteTiming_, [&] { inner_->remove(key, deadline); });
}

bool MetricsBackend::exists(const std::string& key, const Deadline& deadline) {
    return inner_->exists(key, deadline);
}

void MetricsBackend::clear(const std::string& pattern, const Deadline& deadline) {
    timed(clearTiming_, [&] { inner_->clear(pattern, deadline); });
}

void MetricsBackend::ping(const Deadline& deadline) {
    inner_->ping(deadline);
}

bool MetricsBackend::isAvailable() const {
    return inner_->isAvailable();
}

void MetricsBackend::close() {
    inner_->close();
}

std::string MetricsBackend::name() const {
    return inner_->name();
}

double MetricsBackend::hitRate() const {
    return computeHitRate(hits_.load(), misses_.load());
}

CacheMetrics MetricsBackend::snapshot() const {
    CacheMetrics metrics;
    metrics.hits = hits_.load();
    metrics.misses = misses_.load();
    metrics.errors = errors_.load();
    metrics.hitRate = computeHitRate(metrics.hits, metrics.misses);
    metrics.getTiming = getTiming_.load();
    metrics.setTiming = setTiming_.load();
    metrics.deleteTiming = deleteTiming_.load();
    metrics.clearTiming = clearTiming_.load();
    metrics.lastUpdate = Clock::now();
    return metrics;
}

void MetricsBackend::resetCounters() {
    hits_ = 0;
    misses_ = 0;
    errors_ = 0;
    getTiming_.reset();
    setTiming_.reset();
    deleteTiming_.reset();
    clearTiming_.reset();
}

} // namespace cache
} // namespace flycache
