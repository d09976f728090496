#pragma once

#include "flycache/cache/base/CacheBackend.hpp"

namespace flycache {
namespace cache {

// Бэкенд для выключенного кэширования: всегда промах, запись молча принимается
class NoOpBackend : public CacheBackend {
public:
    std::optional<Bytes> get(const std::string&, const Deadline& = Deadline::none()) override {
        return std::nullopt;
    }
    void set(const std::string&, const Bytes&, Ttl, const Deadline& = Deadline::none()) override {}
    void remove(const std::string&, const Deadline& = Deadline::none()) override {}
    bool exists(const std::string&, const Deadline& = Deadline::none()) override { return false; }
    void clear(const std::string&, const Deadline& = Deadline::none()) override {}
    void ping(const Deadline& = Deadline::none()) override {}
    bool isAvailable() const override { return false; }
    void close() override {}
    std::string name() const override { return "noop"; }
};

} // namespace cache
} // namespace flycache
