#pragma once

#include <cstdint>
#include <string>

namespace flycache {
namespace cache {
namespace keys {

// Построители ключей кэша приложения

inline const std::string FEATURE_FLAGS = "feature_flags:all";

inline std::string user(const std::string& userId) {
    return "user:" + userId;
}

inline std::string user(uint64_t userId) {
    return user(std::to_string(userId));
}

inline std::string session(const std::string& sessionId) {
    return "session:" + sessionId;
}

// Отозванный токен по префиксу его хеша
inline std::string blacklist(const std::string& hashPrefix) {
    return "blacklist:" + hashPrefix;
}

inline std::string orgBySlug(const std::string& slug) {
    return "org:slug:" + slug;
}

inline std::string orgById(const std::string& orgId) {
    return "org:id:" + orgId;
}

inline std::string orgById(uint64_t orgId) {
    return orgById(std::to_string(orgId));
}

inline std::string membership(const std::string& orgId, const std::string& userId) {
    return "membership:" + orgId + ":" + userId;
}

inline std::string membership(uint64_t orgId, uint64_t userId) {
    return membership(std::to_string(orgId), std::to_string(userId));
}

} // namespace keys
} // namespace cache
} // namespace flycache
