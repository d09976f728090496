#include "flycache/cache/CacheConfig.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace flycache {
namespace cache {

namespace {

constexpr const char* kScheme = "redis://";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseUnsigned(const std::string& s, unsigned long long maxValue, unsigned long long& out) {
    if (s.empty() || s.size() > 20) return false;
    unsigned long long value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned long long>(c - '0');
        if (value > maxValue) return false;
    }
    out = value;
    return true;
}

const char* getEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return nullptr;
    return value;
}

// Положительное целое из окружения; иначе значение не меняется
template<typename T>
void envPositive(const char* name, T& target) {
    const char* raw = getEnv(name);
    if (!raw) return;
    unsigned long long value = 0;
    if (parseUnsigned(raw, std::numeric_limits<int>::max(), value) && value > 0) {
        target = static_cast<T>(value);
    } else {
        spdlog::warn("Некорректное значение {}={}, используется значение по умолчанию", name, raw);
    }
}

void envNonNegative(const char* name, size_t& target) {
    const char* raw = getEnv(name);
    if (!raw) return;
    unsigned long long value = 0;
    if (parseUnsigned(raw, std::numeric_limits<int>::max(), value)) {
        target = static_cast<size_t>(value);
    } else {
        spdlog::warn("Некорректное значение {}={}, используется значение по умолчанию", name, raw);
    }
}

void envSeconds(const char* name, std::chrono::milliseconds& target) {
    long long seconds = 0;
    envPositive(name, seconds);
    if (seconds > 0) {
        target = std::chrono::seconds(seconds);
    }
}

template<typename T>
void readField(const nlohmann::json& j, const char* field, T& target) {
    if (j.contains(field) && !j.at(field).is_null()) {
        target = j.at(field).get<T>();
    }
}

void readSeconds(const nlohmann::json& j, const char* field, std::chrono::milliseconds& target) {
    if (j.contains(field) && !j.at(field).is_null()) {
        target = std::chrono::seconds(j.at(field).get<long long>());
    }
}

void readMillis(const nlohmann::json& j, const char* field, std::chrono::milliseconds& target) {
    if (j.contains(field) && !j.at(field).is_null()) {
        target = std::chrono::milliseconds(j.at(field).get<long long>());
    }
}

} // namespace

BackendType parseBackendType(const std::string& value) {
    auto lower = toLower(value);
    if (lower == "memory") return BackendType::Memory;
    if (lower == "remote" || lower == "redis") return BackendType::Remote;
    throw ConfigurationError("type", "unknown backend type '" + value + "'");
}

std::string toString(BackendType type) {
    return type == BackendType::Remote ? "remote" : "memory";
}

RemoteTarget RemoteTarget::parse(const std::string& url) {
    const std::string scheme(kScheme);
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw ConfigurationError("remoteUrl", "unsupported scheme in '" + url + "', expected redis://");
    }

    std::string rest = url.substr(scheme.size());
    auto query = rest.find('?');
    if (query != std::string::npos) {
        rest.erase(query);
    }

    RemoteTarget target;

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = rest.substr(0, at);
        rest.erase(0, at + 1);
        auto colon = userinfo.find(':');
        if (colon == std::string::npos) {
            target.username = userinfo;
        } else {
            target.username = userinfo.substr(0, colon);
            target.password = userinfo.substr(colon + 1);
        }
    }

    std::string hostport = rest;
    std::string path;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        hostport = rest.substr(0, slash);
        path = rest.substr(slash + 1);
    }

    std::string portText;
    if (!hostport.empty() && hostport.front() == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos) {
            throw ConfigurationError("remoteUrl", "unterminated IPv6 address in '" + url + "'");
        }
        target.host = hostport.substr(1, close - 1);
        std::string tail = hostport.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                throw ConfigurationError("remoteUrl", "malformed host in '" + url + "'");
            }
            portText = tail.substr(1);
        }
    } else {
        auto colon = hostport.find(':');
        target.host = hostport.substr(0, colon);
        if (colon != std::string::npos) {
            portText = hostport.substr(colon + 1);
        }
    }

    if (target.host.empty()) {
        throw ConfigurationError("remoteUrl", "missing host in '" + url + "'");
    }

    if (!portText.empty()) {
        unsigned long long port = 0;
        if (!parseUnsigned(portText, 65535, port) || port == 0) {
            throw ConfigurationError("remoteUrl", "invalid port '" + portText + "'");
        }
        target.port = static_cast<uint16_t>(port);
    } else if (hostport.back() == ':') {
        throw ConfigurationError("remoteUrl", "empty port in '" + url + "'");
    }

    if (!path.empty()) {
        unsigned long long db = 0;
        if (!parseUnsigned(path, std::numeric_limits<uint32_t>::max(), db)) {
            throw ConfigurationError("remoteUrl", "invalid database index '" + path + "'");
        }
        target.db = static_cast<uint32_t>(db);
    }

    return target;
}

CacheConfig CacheConfig::fromEnvironment() {
    CacheConfig config;

    if (const char* enabled = getEnv("CACHE_ENABLED")) {
        config.enabled = toLower(enabled) == "true";
    }
    if (const char* type = getEnv("CACHE_TYPE")) {
        config.type = parseBackendType(type);
    }
    if (const char* prefix = getEnv("CACHE_KEY_PREFIX")) {
        config.keyPrefix = prefix;
    }
    if (const char* url = getEnv("REDIS_URL")) {
        config.remoteUrl = url;
        config.type = BackendType::Remote;
    }

    envPositive("REDIS_POOL_SIZE", config.poolSize);
    envNonNegative("REDIS_MIN_IDLE_CONNS", config.minIdleConns);
    envNonNegative("REDIS_MAX_IDLE_CONNS", config.maxIdleConns);
    envPositive("CACHE_MEMORY_MAX_SIZE", config.memoryMaxSize);

    envSeconds("CACHE_DEFAULT_TTL", config.defaultTTL);
    envSeconds("CACHE_HEALTH_CHECK_TTL", config.healthCheckTTL);
    envSeconds("CACHE_USER_PROFILE_TTL", config.userProfileTTL);
    envSeconds("CACHE_SESSION_TTL", config.sessionTTL);
    envSeconds("CACHE_ORGANIZATION_TTL", config.organizationTTL);
    envSeconds("CACHE_MEMBERSHIP_TTL", config.membershipTTL);

    return config;
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    try {
        if (!j.is_object()) {
            throw ConfigurationError("config", "expected a JSON object");
        }

        readField(j, "enabled", config.enabled);
        if (j.contains("type")) {
            config.type = parseBackendType(j.at("type").get<std::string>());
        }
        readField(j, "keyPrefix", config.keyPrefix);

        if (j.contains("remote")) {
            const auto& remote = j.at("remote");
            readField(remote, "url", config.remoteUrl);
            readField(remote, "poolSize", config.poolSize);
            readField(remote, "minIdleConns", config.minIdleConns);
            readField(remote, "maxIdleConns", config.maxIdleConns);
            readSeconds(remote, "connMaxIdleTimeSeconds", config.connMaxIdleTime);
            readSeconds(remote, "connMaxLifetimeSeconds", config.connMaxLifetime);
            readMillis(remote, "connectTimeoutMs", config.connectTimeout);
            readMillis(remote, "ioTimeoutMs", config.ioTimeout);
            readMillis(remote, "pingTimeoutMs", config.pingTimeout);
            readMillis(remote, "retryIntervalMs", config.retryInterval);
        }

        if (j.contains("memory")) {
            const auto& memory = j.at("memory");
            readField(memory, "maxSize", config.memoryMaxSize);
            readMillis(memory, "cleanupIntervalMs", config.memoryCleanupInterval);
        }

        if (j.contains("ttlSeconds")) {
            const auto& ttl = j.at("ttlSeconds");
            readSeconds(ttl, "default", config.defaultTTL);
            readSeconds(ttl, "healthCheck", config.healthCheckTTL);
            readSeconds(ttl, "userProfile", config.userProfileTTL);
            readSeconds(ttl, "session", config.sessionTTL);
            readSeconds(ttl, "organization", config.organizationTTL);
            readSeconds(ttl, "membership", config.membershipTTL);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("config", e.what());
    }
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("config", "cannot open " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("config", path + ": " + e.what());
    }
    return fromJson(j);
}

nlohmann::json CacheConfig::toJson() const {
    return {
        {"enabled", enabled},
        {"type", toString(type)},
        {"keyPrefix", keyPrefix},
        {"remote", {
            {"url", remoteUrl},
            {"poolSize", poolSize},
            {"minIdleConns", minIdleConns},
            {"maxIdleConns", maxIdleConns},
            {"connMaxIdleTimeSeconds", std::chrono::duration_cast<std::chrono::seconds>(connMaxIdleTime).count()},
            {"connMaxLifetimeSeconds", std::chrono::duration_cast<std::chrono::seconds>(connMaxLifetime).count()},
            {"connectTimeoutMs", connectTimeout.count()},
            {"ioTimeoutMs", ioTimeout.count()},
            {"pingTimeoutMs", pingTimeout.count()},
            {"retryIntervalMs", retryInterval.count()}
        }},
        {"memory", {
            {"maxSize", memoryMaxSize},
            {"cleanupIntervalMs", memoryCleanupInterval.count()}
        }},
        {"ttlSeconds", {
            {"default", std::chrono::duration_cast<std::chrono::seconds>(defaultTTL).count()},
            {"healthCheck", std::chrono::duration_cast<std::chrono::seconds>(healthCheckTTL).count()},
            {"userProfile", std::chrono::duration_cast<std::chrono::seconds>(userProfileTTL).count()},
            {"session", std::chrono::duration_cast<std::chrono::seconds>(sessionTTL).count()},
            {"organization", std::chrono::duration_cast<std::chrono::seconds>(organizationTTL).count()},
            {"membership", std::chrono::duration_cast<std::chrono::seconds>(membershipTTL).count()}
        }}
    };
}

std::chrono::milliseconds CacheConfig::ttlFor(TtlDomain domain) const {
    std::chrono::milliseconds ttl = defaultTTL;
    switch (domain) {
        case TtlDomain::HealthCheck:  ttl = healthCheckTTL; break;
        case TtlDomain::UserProfile:  ttl = userProfileTTL; break;
        case TtlDomain::Session:      ttl = sessionTTL; break;
        case TtlDomain::Organization: ttl = organizationTTL; break;
        case TtlDomain::Membership:   ttl = membershipTTL; break;
        case TtlDomain::Default:      break;
    }
    // Нулевой TTL области означает "использовать общий"
    return ttl.count() > 0 ? ttl : defaultTTL;
}

} // namespace cache
} // namespace flycache
