#include "flycache/cache/base/CacheError.hpp"

namespace flycache {
namespace cache {

namespace {

std::string formatMessage(const std::string& op, const std::string& key, const std::string& reason) {
    if (!key.empty()) {
        return "cache " + op + " " + key + ": " + reason;
    }
    return "cache " + op + ": " + reason;
}

} // namespace

CacheError::CacheError(const std::string& op, const std::string& key, const std::string& reason)
    : std::runtime_error(formatMessage(op, key, reason))
    , op_(op)
    , key_(key)
    , reason_(reason) {
}

ConfigurationError::ConfigurationError(const std::string& setting, const std::string& reason)
    : CacheError("configure", setting, reason) {
}

} // namespace cache
} // namespace flycache
