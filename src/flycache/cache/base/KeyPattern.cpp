#include "flycache/cache/base/KeyPattern.hpp"

namespace flycache {
namespace cache {

KeyPattern::KeyPattern(const std::string& pattern) {
    if (!pattern.empty() && pattern.back() == '*') {
        prefix_ = true;
        stem_ = pattern.substr(0, pattern.size() - 1);
    } else {
        stem_ = pattern;
    }
}

bool KeyPattern::matches(const std::string& key) const {
    if (!prefix_) {
        return key == stem_;
    }
    return key.compare(0, stem_.size(), stem_) == 0;
}

std::string KeyPattern::toGlob() const {
    std::string glob;
    glob.reserve(stem_.size() + 2);
    for (char c : stem_) {
        switch (c) {
            case '*':
            case '?':
            case '[':
            case ']':
            case '\\':
                glob.push_back('\\');
                break;
            default:
                break;
        }
        glob.push_back(c);
    }
    if (prefix_) {
        glob.push_back('*');
    }
    return glob;
}

std::string prefixKey(const std::string& prefix, const std::string& key) {
    if (prefix.empty()) {
        return key;
    }
    return prefix + ":" + key;
}

} // namespace cache
} // namespace flycache
