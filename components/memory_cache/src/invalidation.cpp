// components/memory_cache/src/invalidation.cpp
#include "memory_cache/invalidation.hpp"

#include <cstring>

namespace memory_cache {

std::string globToRegex(const std::string& pattern) {
    static const char* const kMetaCharacters = "\\^$.|?+()[]{}";

    std::string expression;
    expression.reserve(pattern.size() * 2);

    for (char c : pattern) {
        if (c == '*') {
            expression += ".*";
        } else if (std::strchr(kMetaCharacters, c) != nullptr) {
            expression += '\\';
            expression += c;
        } else {
            expression += c;
        }
    }

    return expression;
}

} // namespace memory_cache
