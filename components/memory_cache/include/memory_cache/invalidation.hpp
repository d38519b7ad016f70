// components/memory_cache/include/memory_cache/invalidation.hpp
#pragma once

#include "memory_cache/memory_cache.hpp"

#include <regex>
#include <string>

namespace memory_cache {

/**
 * @brief Translate a glob with '*' wildcards into an ECMAScript regex
 *
 * Every other character is matched literally.
 */
std::string globToRegex(const std::string& pattern);

/**
 * @brief Remove every key in which the regex finds a match
 * @return Number of entries removed
 */
template <typename V, typename E>
std::size_t invalidatePattern(MemoryCache<V, E>& cache, const std::regex& pattern) {
    return cache.removeIf([&pattern](const std::string& key) {
        return std::regex_search(key, pattern);
    });
}

/**
 * @brief Remove every key matching a glob such as "user:*:profile"
 *
 * The glob is not anchored: "user:*" also removes "session:user:42".
 * Only '*' is special; regex metacharacters such as '.', '+' or '[' match
 * themselves. Use the std::regex overload for regular expressions.
 *
 * @return Number of entries removed
 */
template <typename V, typename E>
std::size_t invalidatePattern(MemoryCache<V, E>& cache, const std::string& pattern) {
    return invalidatePattern(cache, std::regex(globToRegex(pattern)));
}

} // namespace memory_cache
