// components/memory_cache/include/memory_cache/size_estimator.hpp
#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <type_traits>

namespace memory_cache {

// Size charged when a value cannot be measured
constexpr std::size_t kFallbackEntrySize = 1024;

// Width charged per character of string or serialized data
constexpr std::size_t kBytesPerCharacter = 2;

constexpr std::size_t kNumberSize = 8;
constexpr std::size_t kBooleanSize = 4;

/**
 * @brief Approximate byte size of a cached value
 *
 * Specialise this for stored types that need an accurate estimate, or pass
 * a custom estimator type to MemoryCache. Types without a specialisation are
 * charged kFallbackEntrySize.
 */
template <typename V, typename Enable = void>
struct DefaultSizeEstimator {
    std::size_t operator()(const V&) const { return kFallbackEntrySize; }
};

template <>
struct DefaultSizeEstimator<bool> {
    std::size_t operator()(bool) const { return kBooleanSize; }
};

template <typename V>
struct DefaultSizeEstimator<V, std::enable_if_t<std::is_arithmetic_v<V> && !std::is_same_v<V, bool>>> {
    std::size_t operator()(V) const { return kNumberSize; }
};

template <>
struct DefaultSizeEstimator<std::string> {
    std::size_t operator()(const std::string& value) const {
        return value.size() * kBytesPerCharacter;
    }
};

/**
 * @brief Estimate for JSON documents
 *
 * Scalars are charged like their native counterparts, null is free, and
 * structured documents are charged by serialized length. A document that
 * cannot be serialized (e.g. invalid UTF-8 in a string) is charged
 * kFallbackEntrySize.
 */
template <>
struct DefaultSizeEstimator<nlohmann::json> {
    std::size_t operator()(const nlohmann::json& value) const;
};

} // namespace memory_cache
