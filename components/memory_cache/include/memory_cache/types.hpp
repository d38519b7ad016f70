// components/memory_cache/include/memory_cache/types.hpp
#pragma once

#include "memory_cache/clock.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace memory_cache {

/**
 * @brief Victim ordering used when a cache has to make room
 */
enum class EvictionStrategy {
    LRU,   // Least recently used first
    LFU,   // Least frequently used first, ties by insertion order
    FIFO   // Oldest insertion first
};

/**
 * @brief Construction-time configuration of a MemoryCache
 */
struct CacheConfig {
    std::chrono::milliseconds ttl{std::chrono::minutes(30)};
    std::size_t maxSize = 10 * 1024 * 1024; // bytes
    EvictionStrategy strategy = EvictionStrategy::LRU;
};

/**
 * @brief Bookkeeping tracked for every cached key
 *
 * The sequence numbers come from a per-cache monotonic counter and break
 * ties between entries whose clock readings coincide.
 */
struct EntryMetadata {
    std::string key;
    TimePoint insertedAt{};
    TimePoint lastAccessedAt{};
    std::size_t size = 0;
    std::uint64_t accessCount = 0;
    std::uint64_t insertSequence = 0;
    std::uint64_t accessSequence = 0;
};

/**
 * @brief Cached value together with its bookkeeping
 */
template <typename V>
struct CacheEntry : EntryMetadata {
    CacheEntry(EntryMetadata metadata, V entryValue)
        : EntryMetadata(std::move(metadata)), value(std::move(entryValue)) {}

    V value;
};

/**
 * @brief Snapshot of cache occupancy and effectiveness
 */
struct CacheStats {
    std::size_t entries = 0;
    std::size_t size = 0;       // bytes
    double hitRate = 0.0;       // 0.0 to 1.0
    double missRate = 0.0;      // 0.0 to 1.0
    std::uint64_t evictions = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t rejections = 0;
};

std::string toString(EvictionStrategy strategy);
std::string toString(const CacheConfig& config);
std::string toString(const CacheStats& stats);

/**
 * @brief Parse "lru", "lfu" or "fifo" (case-insensitive)
 */
std::optional<EvictionStrategy> parseEvictionStrategy(const std::string& name);

bool isValid(const CacheConfig& config);

namespace detail {

// Keeps a parameter out of template argument deduction
template <typename T>
struct TypeIdentity {
    using type = T;
};

template <typename T>
using NonDeduced = typename TypeIdentity<T>::type;

} // namespace detail

} // namespace memory_cache
