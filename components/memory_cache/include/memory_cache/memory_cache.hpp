// components/memory_cache/include/memory_cache/memory_cache.hpp
#pragma once

#include "memory_cache/clock.hpp"
#include "memory_cache/eviction.hpp"
#include "memory_cache/size_estimator.hpp"
#include "memory_cache/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace memory_cache {

/**
 * @brief Generic in-process cache with TTL expiry and a byte budget
 *
 * Entries expire once more than config.ttl has passed since insertion.
 * Expiry is lazy: get(), has() and entries() drop expired entries they
 * touch, cleanup() sweeps all of them. When an insertion would push the
 * tracked size over config.maxSize the configured eviction strategy frees
 * exactly enough room first, so the tracked size never exceeds maxSize.
 *
 * All public operations are synchronised on an internal mutex. The size
 * estimator and the clock are called outside of it.
 *
 * @tparam V Stored value type, must be copy constructible
 * @tparam SizeEstimator Functor returning the approximate byte size of a V
 */
template <typename V, typename SizeEstimator = DefaultSizeEstimator<V>>
class MemoryCache {
public:
    using value_type = V;
    using size_estimator_type = SizeEstimator;

    /**
     * @brief Constructor
     * @param config TTL, byte budget and eviction strategy
     * @param clock Time source, defaults to the system clock
     * @param estimator Size estimator instance
     * @throws std::invalid_argument if config is invalid or clock is null
     */
    explicit MemoryCache(const CacheConfig& config = CacheConfig{},
                         std::shared_ptr<const IClock> clock = defaultClock(),
                         SizeEstimator estimator = SizeEstimator{})
        : config_(config),
          clock_(std::move(clock)),
          estimator_(std::move(estimator)) {
        if (!isValid(config_)) {
            throw std::invalid_argument("Invalid cache configuration: " + toString(config_));
        }
        if (!clock_) {
            throw std::invalid_argument("MemoryCache requires a clock");
        }
        strategy_ = createEvictionStrategy(config_.strategy);

        spdlog::debug("MemoryCache created (ttl={}ms, maxSize={} bytes, strategy={})",
                      config_.ttl.count(), config_.maxSize, toString(config_.strategy));
    }

    // Non-copyable, non-movable (contains mutex)
    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;
    MemoryCache(MemoryCache&&) = delete;
    MemoryCache& operator=(MemoryCache&&) = delete;

    /**
     * @brief Look up a value
     *
     * A hit refreshes the entry's access time and count. An expired entry is
     * removed and reported as a miss.
     */
    std::optional<V> get(const std::string& key) {
        const TimePoint now = clock_->now();
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }

        if (isExpired(it->second, now)) {
            eraseLocked(it);
            ++misses_;
            return std::nullopt;
        }

        CacheEntry<V>& entry = it->second;
        ++entry.accessCount;
        entry.lastAccessedAt = now;
        entry.accessSequence = nextSequence_++;
        ++hits_;

        return entry.value;
    }

    /**
     * @brief Insert or replace a value
     *
     * An existing entry under the same key is released before room is made,
     * so replacing a value never evicts more than the size difference needs.
     *
     * @return false if the value alone is larger than maxSize. The cache is
     *         left untouched in that case and the rejection is counted.
     */
    bool set(const std::string& key, V value) {
        const std::size_t size = estimator_(value);
        const TimePoint now = clock_->now();
        std::lock_guard<std::mutex> lock(mutex_);

        if (size > config_.maxSize) {
            ++rejections_;
            spdlog::warn("MemoryCache rejected '{}': {} bytes exceeds maxSize of {} bytes",
                         key, size, config_.maxSize);
            return false;
        }

        auto existing = entries_.find(key);
        if (existing != entries_.end()) {
            eraseLocked(existing);
        }

        if (currentSize_ + size > config_.maxSize) {
            evictLocked(currentSize_ + size - config_.maxSize);
        }

        EntryMetadata metadata;
        metadata.key = key;
        metadata.insertedAt = now;
        metadata.lastAccessedAt = now;
        metadata.size = size;
        metadata.accessCount = 1;
        metadata.insertSequence = nextSequence_++;
        metadata.accessSequence = metadata.insertSequence;

        entries_.emplace(key, CacheEntry<V>(std::move(metadata), std::move(value)));
        currentSize_ += size;

        return true;
    }

    /**
     * @brief Check for a live entry without touching access statistics
     */
    bool has(const std::string& key) {
        const TimePoint now = clock_->now();
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }

        if (isExpired(it->second, now)) {
            eraseLocked(it);
            return false;
        }

        return true;
    }

    /**
     * @brief Remove an entry regardless of its age
     * @return true if the key existed
     */
    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }

        eraseLocked(it);
        return true;
    }

    /**
     * @brief Remove every entry whose key satisfies the predicate
     * @return Number of entries removed
     */
    std::size_t removeIf(const std::function<bool(const std::string&)>& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (predicate(it->first)) {
                currentSize_ -= it->second.size;
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }

        return removed;
    }

    /**
     * @brief Drop all entries and reset every counter
     */
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);

        entries_.clear();
        currentSize_ = 0;
        resetCountersLocked();
    }

    /**
     * @brief Keys of all held entries in insertion order
     *
     * Entries that expired but were not swept yet are included.
     */
    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const EntryMetadata* entry : orderedByInsertionLocked()) {
            result.push_back(entry->key);
        }
        return result;
    }

    /**
     * @brief Live key/value pairs in insertion order
     *
     * Expired entries met along the way are removed.
     */
    std::vector<std::pair<std::string, V>> entries() {
        const TimePoint now = clock_->now();
        std::lock_guard<std::mutex> lock(mutex_);

        sweepExpiredLocked(now);

        std::vector<std::pair<std::string, V>> result;
        result.reserve(entries_.size());
        for (const EntryMetadata* entry : orderedByInsertionLocked()) {
            result.emplace_back(entry->key, static_cast<const CacheEntry<V>*>(entry)->value);
        }
        return result;
    }

    /**
     * @brief Remove every expired entry
     * @return Number of entries removed
     */
    std::size_t cleanup() {
        const TimePoint now = clock_->now();
        std::lock_guard<std::mutex> lock(mutex_);

        const std::size_t removed = sweepExpiredLocked(now);
        if (removed > 0) {
            spdlog::debug("MemoryCache cleanup removed {} expired entries", removed);
        }
        return removed;
    }

    /**
     * @brief Current occupancy and cumulative hit/miss/eviction counters
     */
    CacheStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        CacheStats stats;
        stats.entries = entries_.size();
        stats.size = currentSize_;
        stats.hits = hits_;
        stats.misses = misses_;
        stats.evictions = evictions_;
        stats.rejections = rejections_;

        const std::uint64_t lookups = hits_ + misses_;
        if (lookups > 0) {
            stats.hitRate = static_cast<double>(hits_) / static_cast<double>(lookups);
            stats.missRate = static_cast<double>(misses_) / static_cast<double>(lookups);
        }

        return stats;
    }

    /**
     * @brief Reset counters, keep entries
     */
    void resetStats() {
        std::lock_guard<std::mutex> lock(mutex_);
        resetCountersLocked();
    }

    /**
     * @brief Bookkeeping of an entry, expired or not, without touching it
     */
    std::optional<EntryMetadata> inspect(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return static_cast<const EntryMetadata&>(it->second);
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::size_t currentSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentSize_;
    }

    const CacheConfig& config() const { return config_; }

    const std::shared_ptr<const IClock>& clock() const { return clock_; }

private:
    using EntryMap = std::unordered_map<std::string, CacheEntry<V>>;

    const CacheConfig config_;
    const std::shared_ptr<const IClock> clock_;
    SizeEstimator estimator_;
    std::unique_ptr<IEvictionStrategy> strategy_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    std::size_t currentSize_ = 0;
    std::uint64_t nextSequence_ = 0;

    // Statistics
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    std::uint64_t evictions_ = 0;
    std::uint64_t rejections_ = 0;

    bool isExpired(const EntryMetadata& entry, TimePoint now) const {
        return now - entry.insertedAt > config_.ttl;
    }

    void eraseLocked(typename EntryMap::iterator it) {
        currentSize_ -= it->second.size;
        entries_.erase(it);
    }

    std::size_t sweepExpiredLocked(TimePoint now) {
        std::size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (isExpired(it->second, now)) {
                currentSize_ -= it->second.size;
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void evictLocked(std::size_t requiredSpace) {
        std::vector<const EntryMetadata*> candidates;
        candidates.reserve(entries_.size());
        for (const auto& item : entries_) {
            candidates.push_back(&item.second);
        }

        const std::vector<std::string> victims =
            strategy_->selectVictims(std::move(candidates), requiredSpace);

        for (const std::string& key : victims) {
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                continue;
            }
            eraseLocked(it);
            ++evictions_;
        }

        spdlog::debug("MemoryCache evicted {} entries ({}) to free {} bytes",
                      victims.size(), toString(config_.strategy), requiredSpace);
    }

    std::vector<const EntryMetadata*> orderedByInsertionLocked() const {
        std::vector<const EntryMetadata*> ordered;
        ordered.reserve(entries_.size());
        for (const auto& item : entries_) {
            ordered.push_back(&item.second);
        }
        std::sort(ordered.begin(), ordered.end(),
                  [](const EntryMetadata* lhs, const EntryMetadata* rhs) {
                      return lhs->insertSequence < rhs->insertSequence;
                  });
        return ordered;
    }

    void resetCountersLocked() {
        hits_ = 0;
        misses_ = 0;
        evictions_ = 0;
        rejections_ = 0;
    }
};

} // namespace memory_cache
