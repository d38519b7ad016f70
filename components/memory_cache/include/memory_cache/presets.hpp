// components/memory_cache/include/memory_cache/presets.hpp
#pragma once

#include "memory_cache/clock.hpp"
#include "memory_cache/memory_cache.hpp"
#include "memory_cache/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace memory_cache {

using JsonCache = MemoryCache<nlohmann::json>;

/**
 * @brief Named configurations for the usage domains of the application
 */
struct CachePresets {
    /**
     * @brief Short-lived UI state: 5 minutes, 1 MB, LRU
     */
    static CacheConfig ui();

    /**
     * @brief API responses: 30 minutes, 5 MB, LRU
     */
    static CacheConfig api();

    /**
     * @brief Large file payloads: 24 hours, 20 MB, LFU
     */
    static CacheConfig files();

    /**
     * @brief Long-lived preferences: 7 days, 512 KB, FIFO
     */
    static CacheConfig preferences();

    /**
     * @brief Look up a preset by name ("ui", "api", "files", "preferences")
     */
    static std::optional<CacheConfig> byName(const std::string& name);
};

/**
 * @brief One JSON cache per preset, owned by whoever constructs the bundle
 *
 * Pass the bundle (or individual caches) to the code that memoizes through
 * them. Separate bundles never share entries.
 */
class PresetCaches {
public:
    explicit PresetCaches(std::shared_ptr<const IClock> clock = defaultClock());

    std::shared_ptr<JsonCache> ui() const { return ui_; }
    std::shared_ptr<JsonCache> api() const { return api_; }
    std::shared_ptr<JsonCache> files() const { return files_; }
    std::shared_ptr<JsonCache> preferences() const { return preferences_; }

    /**
     * @brief Sweep expired entries from all four caches
     * @return Total number of entries removed
     */
    std::size_t cleanupAll();

    /**
     * @brief Clear all four caches and their counters
     */
    void clearAll();

private:
    std::shared_ptr<JsonCache> ui_;
    std::shared_ptr<JsonCache> api_;
    std::shared_ptr<JsonCache> files_;
    std::shared_ptr<JsonCache> preferences_;
};

} // namespace memory_cache
