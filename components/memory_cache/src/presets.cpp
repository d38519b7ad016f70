// components/memory_cache/src/presets.cpp
#include "memory_cache/presets.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace memory_cache {

namespace {

constexpr std::size_t kKilobyte = 1024;
constexpr std::size_t kMegabyte = 1024 * kKilobyte;

CacheConfig makeConfig(std::chrono::milliseconds ttl, std::size_t maxSize, EvictionStrategy strategy) {
    CacheConfig config;
    config.ttl = ttl;
    config.maxSize = maxSize;
    config.strategy = strategy;
    return config;
}

} // anonymous namespace

CacheConfig CachePresets::ui() {
    return makeConfig(std::chrono::minutes(5), 1 * kMegabyte, EvictionStrategy::LRU);
}

CacheConfig CachePresets::api() {
    return makeConfig(std::chrono::minutes(30), 5 * kMegabyte, EvictionStrategy::LRU);
}

CacheConfig CachePresets::files() {
    return makeConfig(std::chrono::hours(24), 20 * kMegabyte, EvictionStrategy::LFU);
}

CacheConfig CachePresets::preferences() {
    return makeConfig(std::chrono::hours(24 * 7), 512 * kKilobyte, EvictionStrategy::FIFO);
}

std::optional<CacheConfig> CachePresets::byName(const std::string& name) {
    if (name == "ui") {
        return ui();
    }
    if (name == "api") {
        return api();
    }
    if (name == "files") {
        return files();
    }
    if (name == "preferences") {
        return preferences();
    }
    return std::nullopt;
}

PresetCaches::PresetCaches(std::shared_ptr<const IClock> clock)
    : ui_(std::make_shared<JsonCache>(CachePresets::ui(), clock)),
      api_(std::make_shared<JsonCache>(CachePresets::api(), clock)),
      files_(std::make_shared<JsonCache>(CachePresets::files(), clock)),
      preferences_(std::make_shared<JsonCache>(CachePresets::preferences(), clock)) {
    spdlog::debug("Preset caches created");
}

std::size_t PresetCaches::cleanupAll() {
    std::size_t removed = 0;
    removed += ui_->cleanup();
    removed += api_->cleanup();
    removed += files_->cleanup();
    removed += preferences_->cleanup();
    return removed;
}

void PresetCaches::clearAll() {
    ui_->clear();
    api_->clear();
    files_->clear();
    preferences_->clear();
}

} // namespace memory_cache
