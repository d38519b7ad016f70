// components/memory_cache/src/types.cpp
#include "memory_cache/types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace memory_cache {

std::string toString(EvictionStrategy strategy) {
    switch (strategy) {
        case EvictionStrategy::LRU:
            return "LRU";
        case EvictionStrategy::LFU:
            return "LFU";
        case EvictionStrategy::FIFO:
            return "FIFO";
        default:
            return "UNKNOWN";
    }
}

std::string toString(const CacheConfig& config) {
    std::ostringstream oss;
    oss << "CacheConfig { ttl: " << config.ttl.count() << "ms"
        << ", maxSize: " << config.maxSize << " bytes"
        << ", strategy: " << toString(config.strategy) << " }";
    return oss.str();
}

std::string toString(const CacheStats& stats) {
    std::ostringstream oss;
    oss << "CacheStats {\n";
    oss << "  Entries: " << stats.entries << "\n";
    oss << "  Size: " << stats.size << " bytes\n";
    oss << "  Hits: " << stats.hits << "\n";
    oss << "  Misses: " << stats.misses << "\n";
    oss << "  Hit Rate: " << stats.hitRate << "\n";
    oss << "  Miss Rate: " << stats.missRate << "\n";
    oss << "  Evictions: " << stats.evictions << "\n";
    oss << "  Rejections: " << stats.rejections << "\n";
    oss << "}";
    return oss.str();
}

std::optional<EvictionStrategy> parseEvictionStrategy(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "lru") {
        return EvictionStrategy::LRU;
    }
    if (lowered == "lfu") {
        return EvictionStrategy::LFU;
    }
    if (lowered == "fifo") {
        return EvictionStrategy::FIFO;
    }
    return std::nullopt;
}

bool isValid(const CacheConfig& config) {
    if (config.ttl.count() <= 0) {
        return false;
    }

    if (config.maxSize == 0) {
        return false;
    }

    switch (config.strategy) {
        case EvictionStrategy::LRU:
        case EvictionStrategy::LFU:
        case EvictionStrategy::FIFO:
            return true;
        default:
            return false;
    }
}

} // namespace memory_cache
