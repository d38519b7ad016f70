// components/memory_cache/src/eviction.cpp
#include "memory_cache/eviction.hpp"

#include <algorithm>
#include <stdexcept>

namespace memory_cache {

std::vector<std::string> OrderedEvictionStrategy::selectVictims(
        std::vector<const EntryMetadata*> candidates,
        std::size_t requiredSpace) const {
    std::vector<std::string> victims;

    if (requiredSpace == 0 || candidates.empty()) {
        return victims;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [this](const EntryMetadata* lhs, const EntryMetadata* rhs) {
                         return evictsBefore(*lhs, *rhs);
                     });

    std::size_t freedSpace = 0;
    for (const EntryMetadata* candidate : candidates) {
        victims.push_back(candidate->key);
        freedSpace += candidate->size;

        if (freedSpace >= requiredSpace) {
            break;
        }
    }

    return victims;
}

bool LruEvictionStrategy::evictsBefore(const EntryMetadata& lhs, const EntryMetadata& rhs) const {
    if (lhs.lastAccessedAt != rhs.lastAccessedAt) {
        return lhs.lastAccessedAt < rhs.lastAccessedAt;
    }
    return lhs.accessSequence < rhs.accessSequence;
}

bool LfuEvictionStrategy::evictsBefore(const EntryMetadata& lhs, const EntryMetadata& rhs) const {
    if (lhs.accessCount != rhs.accessCount) {
        return lhs.accessCount < rhs.accessCount;
    }
    return lhs.insertSequence < rhs.insertSequence;
}

bool FifoEvictionStrategy::evictsBefore(const EntryMetadata& lhs, const EntryMetadata& rhs) const {
    if (lhs.insertedAt != rhs.insertedAt) {
        return lhs.insertedAt < rhs.insertedAt;
    }
    return lhs.insertSequence < rhs.insertSequence;
}

std::unique_ptr<IEvictionStrategy> createEvictionStrategy(EvictionStrategy strategy) {
    switch (strategy) {
        case EvictionStrategy::LRU:
            return std::make_unique<LruEvictionStrategy>();
        case EvictionStrategy::LFU:
            return std::make_unique<LfuEvictionStrategy>();
        case EvictionStrategy::FIFO:
            return std::make_unique<FifoEvictionStrategy>();
        default:
            throw std::invalid_argument("Unknown eviction strategy");
    }
}

} // namespace memory_cache
