// components/memory_cache/include/memory_cache/eviction.hpp
#pragma once

#include "memory_cache/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace memory_cache {

/**
 * @class IEvictionStrategy
 * @brief Chooses which entries a full cache gives up
 *
 * Strategies are stateless: the cache hands over a view of its live entries
 * and the number of bytes it needs, and the strategy returns the keys to
 * remove in removal order.
 */
class IEvictionStrategy {
public:
    virtual ~IEvictionStrategy() = default;

    /**
     * @brief Strategy identifier
     */
    virtual EvictionStrategy type() const = 0;

    /**
     * @brief Select victims until their combined size covers requiredSpace
     *
     * @param candidates Entries currently held by the cache
     * @param requiredSpace Number of bytes that must be released
     * @return Keys to evict, first victim first. May free less than
     *         requiredSpace only when every candidate is selected.
     */
    virtual std::vector<std::string> selectVictims(
        std::vector<const EntryMetadata*> candidates,
        std::size_t requiredSpace) const = 0;
};

/**
 * @class OrderedEvictionStrategy
 * @brief Strategy that evicts candidates in a fixed total order
 */
class OrderedEvictionStrategy : public IEvictionStrategy {
public:
    std::vector<std::string> selectVictims(
        std::vector<const EntryMetadata*> candidates,
        std::size_t requiredSpace) const override;

protected:
    /**
     * @brief true if lhs must be evicted before rhs
     */
    virtual bool evictsBefore(const EntryMetadata& lhs, const EntryMetadata& rhs) const = 0;
};

class LruEvictionStrategy final : public OrderedEvictionStrategy {
public:
    EvictionStrategy type() const override { return EvictionStrategy::LRU; }

protected:
    bool evictsBefore(const EntryMetadata& lhs, const EntryMetadata& rhs) const override;
};

class LfuEvictionStrategy final : public OrderedEvictionStrategy {
public:
    EvictionStrategy type() const override { return EvictionStrategy::LFU; }

protected:
    bool evictsBefore(const EntryMetadata& lhs, const EntryMetadata& rhs) const override;
};

class FifoEvictionStrategy final : public OrderedEvictionStrategy {
public:
    EvictionStrategy type() const override { return EvictionStrategy::FIFO; }

protected:
    bool evictsBefore(const EntryMetadata& lhs, const EntryMetadata& rhs) const override;
};

/**
 * @brief Create the strategy implementation for a configured strategy
 * @throws std::invalid_argument for an unknown strategy value
 */
std::unique_ptr<IEvictionStrategy> createEvictionStrategy(EvictionStrategy strategy);

} // namespace memory_cache
