// components/memory_cache/include/memory_cache/batch_cache.hpp
#pragma once

#include "memory_cache/memory_cache.hpp"
#include "memory_cache/types.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace memory_cache {

enum class BatchOperationType {
    SET,
    DELETE
};

std::string toString(BatchOperationType type);

/**
 * @brief Deferred list of set/remove operations against one or more caches
 *
 * Nothing touches a cache until execute(), which replays the operations in
 * the order they were added. There is no rollback: if an operation throws,
 * the ones before it stay applied and the buffer is already empty.
 *
 * Not thread-safe.
 */
class BatchCache {
public:
    struct PendingOperation {
        BatchOperationType type;
        std::string key;
    };

    template <typename V, typename E>
    BatchCache& set(std::shared_ptr<MemoryCache<V, E>> cache, std::string key, detail::NonDeduced<V> value) {
        requireCache(cache.get());
        auto apply = [cache, key, value = std::move(value)]() { cache->set(key, value); };
        operations_.push_back({BatchOperationType::SET, std::move(key), std::move(apply)});
        return *this;
    }

    template <typename V, typename E>
    BatchCache& remove(std::shared_ptr<MemoryCache<V, E>> cache, std::string key) {
        requireCache(cache.get());
        auto apply = [cache, key]() { cache->remove(key); };
        operations_.push_back({BatchOperationType::DELETE, std::move(key), std::move(apply)});
        return *this;
    }

    /**
     * @brief Apply all buffered operations in insertion order
     * @return Number of operations applied
     */
    std::size_t execute();

    /**
     * @brief Discard buffered operations without applying them
     */
    void clear();

    std::size_t size() const { return operations_.size(); }
    bool empty() const { return operations_.empty(); }

    /**
     * @brief Buffered operations, oldest first
     */
    std::vector<PendingOperation> pending() const;

private:
    struct Operation {
        BatchOperationType type;
        std::string key;
        std::function<void()> apply;
    };

    std::vector<Operation> operations_;

    static void requireCache(const void* cache) {
        if (cache == nullptr) {
            throw std::invalid_argument("BatchCache operation requires a cache");
        }
    }
};

} // namespace memory_cache
