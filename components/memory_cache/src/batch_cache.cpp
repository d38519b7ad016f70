// components/memory_cache/src/batch_cache.cpp
#include "memory_cache/batch_cache.hpp"

#include <spdlog/spdlog.h>

namespace memory_cache {

std::string toString(BatchOperationType type) {
    switch (type) {
        case BatchOperationType::SET: return "SET";
        case BatchOperationType::DELETE: return "DELETE";
        default: return "UNKNOWN";
    }
}

std::size_t BatchCache::execute() {
    std::vector<Operation> operations;
    operations.swap(operations_);

    std::size_t applied = 0;
    for (const Operation& operation : operations) {
        operation.apply();
        ++applied;
    }

    spdlog::debug("BatchCache executed {} operations", applied);
    return applied;
}

void BatchCache::clear() {
    operations_.clear();
}

std::vector<BatchCache::PendingOperation> BatchCache::pending() const {
    std::vector<PendingOperation> result;
    result.reserve(operations_.size());
    for (const Operation& operation : operations_) {
        result.push_back({operation.type, operation.key});
    }
    return result;
}

} // namespace memory_cache
