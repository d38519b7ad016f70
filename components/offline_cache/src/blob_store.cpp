// components/offline_cache/src/blob_store.cpp
#include "offline_cache/blob_store.hpp"
#include "offline_cache/redis_blob_store.hpp"

#include <spdlog/spdlog.h>

namespace offline_cache {

bool MemoryBlobStore::isSupported() {
    std::lock_guard<std::mutex> lock(mutex_);
    return supported_;
}

void MemoryBlobStore::open(const std::string& storeName) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!supported_) {
        throw BlobStoreError("Blob store is not supported");
    }

    if (openedStores_.insert(storeName).second) {
        spdlog::debug("MemoryBlobStore opened store '{}'", storeName);
    }
}

void MemoryBlobStore::put(const std::string& key, const Blob& blob) {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[key] = blob;
}

std::optional<Blob> MemoryBlobStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryBlobStore::listKeys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> keys;
    for (auto it = blobs_.lower_bound(prefix);
         it != blobs_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        keys.push_back(it->first);
    }
    return keys;
}

bool MemoryBlobStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.erase(key) > 0;
}

void MemoryBlobStore::setSupported(bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    supported_ = supported;
}

std::set<std::string> MemoryBlobStore::openedStores() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return openedStores_;
}

std::size_t MemoryBlobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
}

std::shared_ptr<IBlobStore> createBlobStore(const OfflineCacheConfig& config) {
    switch (config.backend) {
        case StoreBackend::MEMORY:
            return std::make_shared<MemoryBlobStore>();
        case StoreBackend::REDIS:
            return std::make_shared<RedisBlobStore>(config.redis);
        default:
            throw std::invalid_argument("Unknown blob store backend");
    }
}

} // namespace offline_cache
