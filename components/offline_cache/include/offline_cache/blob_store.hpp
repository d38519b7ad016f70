// components/offline_cache/include/offline_cache/blob_store.hpp
#pragma once

#include "offline_cache/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace offline_cache {

/**
 * @brief Metadata stored next to every blob
 */
struct BlobMetadata {
    std::string contentType = "application/json";
    TimePoint cachedAt{};
};

struct Blob {
    std::string body;
    BlobMetadata metadata;
};

/**
 * @brief Raised by blob store implementations on I/O failure
 */
class BlobStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Durable key-value store addressed by string keys
 *
 * Every method except isSupported() may throw BlobStoreError.
 * Implementations must be safe to call from several threads.
 */
class IBlobStore {
public:
    virtual ~IBlobStore() = default;

    /**
     * @brief Capability probe: can this store be used in this environment?
     */
    virtual bool isSupported() = 0;

    /**
     * @brief Open or create a named store; cheap when already open
     */
    virtual void open(const std::string& storeName) = 0;

    /**
     * @brief Write or overwrite a blob
     */
    virtual void put(const std::string& key, const Blob& blob) = 0;

    /**
     * @brief Read a blob, nullopt if the key is absent
     */
    virtual std::optional<Blob> get(const std::string& key) = 0;

    /**
     * @brief All keys starting with prefix, sorted
     */
    virtual std::vector<std::string> listKeys(const std::string& prefix) = 0;

    /**
     * @brief Delete a blob
     * @return true if the key existed
     */
    virtual bool remove(const std::string& key) = 0;
};

/**
 * @brief In-process blob store
 *
 * Data lives as long as the store object. Used as the default backend and in
 * tests; setSupported(false) simulates an environment without a durable store.
 */
class MemoryBlobStore : public IBlobStore {
public:
    MemoryBlobStore() = default;

    bool isSupported() override;
    void open(const std::string& storeName) override;
    void put(const std::string& key, const Blob& blob) override;
    std::optional<Blob> get(const std::string& key) override;
    std::vector<std::string> listKeys(const std::string& prefix) override;
    bool remove(const std::string& key) override;

    void setSupported(bool supported);

    /**
     * @brief Names passed to open()
     */
    std::set<std::string> openedStores() const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    bool supported_ = true;
    std::set<std::string> openedStores_;
    std::map<std::string, Blob> blobs_;
};

/**
 * @brief Create the blob store selected by config.backend
 */
std::shared_ptr<IBlobStore> createBlobStore(const OfflineCacheConfig& config);

} // namespace offline_cache
