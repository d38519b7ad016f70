// components/offline_cache/include/offline_cache/redis_blob_store.hpp
#pragma once

#include "offline_cache/blob_store.hpp"
#include "offline_cache/redis_client.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace offline_cache {

/**
 * @brief Blob store persisted in Redis
 *
 * Each blob is a hash under its key with the fields "body", "content_type"
 * and "cached_at" (epoch milliseconds). The connection is opened lazily and
 * re-established once per operation after a failure.
 */
class RedisBlobStore : public IBlobStore {
public:
    explicit RedisBlobStore(const RedisStoreConfig& config);

    /**
     * @brief true if the server can be reached
     */
    bool isSupported() override;

    void open(const std::string& storeName) override;
    void put(const std::string& key, const Blob& blob) override;
    std::optional<Blob> get(const std::string& key) override;
    std::vector<std::string> listKeys(const std::string& prefix) override;
    bool remove(const std::string& key) override;

    ConnectionStatus getConnectionStatus() const { return client_->getConnectionStatus(); }

    /**
     * @brief Escape glob metacharacters for SCAN MATCH
     */
    static std::string escapeMatchPattern(const std::string& text);

private:
    static constexpr const char* kBodyField = "body";
    static constexpr const char* kContentTypeField = "content_type";
    static constexpr const char* kCachedAtField = "cached_at";
    static constexpr const char* kScanBatchSize = "100";

    std::unique_ptr<RedisClient> client_;
    std::mutex connectMutex_;

    void ensureConnected();
    RedisReply run(const std::vector<std::string>& arguments, const std::string& operation);
};

} // namespace offline_cache
