// components/offline_cache/include/offline_cache/redis_client.hpp
#pragma once

#include "offline_cache/types.hpp"

#include <hiredis/hiredis.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace offline_cache {

/**
 * @brief RAII wrapper for Redis replies
 */
class RedisReply {
public:
    explicit RedisReply(redisReply* reply) : reply_(reply) {}
    ~RedisReply() { if (reply_) freeReplyObject(reply_); }

    // Move semantics
    RedisReply(RedisReply&& other) noexcept : reply_(other.reply_) {
        other.reply_ = nullptr;
    }

    RedisReply& operator=(RedisReply&& other) noexcept {
        if (this != &other) {
            if (reply_) freeReplyObject(reply_);
            reply_ = other.reply_;
            other.reply_ = nullptr;
        }
        return *this;
    }

    // No copy semantics
    RedisReply(const RedisReply&) = delete;
    RedisReply& operator=(const RedisReply&) = delete;

    redisReply* get() const { return reply_; }
    redisReply* operator->() const { return reply_; }
    explicit operator bool() const { return reply_ != nullptr; }

    bool isError() const { return reply_ && reply_->type == REDIS_REPLY_ERROR; }

private:
    redisReply* reply_;
};

/**
 * @brief Thread-safe synchronous Redis connection
 */
class RedisClient {
public:
    /**
     * @brief Constructor
     * @param config Host, port, password and timeouts
     */
    explicit RedisClient(const RedisStoreConfig& config);

    /**
     * @brief Destructor - closes the connection
     */
    ~RedisClient();

    // Non-copyable, non-movable (contains mutex)
    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /**
     * @brief Connect, authenticate and verify with PING
     * @return true if connection successful
     */
    bool connect();

    /**
     * @brief Disconnect from Redis server
     */
    void disconnect();

    ConnectionStatus getConnectionStatus() const;

    bool isConnected() const { return getConnectionStatus() == ConnectionStatus::CONNECTED; }

    /**
     * @brief Run a command given as separate, binary-safe arguments
     * @return Reply, empty on connection failure (see getLastError())
     */
    RedisReply command(const std::vector<std::string>& arguments);

    /**
     * @brief Ping the Redis server
     * @return true if the server answered PONG
     */
    bool ping();

    std::string getHost() const { return config_.host; }
    int getPort() const { return config_.port; }

    /**
     * @brief Message of the most recent connection failure
     */
    std::string getLastError() const;

private:
    RedisStoreConfig config_;

    // Redis connection
    redisContext* context_;
    mutable std::mutex contextMutex_;

    std::atomic<ConnectionStatus> connectionStatus_;

    // Error tracking
    std::string lastError_;
    mutable std::mutex errorMutex_;

    // Callers hold contextMutex_
    bool authenticateLocked();
    bool pingLocked();
    RedisReply commandLocked(const std::vector<std::string>& arguments);

    void handleConnectionError(const std::string& operation);
    void setLastError(const std::string& error);
};

} // namespace offline_cache
