// components/offline_cache/src/redis_client.cpp
#include "offline_cache/redis_client.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <sys/time.h>

namespace offline_cache {

namespace {

timeval toTimeval(std::chrono::milliseconds duration) {
    timeval value;
    value.tv_sec = static_cast<decltype(value.tv_sec)>(duration.count() / 1000);
    value.tv_usec = static_cast<decltype(value.tv_usec)>((duration.count() % 1000) * 1000);
    return value;
}

} // anonymous namespace

RedisClient::RedisClient(const RedisStoreConfig& config)
    : config_(config), context_(nullptr),
      connectionStatus_(ConnectionStatus::DISCONNECTED) {

    spdlog::debug("RedisClient created for {}:{}", config_.host, config_.port);
}

RedisClient::~RedisClient() {
    disconnect();
}

bool RedisClient::connect() {
    std::lock_guard<std::mutex> lock(contextMutex_);

    // Cleanup existing connection
    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }

    connectionStatus_ = ConnectionStatus::CONNECTING;

    context_ = redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                       toTimeval(config_.connectionTimeout));

    if (!context_) {
        handleConnectionError("Failed to allocate Redis context");
        return false;
    }

    if (context_->err) {
        handleConnectionError("Connection failed");
        redisFree(context_);
        context_ = nullptr;
        return false;
    }

    if (redisSetTimeout(context_, toTimeval(config_.socketTimeout)) != REDIS_OK) {
        spdlog::warn("Failed to set socket timeout for Redis connection");
    }

    if (!authenticateLocked() || !pingLocked()) {
        redisFree(context_);
        context_ = nullptr;
        return false;
    }

    connectionStatus_ = ConnectionStatus::CONNECTED;

    spdlog::info("Successfully connected to Redis at {}:{}", config_.host, config_.port);
    return true;
}

void RedisClient::disconnect() {
    std::lock_guard<std::mutex> lock(contextMutex_);

    if (context_) {
        redisFree(context_);
        context_ = nullptr;
        spdlog::debug("Disconnected from Redis at {}:{}", config_.host, config_.port);
    }

    connectionStatus_ = ConnectionStatus::DISCONNECTED;
}

ConnectionStatus RedisClient::getConnectionStatus() const {
    return connectionStatus_.load();
}

RedisReply RedisClient::command(const std::vector<std::string>& arguments) {
    std::lock_guard<std::mutex> lock(contextMutex_);

    if (!context_ || connectionStatus_ != ConnectionStatus::CONNECTED) {
        handleConnectionError("Not connected to Redis");
        return RedisReply(nullptr);
    }

    RedisReply reply = commandLocked(arguments);
    if (!reply) {
        handleConnectionError("Command failed: " + (arguments.empty() ? std::string() : arguments.front()));
    } else if (reply.isError()) {
        setLastError("Redis error: " + std::string(reply->str ? reply->str : "Unknown error"));
    }

    return reply;
}

bool RedisClient::ping() {
    std::lock_guard<std::mutex> lock(contextMutex_);

    if (!context_ || connectionStatus_ != ConnectionStatus::CONNECTED) {
        return false;
    }

    return pingLocked();
}

std::string RedisClient::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

bool RedisClient::authenticateLocked() {
    if (config_.password.empty()) {
        return true; // No authentication needed
    }

    RedisReply reply = commandLocked({"AUTH", config_.password});

    if (!reply) {
        handleConnectionError("AUTH command failed");
        return false;
    }

    if (reply.isError()) {
        handleConnectionError("Authentication failed: " +
                              std::string(reply->str ? reply->str : "Invalid password"));
        return false;
    }

    return reply->type == REDIS_REPLY_STATUS &&
           reply->str && std::strcmp(reply->str, "OK") == 0;
}

bool RedisClient::pingLocked() {
    RedisReply reply = commandLocked({"PING"});

    if (!reply) {
        handleConnectionError("PING failed");
        return false;
    }

    return reply->type == REDIS_REPLY_STATUS &&
           reply->str && std::strcmp(reply->str, "PONG") == 0;
}

RedisReply RedisClient::commandLocked(const std::vector<std::string>& arguments) {
    std::vector<const char*> argv;
    std::vector<size_t> argvLengths;
    argv.reserve(arguments.size());
    argvLengths.reserve(arguments.size());

    for (const auto& argument : arguments) {
        argv.push_back(argument.data());
        argvLengths.push_back(argument.size());
    }

    return RedisReply(static_cast<redisReply*>(
        redisCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argvLengths.data())));
}

void RedisClient::handleConnectionError(const std::string& operation) {
    connectionStatus_ = ConnectionStatus::FAILED;

    std::string fullError = operation;
    if (context_ && context_->err) {
        fullError += ": " + std::string(context_->errstr);
    }

    setLastError(fullError);
    spdlog::error("Redis connection error [{}:{}]: {}", config_.host, config_.port, fullError);
}

void RedisClient::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

} // namespace offline_cache
