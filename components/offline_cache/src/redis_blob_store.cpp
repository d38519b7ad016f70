// components/offline_cache/src/redis_blob_store.cpp
#include "offline_cache/redis_blob_store.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace offline_cache {

namespace {

std::string replyString(const redisReply* reply) {
    if (!reply || !reply->str) {
        return std::string();
    }
    return std::string(reply->str, reply->len);
}

} // anonymous namespace

RedisBlobStore::RedisBlobStore(const RedisStoreConfig& config)
    : client_(std::make_unique<RedisClient>(config)) {
}

bool RedisBlobStore::isSupported() {
    try {
        ensureConnected();
        return true;
    } catch (const BlobStoreError& e) {
        spdlog::warn("Redis blob store unavailable: {}", e.what());
        return false;
    }
}

void RedisBlobStore::open(const std::string& storeName) {
    ensureConnected();

    if (!client_->ping()) {
        throw BlobStoreError("Redis did not answer PING while opening '" + storeName + "'");
    }

    spdlog::info("Redis blob store '{}' ready on {}:{}", storeName, client_->getHost(), client_->getPort());
}

void RedisBlobStore::put(const std::string& key, const Blob& blob) {
    run({"HSET", key,
         kBodyField, blob.body,
         kContentTypeField, blob.metadata.contentType,
         kCachedAtField, std::to_string(memory_cache::toEpochMillis(blob.metadata.cachedAt))},
        "HSET");
}

std::optional<Blob> RedisBlobStore::get(const std::string& key) {
    RedisReply reply = run({"HMGET", key, kBodyField, kContentTypeField, kCachedAtField}, "HMGET");

    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 3) {
        throw BlobStoreError("Unexpected HMGET reply for " + key);
    }

    const redisReply* body = reply->element[0];
    if (body->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }

    Blob blob;
    blob.body = replyString(body);

    if (reply->element[1]->type != REDIS_REPLY_NIL) {
        blob.metadata.contentType = replyString(reply->element[1]);
    }

    if (reply->element[2]->type != REDIS_REPLY_NIL) {
        try {
            blob.metadata.cachedAt = memory_cache::fromEpochMillis(std::stoll(replyString(reply->element[2])));
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring malformed cached_at of {}: {}", key, e.what());
        }
    }

    return blob;
}

std::vector<std::string> RedisBlobStore::listKeys(const std::string& prefix) {
    const std::string pattern = escapeMatchPattern(prefix) + "*";
    std::set<std::string> keys;
    std::string cursor = "0";

    // SCAN may return a key more than once
    do {
        RedisReply reply = run({"SCAN", cursor, "MATCH", pattern, "COUNT", kScanBatchSize}, "SCAN");

        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2 ||
            reply->element[1]->type != REDIS_REPLY_ARRAY) {
            throw BlobStoreError("Unexpected SCAN reply");
        }

        cursor = replyString(reply->element[0]);

        const redisReply* batch = reply->element[1];
        for (size_t i = 0; i < batch->elements; ++i) {
            keys.insert(replyString(batch->element[i]));
        }
    } while (cursor != "0");

    return std::vector<std::string>(keys.begin(), keys.end());
}

bool RedisBlobStore::remove(const std::string& key) {
    RedisReply reply = run({"DEL", key}, "DEL");
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

std::string RedisBlobStore::escapeMatchPattern(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

void RedisBlobStore::ensureConnected() {
    std::lock_guard<std::mutex> lock(connectMutex_);

    if (client_->isConnected()) {
        return;
    }

    if (!client_->connect()) {
        throw BlobStoreError("Cannot connect to Redis at " + client_->getHost() + ":" +
                             std::to_string(client_->getPort()) + ": " + client_->getLastError());
    }
}

RedisReply RedisBlobStore::run(const std::vector<std::string>& arguments, const std::string& operation) {
    ensureConnected();

    RedisReply reply = client_->command(arguments);

    if (!reply) {
        throw BlobStoreError(operation + " failed: " + client_->getLastError());
    }

    if (reply.isError()) {
        throw BlobStoreError(operation + " failed: " + replyString(reply.get()));
    }

    return reply;
}

} // namespace offline_cache
