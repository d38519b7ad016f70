// components/offline_cache/include/offline_cache/types.hpp
#pragma once

#include "memory_cache/clock.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace offline_cache {

using memory_cache::IClock;
using memory_cache::TimePoint;

/**
 * @brief Query result persisted for offline use
 *
 * id is derived from (query, fileId) by makeQueryId, so caching the same
 * query twice overwrites one slot. fileId is a lookup hint only; the file it
 * names need not be cached.
 */
struct CachedQuery {
    std::string id;
    std::string query;
    nlohmann::json results;
    TimePoint timestamp{};
    std::optional<std::string> fileId;
    bool cached = true;
};

/**
 * @brief File metadata persisted for offline use
 *
 * Age is measured from uploadDate, not from the time it was cached.
 */
struct CachedFile {
    std::string id;
    std::string name;
    std::uint64_t size = 0;  // bytes
    std::string type;
    TimePoint uploadDate{};
    std::optional<nlohmann::json> metadata;
    std::optional<std::string> thumbnail;
    bool cached = true;
};

// JSON documents as stored in the blob store. timestamp is epoch milliseconds,
// uploadDate is ISO-8601 UTC.
void to_json(nlohmann::json& j, const CachedQuery& query);
void from_json(const nlohmann::json& j, CachedQuery& query);
void to_json(nlohmann::json& j, const CachedFile& file);
void from_json(const nlohmann::json& j, CachedFile& file);

/**
 * @brief Statistics of the durable cache, recomputed on every request
 */
struct PersistentCacheStats {
    std::uint64_t totalSize = 0;   // bytes of every stored body
    std::size_t queryCount = 0;    // unexpired queries
    std::size_t fileCount = 0;     // unexpired files
    std::optional<TimePoint> lastCleanup;
};

enum class ManagerState {
    UNINITIALIZED,
    INITIALIZED,   // Store open, no cleanup scheduled
    ACTIVE,        // Store open, periodic cleanup scheduled
    UNAVAILABLE    // Durable store not supported here
};

/**
 * @brief Domains subject to size-budget eviction
 */
enum class SizeEvictionScope {
    QUERIES_ONLY,        // Files and preferences are never evicted for size
    QUERIES_THEN_FILES   // Oldest queries first, then files by uploadDate
};

enum class StoreBackend {
    MEMORY,
    REDIS
};

enum class ConnectionStatus {
    CONNECTED,
    DISCONNECTED,
    CONNECTING,
    FAILED
};

enum class LookupStatus {
    HIT,
    MISS,
    ERROR
};

/**
 * @brief Lookup outcome that keeps "absent" and "failed" apart
 */
template<typename T>
struct LookupResult {
    LookupStatus status = LookupStatus::MISS;
    std::string errorMessage;
    std::optional<T> value;

    static LookupResult<T> hit(const T& found) {
        LookupResult<T> result;
        result.status = LookupStatus::HIT;
        result.value = found;
        return result;
    }

    static LookupResult<T> miss() {
        return LookupResult<T>();
    }

    static LookupResult<T> error(const std::string& message) {
        LookupResult<T> result;
        result.status = LookupStatus::ERROR;
        result.errorMessage = message;
        return result;
    }

    explicit operator bool() const {
        return status == LookupStatus::HIT;
    }
};

/**
 * @brief Redis connection settings for the Redis blob store
 */
struct RedisStoreConfig {
    std::string host = "localhost";
    int port = 6379;
    std::string password;
    std::chrono::milliseconds connectionTimeout{5000};
    std::chrono::milliseconds socketTimeout{3000};
};

/**
 * @brief Configuration of an OfflineCacheManager and its blob store
 */
struct OfflineCacheConfig {
    // Namespace of every stored key
    std::string storeName = "offline-cache";

    // Size budget
    std::uint64_t maxCacheSizeBytes = 50ULL * 1024 * 1024;
    double sizeLimitTargetRatio = 0.8;
    SizeEvictionScope evictionScope = SizeEvictionScope::QUERIES_ONLY;

    // Per-domain ages
    std::chrono::milliseconds maxQueryAge{std::chrono::hours(24 * 7)};
    std::chrono::milliseconds maxFileAge{std::chrono::hours(24 * 30)};

    // Periodic cleanup
    std::chrono::milliseconds cleanupInterval{std::chrono::hours(6)};
    bool enableScheduledCleanup = true;

    // Blob store
    StoreBackend backend = StoreBackend::MEMORY;
    RedisStoreConfig redis;

    bool enableDebugLogging = false;
};

std::string toString(ManagerState state);
std::string toString(SizeEvictionScope scope);
std::string toString(StoreBackend backend);
std::string toString(ConnectionStatus status);
std::string toString(LookupStatus status);
std::string toString(const PersistentCacheStats& stats);
std::string toString(const OfflineCacheConfig& config);

std::optional<SizeEvictionScope> parseSizeEvictionScope(const std::string& name);
std::optional<StoreBackend> parseStoreBackend(const std::string& name);

/**
 * @brief true if data written through this backend outlives the process
 */
bool isPersistent(StoreBackend backend);

bool isValid(const RedisStoreConfig& config);
bool isValid(const OfflineCacheConfig& config);

OfflineCacheConfig createDefaultConfig();
OfflineCacheConfig createDevelopmentConfig();
OfflineCacheConfig createRedisConfig(const std::string& host, int port,
                                     const std::string& password = "");

/**
 * @brief Deterministic slot id of a query
 *
 * The base64 encoding of the query text with every non-alphanumeric
 * character removed, prefixed with "{fileId}_" or "global_".
 */
std::string makeQueryId(const std::string& query,
                        const std::optional<std::string>& fileId = std::nullopt);

std::string encodeBase64(const std::string& data);

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
std::string formatIso8601(TimePoint time);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.fff]Z"
 * @throws std::invalid_argument on malformed input
 */
TimePoint parseIso8601(const std::string& text);

} // namespace offline_cache
