// components/offline_cache/src/types.cpp
#include "offline_cache/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace offline_cache {

namespace {

const char* const kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // anonymous namespace

// JSON conversion for CachedQuery
void to_json(nlohmann::json& j, const CachedQuery& query) {
    j = nlohmann::json{
        {"id", query.id},
        {"query", query.query},
        {"results", query.results},
        {"timestamp", memory_cache::toEpochMillis(query.timestamp)},
        {"cached", query.cached}
    };

    if (query.fileId) {
        j["fileId"] = *query.fileId;
    }
}

void from_json(const nlohmann::json& j, CachedQuery& query) {
    query.id = j.at("id").get<std::string>();
    query.query = j.at("query").get<std::string>();
    query.results = j.value("results", nlohmann::json());
    query.timestamp = memory_cache::fromEpochMillis(j.at("timestamp").get<std::int64_t>());
    query.cached = j.value("cached", true);

    auto fileId = j.find("fileId");
    if (fileId != j.end() && !fileId->is_null()) {
        query.fileId = fileId->get<std::string>();
    } else {
        query.fileId.reset();
    }
}

// JSON conversion for CachedFile
void to_json(nlohmann::json& j, const CachedFile& file) {
    j = nlohmann::json{
        {"id", file.id},
        {"name", file.name},
        {"size", file.size},
        {"type", file.type},
        {"uploadDate", formatIso8601(file.uploadDate)},
        {"cached", file.cached}
    };

    if (file.metadata) {
        j["metadata"] = *file.metadata;
    }
    if (file.thumbnail) {
        j["thumbnail"] = *file.thumbnail;
    }
}

void from_json(const nlohmann::json& j, CachedFile& file) {
    file.id = j.at("id").get<std::string>();
    file.name = j.value("name", std::string());
    file.size = j.value("size", std::uint64_t{0});
    file.type = j.value("type", std::string());
    file.uploadDate = parseIso8601(j.at("uploadDate").get<std::string>());
    file.cached = j.value("cached", true);

    auto metadata = j.find("metadata");
    if (metadata != j.end() && !metadata->is_null()) {
        file.metadata = *metadata;
    } else {
        file.metadata.reset();
    }

    auto thumbnail = j.find("thumbnail");
    if (thumbnail != j.end() && !thumbnail->is_null()) {
        file.thumbnail = thumbnail->get<std::string>();
    } else {
        file.thumbnail.reset();
    }
}

std::string toString(ManagerState state) {
    switch (state) {
        case ManagerState::UNINITIALIZED:
            return "UNINITIALIZED";
        case ManagerState::INITIALIZED:
            return "INITIALIZED";
        case ManagerState::ACTIVE:
            return "ACTIVE";
        case ManagerState::UNAVAILABLE:
            return "UNAVAILABLE";
        default:
            return "UNKNOWN";
    }
}

std::string toString(SizeEvictionScope scope) {
    switch (scope) {
        case SizeEvictionScope::QUERIES_ONLY:
            return "QUERIES_ONLY";
        case SizeEvictionScope::QUERIES_THEN_FILES:
            return "QUERIES_THEN_FILES";
        default:
            return "UNKNOWN";
    }
}

std::string toString(StoreBackend backend) {
    switch (backend) {
        case StoreBackend::MEMORY:
            return "MEMORY";
        case StoreBackend::REDIS:
            return "REDIS";
        default:
            return "UNKNOWN";
    }
}

std::string toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTED:
            return "CONNECTED";
        case ConnectionStatus::DISCONNECTED:
            return "DISCONNECTED";
        case ConnectionStatus::CONNECTING:
            return "CONNECTING";
        case ConnectionStatus::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

std::string toString(LookupStatus status) {
    switch (status) {
        case LookupStatus::HIT:
            return "HIT";
        case LookupStatus::MISS:
            return "MISS";
        case LookupStatus::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

std::string toString(const PersistentCacheStats& stats) {
    std::ostringstream oss;
    oss << "PersistentCacheStats {\n";
    oss << "  Total Size: " << stats.totalSize << " bytes\n";
    oss << "  Queries: " << stats.queryCount << "\n";
    oss << "  Files: " << stats.fileCount << "\n";
    oss << "  Last Cleanup: " << (stats.lastCleanup ? formatIso8601(*stats.lastCleanup) : "never") << "\n";
    oss << "}";
    return oss.str();
}

std::string toString(const OfflineCacheConfig& config) {
    std::ostringstream oss;
    oss << "OfflineCacheConfig {\n";
    oss << "  Store Name: " << config.storeName << "\n";
    oss << "  Max Cache Size: " << config.maxCacheSizeBytes << " bytes\n";
    oss << "  Size Limit Target Ratio: " << config.sizeLimitTargetRatio << "\n";
    oss << "  Eviction Scope: " << toString(config.evictionScope) << "\n";
    oss << "  Max Query Age: " << config.maxQueryAge.count() << "ms\n";
    oss << "  Max File Age: " << config.maxFileAge.count() << "ms\n";
    oss << "  Cleanup Interval: " << config.cleanupInterval.count() << "ms\n";
    oss << "  Scheduled Cleanup: " << (config.enableScheduledCleanup ? "enabled" : "disabled") << "\n";
    oss << "  Backend: " << toString(config.backend) << "\n";
    if (config.backend == StoreBackend::REDIS) {
        oss << "  Redis: " << config.redis.host << ":" << config.redis.port << "\n";
    }
    oss << "}";
    return oss.str();
}

std::optional<SizeEvictionScope> parseSizeEvictionScope(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "QUERIES_ONLY") {
        return SizeEvictionScope::QUERIES_ONLY;
    }
    if (upper == "QUERIES_THEN_FILES") {
        return SizeEvictionScope::QUERIES_THEN_FILES;
    }
    return std::nullopt;
}

std::optional<StoreBackend> parseStoreBackend(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "MEMORY") {
        return StoreBackend::MEMORY;
    }
    if (upper == "REDIS") {
        return StoreBackend::REDIS;
    }
    return std::nullopt;
}

bool isPersistent(StoreBackend backend) {
    return backend == StoreBackend::REDIS;
}

// Validation functions for configuration
bool isValid(const RedisStoreConfig& config) {
    if (config.host.empty()) {
        return false;
    }

    if (config.port <= 0 || config.port > 65535) {
        return false;
    }

    if (config.connectionTimeout.count() <= 0 || config.socketTimeout.count() <= 0) {
        return false;
    }

    return true;
}

bool isValid(const OfflineCacheConfig& config) {
    if (config.storeName.empty()) {
        return false;
    }

    if (config.maxCacheSizeBytes == 0) {
        return false;
    }

    if (config.sizeLimitTargetRatio <= 0.0 || config.sizeLimitTargetRatio > 1.0) {
        return false;
    }

    if (config.maxQueryAge.count() <= 0 || config.maxFileAge.count() <= 0) {
        return false;
    }

    if (config.enableScheduledCleanup && config.cleanupInterval.count() <= 0) {
        return false;
    }

    if (config.backend == StoreBackend::REDIS && !isValid(config.redis)) {
        return false;
    }

    return true;
}

// Factory functions for common configurations
OfflineCacheConfig createDefaultConfig() {
    return OfflineCacheConfig{};
}

OfflineCacheConfig createDevelopmentConfig() {
    OfflineCacheConfig config;
    config.storeName = "offline-cache-dev";
    config.maxCacheSizeBytes = 5ULL * 1024 * 1024;
    config.cleanupInterval = std::chrono::minutes(5);
    config.enableDebugLogging = true;
    return config;
}

OfflineCacheConfig createRedisConfig(const std::string& host, int port,
                                     const std::string& password) {
    OfflineCacheConfig config;
    config.backend = StoreBackend::REDIS;
    config.redis.host = host;
    config.redis.port = port;
    config.redis.password = password;
    return config;
}

std::string encodeBase64(const std::string& data) {
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < data.size()) {
        const auto b0 = static_cast<unsigned char>(data[i]);
        const auto b1 = static_cast<unsigned char>(data[i + 1]);
        const auto b2 = static_cast<unsigned char>(data[i + 2]);
        encoded += kBase64Alphabet[b0 >> 2];
        encoded += kBase64Alphabet[((b0 & 0x03) << 4) | (b1 >> 4)];
        encoded += kBase64Alphabet[((b1 & 0x0F) << 2) | (b2 >> 6)];
        encoded += kBase64Alphabet[b2 & 0x3F];
        i += 3;
    }

    const std::size_t remaining = data.size() - i;
    if (remaining == 1) {
        const auto b0 = static_cast<unsigned char>(data[i]);
        encoded += kBase64Alphabet[b0 >> 2];
        encoded += kBase64Alphabet[(b0 & 0x03) << 4];
        encoded += "==";
    } else if (remaining == 2) {
        const auto b0 = static_cast<unsigned char>(data[i]);
        const auto b1 = static_cast<unsigned char>(data[i + 1]);
        encoded += kBase64Alphabet[b0 >> 2];
        encoded += kBase64Alphabet[((b0 & 0x03) << 4) | (b1 >> 4)];
        encoded += kBase64Alphabet[(b1 & 0x0F) << 2];
        encoded += '=';
    }

    return encoded;
}

std::string makeQueryId(const std::string& query, const std::optional<std::string>& fileId) {
    std::string hash = encodeBase64(query);
    hash.erase(std::remove_if(hash.begin(), hash.end(),
                              [](unsigned char c) { return !std::isalnum(c); }),
               hash.end());

    // An empty file id is a global query
    const bool fileScoped = fileId && !fileId->empty();
    return (fileScoped ? *fileId : std::string("global")) + "_" + hash;
}

std::string formatIso8601(TimePoint time) {
    const std::int64_t millis = memory_cache::toEpochMillis(time);
    std::int64_t seconds = millis / 1000;
    std::int64_t fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        --seconds;
    }

    const std::time_t raw = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fraction << 'Z';
    return oss.str();
}

TimePoint parseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument("ISO-8601 timestamp out of range: " + text);
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    std::int64_t millis = 0;

    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Invalid ISO-8601 fraction: " + text);
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    if (pos + 1 != text.size() || text[pos] != 'Z') {
        throw std::invalid_argument("ISO-8601 timestamp must be UTC ('Z'): " + text);
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;

    const std::time_t seconds = timegm(&utc);
    return memory_cache::fromEpochMillis(static_cast<std::int64_t>(seconds) * 1000 + millis);
}

} // namespace offline_cache
