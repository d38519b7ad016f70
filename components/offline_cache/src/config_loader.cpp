// components/offline_cache/src/config_loader.cpp
#include "offline_cache/config_loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace offline_cache {

OfflineCacheConfig ConfigLoader::loadManagerConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    OfflineCacheConfig config = parseManagerConfig(json);

    spdlog::info("Loaded offline cache configuration from {}", filepath);
    return config;
}

OfflineCacheConfig ConfigLoader::parseManagerConfig(const nlohmann::json& json) {
    OfflineCacheConfig config;

    try {
        if (json.contains("manager")) {
            parseManagerSection(json["manager"], config);
        }

        if (json.contains("store")) {
            parseStoreSection(json["store"], config);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid offline cache configuration: " + std::string(e.what()));
    }

    if (!isValid(config)) {
        throw std::runtime_error("Invalid offline cache configuration:\n" + toString(config));
    }

    return config;
}

nlohmann::json ConfigLoader::toJson(const OfflineCacheConfig& config) {
    using std::chrono::duration_cast;

    nlohmann::json manager = {
        {"storeName", config.storeName},
        {"maxCacheSizeBytes", config.maxCacheSizeBytes},
        {"sizeLimitTargetRatio", config.sizeLimitTargetRatio},
        {"maxQueryAgeHours", duration_cast<std::chrono::hours>(config.maxQueryAge).count()},
        {"maxFileAgeHours", duration_cast<std::chrono::hours>(config.maxFileAge).count()},
        {"cleanupIntervalMinutes", duration_cast<std::chrono::minutes>(config.cleanupInterval).count()},
        {"enableScheduledCleanup", config.enableScheduledCleanup},
        {"evictionScope", toString(config.evictionScope)},
        {"enableDebugLogging", config.enableDebugLogging}
    };

    nlohmann::json redis = {
        {"host", config.redis.host},
        {"port", config.redis.port},
        {"password", config.redis.password},
        {"connectionTimeoutMs", config.redis.connectionTimeout.count()},
        {"socketTimeoutMs", config.redis.socketTimeout.count()}
    };

    std::string backend = toString(config.backend);
    std::transform(backend.begin(), backend.end(), backend.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return nlohmann::json{
        {"manager", manager},
        {"store", {{"backend", backend}, {"redis", redis}}}
    };
}

void ConfigLoader::parseManagerSection(const nlohmann::json& json, OfflineCacheConfig& config) {
    if (json.contains("storeName")) {
        config.storeName = json["storeName"].get<std::string>();
    }

    if (json.contains("maxCacheSizeBytes")) {
        config.maxCacheSizeBytes = json["maxCacheSizeBytes"].get<std::uint64_t>();
    }

    if (json.contains("sizeLimitTargetRatio")) {
        config.sizeLimitTargetRatio = json["sizeLimitTargetRatio"].get<double>();
    }

    if (json.contains("maxQueryAgeHours")) {
        config.maxQueryAge = std::chrono::hours(json["maxQueryAgeHours"].get<int>());
    }

    if (json.contains("maxFileAgeHours")) {
        config.maxFileAge = std::chrono::hours(json["maxFileAgeHours"].get<int>());
    }

    if (json.contains("cleanupIntervalMinutes")) {
        config.cleanupInterval = std::chrono::minutes(json["cleanupIntervalMinutes"].get<int>());
    }

    if (json.contains("enableScheduledCleanup")) {
        config.enableScheduledCleanup = json["enableScheduledCleanup"].get<bool>();
    }

    if (json.contains("evictionScope")) {
        const auto scopeName = json["evictionScope"].get<std::string>();
        auto scope = parseSizeEvictionScope(scopeName);
        if (!scope) {
            throw std::runtime_error("Unknown evictionScope: " + scopeName);
        }
        config.evictionScope = *scope;
    }

    if (json.contains("enableDebugLogging")) {
        config.enableDebugLogging = json["enableDebugLogging"].get<bool>();
    }
}

void ConfigLoader::parseStoreSection(const nlohmann::json& json, OfflineCacheConfig& config) {
    if (json.contains("backend")) {
        const auto backendName = json["backend"].get<std::string>();
        auto backend = parseStoreBackend(backendName);
        if (!backend) {
            throw std::runtime_error("Unknown store backend: " + backendName);
        }
        config.backend = *backend;
    }

    if (json.contains("redis")) {
        const auto& redisJson = json["redis"];

        if (redisJson.contains("host")) {
            config.redis.host = redisJson["host"].get<std::string>();
        }

        if (redisJson.contains("port")) {
            config.redis.port = redisJson["port"].get<int>();
        }

        if (redisJson.contains("password")) {
            config.redis.password = redisJson["password"].get<std::string>();
        }

        if (redisJson.contains("connectionTimeoutMs")) {
            config.redis.connectionTimeout = std::chrono::milliseconds(redisJson["connectionTimeoutMs"].get<int>());
        }

        if (redisJson.contains("socketTimeoutMs")) {
            config.redis.socketTimeout = std::chrono::milliseconds(redisJson["socketTimeoutMs"].get<int>());
        }
    }
}

nlohmann::json ConfigLoader::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse configuration file: " + std::string(e.what()));
    }
}

} // namespace offline_cache
