// components/offline_cache/test/unit/test_config_loader.cpp
#include <gtest/gtest.h>
#include "offline_cache/config_loader.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using namespace offline_cache;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!tempFile.empty()) {
            std::remove(tempFile.c_str());
        }
    }

    std::string writeTempFile(const std::string& contents) {
        tempFile = ::testing::TempDir() + "offline_cache_config_test.json";
        std::ofstream out(tempFile);
        out << contents;
        return tempFile;
    }

    std::string tempFile;
};

TEST_F(ConfigLoaderTest, ParseFullDocument) {
    nlohmann::json json = {
        {"manager", {
            {"storeName", "bim-viewer"},
            {"maxCacheSizeBytes", 1048576},
            {"sizeLimitTargetRatio", 0.5},
            {"maxQueryAgeHours", 24},
            {"maxFileAgeHours", 48},
            {"cleanupIntervalMinutes", 15},
            {"enableScheduledCleanup", false},
            {"evictionScope", "queries_then_files"},
            {"enableDebugLogging", true}
        }},
        {"store", {
            {"backend", "redis"},
            {"redis", {
                {"host", "cache.internal"},
                {"port", 6380},
                {"password", "secret"},
                {"connectionTimeoutMs", 250},
                {"socketTimeoutMs", 100}
            }}
        }}
    };

    OfflineCacheConfig config = ConfigLoader::parseManagerConfig(json);

    EXPECT_EQ("bim-viewer", config.storeName);
    EXPECT_EQ(1048576u, config.maxCacheSizeBytes);
    EXPECT_DOUBLE_EQ(0.5, config.sizeLimitTargetRatio);
    EXPECT_EQ(std::chrono::hours(24), config.maxQueryAge);
    EXPECT_EQ(std::chrono::hours(48), config.maxFileAge);
    EXPECT_EQ(std::chrono::minutes(15), config.cleanupInterval);
    EXPECT_FALSE(config.enableScheduledCleanup);
    EXPECT_EQ(SizeEvictionScope::QUERIES_THEN_FILES, config.evictionScope);
    EXPECT_TRUE(config.enableDebugLogging);
    EXPECT_EQ(StoreBackend::REDIS, config.backend);
    EXPECT_EQ("cache.internal", config.redis.host);
    EXPECT_EQ(6380, config.redis.port);
    EXPECT_EQ("secret", config.redis.password);
    EXPECT_EQ(std::chrono::milliseconds(250), config.redis.connectionTimeout);
    EXPECT_EQ(std::chrono::milliseconds(100), config.redis.socketTimeout);
}

TEST_F(ConfigLoaderTest, MissingFieldsKeepDefaults) {
    nlohmann::json json = {{"manager", {{"storeName", "partial"}}}};

    OfflineCacheConfig config = ConfigLoader::parseManagerConfig(json);
    OfflineCacheConfig defaults = createDefaultConfig();

    EXPECT_EQ("partial", config.storeName);
    EXPECT_EQ(defaults.maxCacheSizeBytes, config.maxCacheSizeBytes);
    EXPECT_EQ(defaults.maxQueryAge, config.maxQueryAge);
    EXPECT_EQ(defaults.evictionScope, config.evictionScope);
    EXPECT_EQ(StoreBackend::MEMORY, config.backend);

    EXPECT_NO_THROW(ConfigLoader::parseManagerConfig(nlohmann::json::object()));
}

TEST_F(ConfigLoaderTest, UnknownEnumNamesThrow) {
    EXPECT_THROW(ConfigLoader::parseManagerConfig({{"manager", {{"evictionScope", "RANDOM"}}}}),
                 std::runtime_error);
    EXPECT_THROW(ConfigLoader::parseManagerConfig({{"store", {{"backend", "indexeddb"}}}}),
                 std::runtime_error);
}

TEST_F(ConfigLoaderTest, WrongTypesThrow) {
    EXPECT_THROW(ConfigLoader::parseManagerConfig({{"manager", {{"maxCacheSizeBytes", "big"}}}}),
                 std::runtime_error);
}

TEST_F(ConfigLoaderTest, InvalidValuesThrow) {
    EXPECT_THROW(ConfigLoader::parseManagerConfig({{"manager", {{"sizeLimitTargetRatio", 1.5}}}}),
                 std::runtime_error);
    EXPECT_THROW(ConfigLoader::parseManagerConfig({{"manager", {{"storeName", ""}}}}),
                 std::runtime_error);
}

TEST_F(ConfigLoaderTest, LoadFromFile) {
    const std::string path = writeTempFile(R"({
        "manager": { "storeName": "from-file", "cleanupIntervalMinutes": 30 },
        "store": { "backend": "memory" }
    })");

    OfflineCacheConfig config = ConfigLoader::loadManagerConfig(path);
    EXPECT_EQ("from-file", config.storeName);
    EXPECT_EQ(std::chrono::minutes(30), config.cleanupInterval);
}

TEST_F(ConfigLoaderTest, LoadFailures) {
    EXPECT_THROW(ConfigLoader::loadManagerConfig("/nonexistent/offline_cache.json"), std::runtime_error);

    const std::string path = writeTempFile("{ \"manager\": ");
    EXPECT_THROW(ConfigLoader::loadManagerConfig(path), std::runtime_error);
}

TEST_F(ConfigLoaderTest, ToJsonRoundTrip) {
    OfflineCacheConfig original = createRedisConfig("redis.example", 6390, "pw");
    original.evictionScope = SizeEvictionScope::QUERIES_THEN_FILES;
    original.cleanupInterval = std::chrono::minutes(90);

    nlohmann::json json = ConfigLoader::toJson(original);
    EXPECT_EQ("redis", json["store"]["backend"]);

    OfflineCacheConfig parsed = ConfigLoader::parseManagerConfig(json);
    EXPECT_EQ(original.storeName, parsed.storeName);
    EXPECT_EQ(original.maxQueryAge, parsed.maxQueryAge);
    EXPECT_EQ(original.cleanupInterval, parsed.cleanupInterval);
    EXPECT_EQ(original.evictionScope, parsed.evictionScope);
    EXPECT_EQ(StoreBackend::REDIS, parsed.backend);
    EXPECT_EQ("redis.example", parsed.redis.host);
    EXPECT_EQ(6390, parsed.redis.port);
    EXPECT_EQ("pw", parsed.redis.password);
}
