// components/offline_cache/test/utils/test_utils.hpp
#pragma once

#include "offline_cache/blob_store.hpp"
#include "offline_cache/types.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace offline_cache {
namespace test {

/**
 * @brief gmock double of the blob store for failure-path tests
 */
class MockBlobStore : public IBlobStore {
public:
    MOCK_METHOD(bool, isSupported, (), (override));
    MOCK_METHOD(void, open, (const std::string& storeName), (override));
    MOCK_METHOD(void, put, (const std::string& key, const Blob& blob), (override));
    MOCK_METHOD(std::optional<Blob>, get, (const std::string& key), (override));
    MOCK_METHOD(std::vector<std::string>, listKeys, (const std::string& prefix), (override));
    MOCK_METHOD(bool, remove, (const std::string& key), (override));
};

// Test configuration helpers
class TestConfig {
public:
    /**
     * @brief Defaults with scheduled cleanup disabled
     */
    static OfflineCacheConfig getTestManagerConfig();

    /**
     * @brief Redis settings from OFFLINE_CACHE_TEST_REDIS_HOST/PORT
     */
    static OfflineCacheConfig getTestRedisConfig();

    // Environment variable helpers
    static std::string getEnvVar(const std::string& name, const std::string& defaultValue = "");
};

// Test record creators
class TestData {
public:
    // Fixed, millisecond-aligned start time for ManualClock
    static TimePoint startTime();

    static CachedFile createFile(const std::string& id, TimePoint uploadDate,
                                 std::size_t metadataBytes = 0);

    static nlohmann::json createResults(std::size_t payloadBytes);

    static Blob createJsonBlob(const nlohmann::json& document, TimePoint cachedAt = startTime());
};

// Test assertions
class TestAssertions {
public:
    static void assertFileEquals(const CachedFile& expected, const CachedFile& actual);

    /**
     * @brief Sum of body sizes of every key under prefix
     */
    static std::uint64_t storedBytes(IBlobStore& store, const std::string& prefix);
};

} // namespace test
} // namespace offline_cache
