// components/offline_cache/test/utils/test_utils.cpp
#include "test_utils.hpp"
#include <cstdlib>

namespace offline_cache {
namespace test {

OfflineCacheConfig TestConfig::getTestManagerConfig() {
    OfflineCacheConfig config = createDefaultConfig();
    config.storeName = "offline-cache-test";
    config.enableScheduledCleanup = false;
    return config;
}

OfflineCacheConfig TestConfig::getTestRedisConfig() {
    OfflineCacheConfig config = getTestManagerConfig();
    config.backend = StoreBackend::REDIS;
    config.redis.host = getEnvVar("OFFLINE_CACHE_TEST_REDIS_HOST", "localhost");
    config.redis.port = std::stoi(getEnvVar("OFFLINE_CACHE_TEST_REDIS_PORT", "6379"));
    config.redis.password = getEnvVar("OFFLINE_CACHE_TEST_REDIS_PASSWORD");
    config.redis.connectionTimeout = std::chrono::milliseconds{1000};
    return config;
}

std::string TestConfig::getEnvVar(const std::string& name, const std::string& defaultValue) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : defaultValue;
}

TimePoint TestData::startTime() {
    // 2024-03-01T12:00:00.000Z
    return memory_cache::fromEpochMillis(1709294400000);
}

CachedFile TestData::createFile(const std::string& id, TimePoint uploadDate, std::size_t metadataBytes) {
    CachedFile file;
    file.id = id;
    file.name = id + ".ifc";
    file.size = 1024 * 1024;
    file.type = "application/x-step";
    file.uploadDate = uploadDate;
    if (metadataBytes > 0) {
        file.metadata = nlohmann::json{{"schema", "IFC4"}, {"notes", std::string(metadataBytes, 'm')}};
    }
    return file;
}

nlohmann::json TestData::createResults(std::size_t payloadBytes) {
    return nlohmann::json{
        {"count", 1},
        {"rows", std::string(payloadBytes, 'r')}
    };
}

Blob TestData::createJsonBlob(const nlohmann::json& document, TimePoint cachedAt) {
    Blob blob;
    blob.body = document.dump();
    blob.metadata.cachedAt = cachedAt;
    return blob;
}

void TestAssertions::assertFileEquals(const CachedFile& expected, const CachedFile& actual) {
    EXPECT_EQ(expected.id, actual.id);
    EXPECT_EQ(expected.name, actual.name);
    EXPECT_EQ(expected.size, actual.size);
    EXPECT_EQ(expected.type, actual.type);
    EXPECT_EQ(memory_cache::toEpochMillis(expected.uploadDate),
              memory_cache::toEpochMillis(actual.uploadDate));
    EXPECT_EQ(expected.metadata, actual.metadata);
    EXPECT_EQ(expected.thumbnail, actual.thumbnail);
    EXPECT_EQ(expected.cached, actual.cached);
}

std::uint64_t TestAssertions::storedBytes(IBlobStore& store, const std::string& prefix) {
    std::uint64_t total = 0;
    for (const auto& key : store.listKeys(prefix)) {
        auto blob = store.get(key);
        if (blob) {
            total += blob->body.size();
        }
    }
    return total;
}

} // namespace test
} // namespace offline_cache
