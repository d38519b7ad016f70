// components/memory_cache/test/unit/test_memory_cache.cpp
#include <gtest/gtest.h>
#include "memory_cache/memory_cache.hpp"
#include "memory_cache/clock.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace memory_cache;

namespace {

// Every value in these tests is 5 characters, i.e. 10 bytes
const std::string kValueA = "aaaaa";
const std::string kValueB = "bbbbb";
const std::string kValueC = "ccccc";
const std::string kValueD = "ddddd";

} // anonymous namespace

class MemoryCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<ManualClock>(fromEpochMillis(1'700'000'000'000));
    }

    std::unique_ptr<MemoryCache<std::string>> makeStringCache(EvictionStrategy strategy,
                                                              std::size_t maxSize = 30) {
        CacheConfig config;
        config.ttl = std::chrono::milliseconds{1000};
        config.maxSize = maxSize;
        config.strategy = strategy;
        return std::make_unique<MemoryCache<std::string>>(config, clock);
    }

    std::shared_ptr<ManualClock> clock;
};

TEST_F(MemoryCacheTest, BasicRoundTrip) {
    MemoryCache<nlohmann::json> cache(CacheConfig{}, clock);

    EXPECT_TRUE(cache.set("k", nlohmann::json{{"v", 1}}));

    auto value = cache.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(nlohmann::json({{"v", 1}}), *value);
    EXPECT_EQ(1u, cache.getStats().entries);
}

TEST_F(MemoryCacheTest, MissOnUnknownKey) {
    auto cache = makeStringCache(EvictionStrategy::LRU);

    EXPECT_FALSE(cache->get("missing").has_value());

    CacheStats stats = cache->getStats();
    EXPECT_EQ(0u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_DOUBLE_EQ(1.0, stats.missRate);
}

TEST_F(MemoryCacheTest, ExpiryBoundary) {
    CacheConfig config;
    config.ttl = std::chrono::milliseconds{1000};
    MemoryCache<int> cache(config, clock);

    EXPECT_TRUE(cache.set("k", 1));

    clock->advance(std::chrono::milliseconds{999});
    auto early = cache.get("k");
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ(1, *early);

    clock->advance(std::chrono::milliseconds{2});
    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(0u, cache.size());
}

TEST_F(MemoryCacheTest, ExpiryIsMeasuredFromInsertionNotAccess) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("k", kValueA);

    clock->advance(std::chrono::milliseconds{800});
    EXPECT_TRUE(cache->get("k").has_value());

    clock->advance(std::chrono::milliseconds{300});
    EXPECT_FALSE(cache->get("k").has_value());
}

TEST_F(MemoryCacheTest, HasDoesNotTouchStatistics) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("k", kValueA);

    EXPECT_TRUE(cache->has("k"));
    EXPECT_FALSE(cache->has("other"));

    auto metadata = cache->inspect("k");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(1u, metadata->accessCount);

    CacheStats stats = cache->getStats();
    EXPECT_EQ(0u, stats.hits);
    EXPECT_EQ(0u, stats.misses);
}

TEST_F(MemoryCacheTest, HasSweepsExpiredEntry) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("k", kValueA);

    clock->advance(std::chrono::milliseconds{1001});

    EXPECT_FALSE(cache->has("k"));
    EXPECT_FALSE(cache->inspect("k").has_value());
    EXPECT_EQ(0u, cache->currentSize());
}

TEST_F(MemoryCacheTest, GetUpdatesAccessBookkeeping) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("k", kValueA);

    clock->advance(std::chrono::milliseconds{100});
    cache->get("k");
    cache->get("k");

    auto metadata = cache->inspect("k");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(3u, metadata->accessCount);
    EXPECT_EQ(clock->now(), metadata->lastAccessedAt);
    EXPECT_LT(metadata->insertedAt, metadata->lastAccessedAt);
}

TEST_F(MemoryCacheTest, LruEvictsLeastRecentlyTouched) {
    auto cache = makeStringCache(EvictionStrategy::LRU);

    cache->set("A", kValueA);
    cache->set("B", kValueB);
    cache->set("C", kValueC);

    cache->get("A");
    cache->get("B");

    EXPECT_TRUE(cache->set("D", kValueD));

    EXPECT_TRUE(cache->has("A"));
    EXPECT_TRUE(cache->has("B"));
    EXPECT_FALSE(cache->has("C"));
    EXPECT_TRUE(cache->has("D"));
    EXPECT_EQ(1u, cache->getStats().evictions);
}

TEST_F(MemoryCacheTest, LruUsesClockBeforeSequence) {
    auto cache = makeStringCache(EvictionStrategy::LRU);

    cache->set("A", kValueA);
    clock->advance(std::chrono::milliseconds{10});
    cache->set("B", kValueB);
    clock->advance(std::chrono::milliseconds{10});
    cache->set("C", kValueC);
    clock->advance(std::chrono::milliseconds{10});
    cache->get("A");

    cache->set("D", kValueD);

    EXPECT_TRUE(cache->has("A"));
    EXPECT_FALSE(cache->has("B"));
    EXPECT_TRUE(cache->has("C"));
}

TEST_F(MemoryCacheTest, FifoIgnoresAccessPattern) {
    auto cache = makeStringCache(EvictionStrategy::FIFO);

    cache->set("A", kValueA);
    cache->set("B", kValueB);
    cache->set("C", kValueC);

    cache->get("A");
    cache->get("A");
    cache->get("B");

    cache->set("D", kValueD);
    EXPECT_FALSE(cache->has("A"));

    cache->set("E", kValueA);
    EXPECT_FALSE(cache->has("B"));
    EXPECT_TRUE(cache->has("C"));
    EXPECT_TRUE(cache->has("D"));
    EXPECT_TRUE(cache->has("E"));
    EXPECT_EQ(2u, cache->getStats().evictions);
}

TEST_F(MemoryCacheTest, LfuEvictsLeastUsedWithInsertionTieBreak) {
    auto cache = makeStringCache(EvictionStrategy::LFU);

    cache->set("A", kValueA);
    cache->set("B", kValueB);
    cache->set("C", kValueC);

    cache->get("A");
    cache->get("A");

    // B and C were never read; B was inserted first
    cache->set("D", kValueD);

    EXPECT_TRUE(cache->has("A"));
    EXPECT_FALSE(cache->has("B"));
    EXPECT_TRUE(cache->has("C"));
    EXPECT_TRUE(cache->has("D"));
}

TEST_F(MemoryCacheTest, EvictsOnlyAsMuchAsNeeded) {
    auto cache = makeStringCache(EvictionStrategy::FIFO, 40);

    cache->set("A", kValueA);
    cache->set("B", kValueB);
    cache->set("C", kValueC);

    // 30 bytes held, 20 more requested: exactly one 10-byte victim suffices
    EXPECT_TRUE(cache->set("big", "0123456789"));

    EXPECT_FALSE(cache->has("A"));
    EXPECT_TRUE(cache->has("B"));
    EXPECT_TRUE(cache->has("C"));
    EXPECT_EQ(40u, cache->currentSize());
}

TEST_F(MemoryCacheTest, SizeNeverExceedsBudget) {
    auto cache = makeStringCache(EvictionStrategy::LRU, 100);

    for (int i = 0; i < 200; ++i) {
        std::string value(static_cast<std::size_t>(i % 17 + 1), 'x');
        cache->set("key-" + std::to_string(i), value);
        ASSERT_LE(cache->currentSize(), 100u);
    }
}

TEST_F(MemoryCacheTest, OversizedValueIsRejected) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("A", kValueA);

    EXPECT_FALSE(cache->set("huge", std::string(16, 'x')));

    EXPECT_TRUE(cache->has("A"));
    EXPECT_FALSE(cache->has("huge"));
    EXPECT_EQ(1u, cache->getStats().rejections);
    EXPECT_EQ(0u, cache->getStats().evictions);
}

TEST_F(MemoryCacheTest, ReplacingValueReleasesOldSize) {
    auto cache = makeStringCache(EvictionStrategy::LRU);

    cache->set("A", kValueA);
    cache->set("B", kValueB);
    cache->set("C", kValueC);

    EXPECT_TRUE(cache->set("B", "bb"));

    EXPECT_EQ(3u, cache->size());
    EXPECT_EQ(24u, cache->currentSize());
    EXPECT_EQ("bb", *cache->get("B"));
    EXPECT_EQ(0u, cache->getStats().evictions);
}

TEST_F(MemoryCacheTest, RemoveReportsExistence) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("A", kValueA);

    EXPECT_TRUE(cache->remove("A"));
    EXPECT_FALSE(cache->remove("A"));
    EXPECT_EQ(0u, cache->currentSize());
}

TEST_F(MemoryCacheTest, ClearResetsEntriesAndCounters) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("A", kValueA);
    cache->get("A");
    cache->get("missing");

    cache->clear();

    CacheStats stats = cache->getStats();
    EXPECT_EQ(0u, stats.entries);
    EXPECT_EQ(0u, stats.size);
    EXPECT_EQ(0u, stats.hits);
    EXPECT_EQ(0u, stats.misses);
    EXPECT_DOUBLE_EQ(0.0, stats.hitRate);
}

TEST_F(MemoryCacheTest, ResetStatsKeepsEntries) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("A", kValueA);
    cache->get("A");

    cache->resetStats();

    EXPECT_EQ(0u, cache->getStats().hits);
    EXPECT_EQ(1u, cache->size());
}

TEST_F(MemoryCacheTest, KeysIncludeUnsweptExpiredEntries) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("first", kValueA);
    clock->advance(std::chrono::milliseconds{600});
    cache->set("second", kValueB);
    clock->advance(std::chrono::milliseconds{600});

    std::vector<std::string> expected = {"first", "second"};
    EXPECT_EQ(expected, cache->keys());
}

TEST_F(MemoryCacheTest, EntriesSweepExpired) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("first", kValueA);
    clock->advance(std::chrono::milliseconds{600});
    cache->set("second", kValueB);
    clock->advance(std::chrono::milliseconds{600});

    auto live = cache->entries();
    ASSERT_EQ(1u, live.size());
    EXPECT_EQ("second", live[0].first);
    EXPECT_EQ(kValueB, live[0].second);
    EXPECT_EQ(1u, cache->keys().size());
}

TEST_F(MemoryCacheTest, CleanupRemovesOnlyExpired) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("old1", kValueA);
    cache->set("old2", kValueB);
    clock->advance(std::chrono::milliseconds{900});
    cache->set("fresh", kValueC);
    clock->advance(std::chrono::milliseconds{200});

    EXPECT_EQ(2u, cache->cleanup());
    EXPECT_EQ(1u, cache->size());
    EXPECT_EQ(10u, cache->currentSize());
    EXPECT_EQ(0u, cache->cleanup());
}

TEST_F(MemoryCacheTest, HitRateFromCumulativeCounters) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("A", kValueA);

    cache->get("A");
    cache->get("A");
    cache->get("A");
    cache->get("missing");

    CacheStats stats = cache->getStats();
    EXPECT_DOUBLE_EQ(0.75, stats.hitRate);
    EXPECT_DOUBLE_EQ(0.25, stats.missRate);

    // getStats does not reset anything
    EXPECT_EQ(stats.hits, cache->getStats().hits);
}

TEST_F(MemoryCacheTest, RemoveIfMatchesPredicate) {
    auto cache = makeStringCache(EvictionStrategy::LRU);
    cache->set("user:1", kValueA);
    cache->set("user:2", kValueB);
    cache->set("session:1", kValueC);

    auto removed = cache->removeIf([](const std::string& key) {
        return key.rfind("user:", 0) == 0;
    });

    EXPECT_EQ(2u, removed);
    EXPECT_TRUE(cache->has("session:1"));
    EXPECT_EQ(10u, cache->currentSize());
}

TEST_F(MemoryCacheTest, InvalidConfigurationThrows) {
    CacheConfig zeroSize;
    zeroSize.maxSize = 0;
    EXPECT_THROW({ MemoryCache<int> cache(zeroSize, clock); }, std::invalid_argument);

    CacheConfig zeroTtl;
    zeroTtl.ttl = std::chrono::milliseconds{0};
    EXPECT_THROW({ MemoryCache<int> cache(zeroTtl, clock); }, std::invalid_argument);

    EXPECT_THROW({ MemoryCache<int> cache(CacheConfig{}, nullptr); }, std::invalid_argument);
}

TEST_F(MemoryCacheTest, CustomSizeEstimator) {
    struct FixedEstimator {
        std::size_t operator()(const std::vector<int>& values) const {
            return values.size() * sizeof(int);
        }
    };

    CacheConfig config;
    config.maxSize = 4 * sizeof(int);
    MemoryCache<std::vector<int>, FixedEstimator> cache(config, clock);

    EXPECT_TRUE(cache.set("a", {1, 2, 3}));
    EXPECT_EQ(3 * sizeof(int), cache.currentSize());
    EXPECT_FALSE(cache.set("b", {1, 2, 3, 4, 5}));
}

TEST_F(MemoryCacheTest, ConcurrentAccess) {
    auto cache = makeStringCache(EvictionStrategy::LRU, 1000);
    const int numThreads = 4;
    const int operationsPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < operationsPerThread; ++i) {
                const std::string key = "key-" + std::to_string((t * operationsPerThread + i) % 64);
                cache->set(key, kValueA);
                cache->get(key);
                cache->has(key);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    CacheStats stats = cache->getStats();
    EXPECT_LE(stats.size, 1000u);
    EXPECT_EQ(static_cast<std::uint64_t>(numThreads * operationsPerThread), stats.hits + stats.misses);
}
