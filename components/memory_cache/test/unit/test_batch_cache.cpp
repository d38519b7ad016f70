// components/memory_cache/test/unit/test_batch_cache.cpp
#include <gtest/gtest.h>
#include "memory_cache/batch_cache.hpp"
#include "memory_cache/clock.hpp"
#include <memory>
#include <string>

using namespace memory_cache;

class BatchCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto clock = std::make_shared<ManualClock>();
        strings = std::make_shared<MemoryCache<std::string>>(CacheConfig{}, clock);
        numbers = std::make_shared<MemoryCache<int>>(CacheConfig{}, clock);
    }

    std::shared_ptr<MemoryCache<std::string>> strings;
    std::shared_ptr<MemoryCache<int>> numbers;
};

TEST_F(BatchCacheTest, NothingHappensBeforeExecute) {
    BatchCache batch;
    batch.set(strings, "name", "widget").set(numbers, "count", 3);

    EXPECT_EQ(2u, batch.size());
    EXPECT_FALSE(strings->has("name"));
    EXPECT_FALSE(numbers->has("count"));
}

TEST_F(BatchCacheTest, ExecuteReplaysInOrderAcrossCaches) {
    numbers->set("stale", 1);

    BatchCache batch;
    batch.set(strings, "name", "first")
         .set(strings, "name", "second")
         .set(numbers, "count", 3)
         .remove(numbers, "stale")
         .remove(strings, "name")
         .set(strings, "name", "third");

    EXPECT_EQ(6u, batch.execute());

    EXPECT_EQ("third", *strings->get("name"));
    EXPECT_EQ(3, *numbers->get("count"));
    EXPECT_FALSE(numbers->has("stale"));
    EXPECT_TRUE(batch.empty());
}

TEST_F(BatchCacheTest, ExecuteTwiceAppliesOnce) {
    BatchCache batch;
    batch.set(numbers, "count", 1);

    EXPECT_EQ(1u, batch.execute());
    numbers->remove("count");

    EXPECT_EQ(0u, batch.execute());
    EXPECT_FALSE(numbers->has("count"));
}

TEST_F(BatchCacheTest, ClearDiscardsWithoutApplying) {
    BatchCache batch;
    batch.set(strings, "name", "value").remove(numbers, "count");

    batch.clear();

    EXPECT_TRUE(batch.empty());
    EXPECT_EQ(0u, batch.execute());
    EXPECT_FALSE(strings->has("name"));
}

TEST_F(BatchCacheTest, PendingListsOperations) {
    BatchCache batch;
    batch.set(strings, "a", "1").remove(strings, "b");

    auto pending = batch.pending();
    ASSERT_EQ(2u, pending.size());
    EXPECT_EQ(BatchOperationType::SET, pending[0].type);
    EXPECT_EQ("a", pending[0].key);
    EXPECT_EQ(BatchOperationType::DELETE, pending[1].type);
    EXPECT_EQ("DELETE", toString(pending[1].type));
}

TEST_F(BatchCacheTest, NullCacheIsRejected) {
    BatchCache batch;
    std::shared_ptr<MemoryCache<int>> missing;

    EXPECT_THROW(batch.set(missing, "k", 1), std::invalid_argument);
    EXPECT_TRUE(batch.empty());
}
