// components/memory_cache/benchmark/benchmark_memory_cache.cpp
#include <benchmark/benchmark.h>
#include "memory_cache/memory_cache.hpp"
#include "memory_cache/presets.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace memory_cache;

static CacheConfig getBenchmarkConfig(EvictionStrategy strategy, std::size_t maxSize) {
    CacheConfig config;
    config.ttl = std::chrono::minutes(30);
    config.maxSize = maxSize;
    config.strategy = strategy;
    return config;
}

static std::vector<std::string> makeKeys(std::size_t count) {
    std::vector<std::string> keys;
    keys.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        keys.push_back("key-" + std::to_string(i));
    }
    return keys;
}

// Lookup benchmarks
static void BM_GetHit(benchmark::State& state) {
    MemoryCache<std::string> cache(getBenchmarkConfig(EvictionStrategy::LRU, 64 * 1024 * 1024));
    const auto keys = makeKeys(static_cast<std::size_t>(state.range(0)));
    for (const auto& key : keys) {
        cache.set(key, "cached value");
    }

    std::size_t index = 0;
    for (auto _ : state) {
        auto value = cache.get(keys[index++ % keys.size()]);
        benchmark::DoNotOptimize(value);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GetHit)->Arg(100)->Arg(10000);

static void BM_GetMiss(benchmark::State& state) {
    MemoryCache<std::string> cache;

    for (auto _ : state) {
        auto value = cache.get("missing");
        benchmark::DoNotOptimize(value);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GetMiss);

static void BM_SetWithinBudget(benchmark::State& state) {
    MemoryCache<std::string> cache(getBenchmarkConfig(EvictionStrategy::LRU, 64 * 1024 * 1024));
    const auto keys = makeKeys(1000);

    std::size_t index = 0;
    for (auto _ : state) {
        cache.set(keys[index++ % keys.size()], "cached value");
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SetWithinBudget);

// Eviction benchmarks: every set past the first few hundred evicts
static void BM_SetWithEviction(benchmark::State& state) {
    const auto strategy = static_cast<EvictionStrategy>(state.range(0));
    // Room for 256 values of 24 bytes
    MemoryCache<std::string> cache(getBenchmarkConfig(strategy, 256 * 24));
    const auto keys = makeKeys(4096);

    std::size_t index = 0;
    for (auto _ : state) {
        cache.set(keys[index++ % keys.size()], "cached value");
    }

    state.SetLabel(toString(strategy));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SetWithEviction)
    ->Arg(static_cast<int>(EvictionStrategy::LRU))
    ->Arg(static_cast<int>(EvictionStrategy::LFU))
    ->Arg(static_cast<int>(EvictionStrategy::FIFO));

static void BM_SetJsonDocument(benchmark::State& state) {
    JsonCache cache(CachePresets::api());
    nlohmann::json document = {
        {"query", "SELECT walls WHERE storey = 2"},
        {"results", {{"count", 42}, {"ids", {1, 2, 3, 4, 5}}}},
        {"cached", true}
    };

    for (auto _ : state) {
        cache.set("query", document);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * document.dump().size());
}
BENCHMARK(BM_SetJsonDocument);

BENCHMARK_MAIN();
