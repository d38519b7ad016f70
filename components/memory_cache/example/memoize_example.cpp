// components/memory_cache/example/memoize_example.cpp
#include "memory_cache/memoize.hpp"
#include "memory_cache/presets.hpp"
#include "memory_cache/invalidation.hpp"
#include "memory_cache/batch_cache.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace memory_cache;

void printStats(const std::string& name, const CacheStats& stats) {
    std::cout << "\n=== " << name << " ===" << std::endl;
    std::cout << toString(stats) << std::endl;
}

int main() {
    spdlog::set_level(spdlog::level::debug);

    std::cout << "Memory Cache Example" << std::endl;
    std::cout << "====================" << std::endl;

    PresetCaches caches;

    // Synchronous memoization of an expensive lookup
    std::function<nlohmann::json(std::string)> loadElement = [](std::string id) {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        return nlohmann::json{{"id", id}, {"type", "IfcWall"}, {"storey", 2}};
    };
    auto cachedLoadElement = memoize(loadElement, caches.api());

    for (int i = 0; i < 3; ++i) {
        auto start = std::chrono::steady_clock::now();
        auto element = cachedLoadElement("wall-17");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << "Call " << (i + 1) << ": " << element.dump()
                  << " (" << elapsed.count() << "ms)" << std::endl;
    }

    // Asynchronous wrapper with failure short-circuit
    int attempts = 0;
    std::function<std::future<nlohmann::json>(std::string)> fetchRemote = [&attempts](std::string endpoint) {
        ++attempts;
        return std::async(std::launch::async, [endpoint]() -> nlohmann::json {
            throw std::runtime_error("endpoint " + endpoint + " unreachable");
        });
    };

    AsyncCacheOptions options;
    options.cacheErrors = true;
    options.errorTtl = std::chrono::seconds{30};
    auto cachedFetchRemote = cacheAsync(fetchRemote, caches.api(), options);

    for (int i = 0; i < 3; ++i) {
        try {
            cachedFetchRemote("/analytics").get();
        } catch (const std::exception& e) {
            std::cout << "Fetch failed: " << e.what() << std::endl;
        }
    }
    std::cout << "Remote attempts: " << attempts << std::endl;

    // Deferred writes
    BatchCache batch;
    batch.set(caches.ui(), "panel:files", nlohmann::json{{"open", true}})
         .set(caches.ui(), "panel:query", nlohmann::json{{"open", false}})
         .set(caches.preferences(), "theme", "dark")
         .remove(caches.api(), "[\"wall-17\"]");
    std::cout << "Applied " << batch.execute() << " batched operations" << std::endl;

    std::cout << "Invalidated " << invalidatePattern(*caches.ui(), "panel:*")
              << " panel entries" << std::endl;

    printStats("API cache", caches.api()->getStats());
    printStats("UI cache", caches.ui()->getStats());

    return 0;
}
