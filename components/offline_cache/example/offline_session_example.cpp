// components/offline_cache/example/offline_session_example.cpp
#include "offline_cache/offline_cache_manager.hpp"
#include "offline_cache/blob_store.hpp"
#include "memory_cache/clock.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>

using namespace offline_cache;

void printStats(const PersistentCacheStats& stats) {
    std::cout << "\n=== Offline Cache Statistics ===" << std::endl;
    std::cout << toString(stats) << std::endl;
    std::cout << "================================\n" << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "Offline Cache Example" << std::endl;
    std::cout << "=====================" << std::endl;

    OfflineCacheConfig config = createDevelopmentConfig();
    config.enableScheduledCleanup = false;
    config.maxCacheSizeBytes = 16 * 1024;

    if (argc >= 2) {
        config = createRedisConfig(argv[1], argc >= 3 ? std::stoi(argv[2]) : 6379);
        config.enableScheduledCleanup = false;
    }

    try {
        // Manual clock so the example can fast-forward through expiry
        auto clock = std::make_shared<memory_cache::ManualClock>();
        OfflineCacheManager manager(config, createBlobStore(config), clock);

        if (!manager.initialize()) {
            std::cerr << "Offline cache unavailable: " << manager.lastError() << std::endl;
            return 1;
        }

        std::cout << "Store '" << config.storeName << "' opened ("
                  << toString(manager.getState()) << ")" << std::endl;

        std::cout << "\n--- Online session ---" << std::endl;

        CachedFile model;
        model.id = "tower-a";
        model.name = "tower-a.ifc";
        model.size = 48 * 1024 * 1024;
        model.type = "application/x-step";
        model.uploadDate = clock->now();
        model.metadata = nlohmann::json{{"schema", "IFC4"}, {"storeys", 12}};
        manager.cacheFile(model);

        manager.cacheQuery("SELECT * FROM IfcWall", {{"count", 412}}, model.id);
        manager.cacheQuery("SELECT * FROM IfcDoor", {{"count", 96}}, model.id);
        manager.cacheQuery("recent projects", {{"projects", {"tower-a", "depot"}}});
        manager.storeUserPreferences({{"theme", "dark"}, {"units", "metric"}});

        printStats(manager.getCacheStats());

        std::cout << "--- Offline, two days later ---" << std::endl;
        clock->advance(std::chrono::hours(48));

        auto walls = manager.lookupQuery("SELECT * FROM IfcWall", model.id);
        std::cout << "Walls query: " << toString(walls.status);
        if (walls) {
            std::cout << " " << walls.value->results.dump();
        }
        std::cout << std::endl;

        auto file = manager.getCachedFile(model.id);
        std::cout << "Model metadata: " << (file ? file->metadata->dump() : "absent") << std::endl;

        std::cout << "\n--- Offline, eight days later ---" << std::endl;
        clock->advance(std::chrono::hours(6 * 24));

        std::cout << "Walls query: " << toString(manager.lookupQuery("SELECT * FROM IfcWall", model.id).status)
                  << std::endl;
        std::cout << "Preferences: " << manager.getUserPreferences().value_or(nlohmann::json()).dump()
                  << std::endl;

        manager.cleanupCache();
        printStats(manager.getCacheStats());

        std::cout << "--- Size limit ---" << std::endl;
        for (int i = 0; i < 20; ++i) {
            manager.cacheQuery("report " + std::to_string(i), {{"rows", std::string(1024, 'x')}});
            clock->advance(std::chrono::seconds(1));
        }
        std::cout << "Before enforcement: " << manager.getCacheStats().totalSize << " bytes" << std::endl;
        manager.enforceCacheSizeLimit();
        std::cout << "After enforcement: " << manager.getCacheStats().totalSize << " bytes" << std::endl;

        manager.clearAllCache();
        manager.shutdown();

        std::cout << "\nExample completed successfully!" << std::endl;

    } catch (const std::exception& e) {
        spdlog::error("Exception: {}", e.what());
        return 1;
    }

    return 0;
}
