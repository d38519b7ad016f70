// components/offline_cache/src/main.cpp
#include "offline_cache/blob_store.hpp"
#include "offline_cache/config_loader.hpp"
#include "offline_cache/offline_cache_manager.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

void printQueries(const std::vector<offline_cache::CachedQuery>& queries) {
    std::cout << queries.size() << " cached queries" << std::endl;
    for (const auto& query : queries) {
        std::cout << "  " << query.id
                  << " [" << offline_cache::formatIso8601(query.timestamp) << "]"
                  << (query.fileId ? " file=" + *query.fileId : std::string())
                  << " " << query.query << std::endl;
    }
}

void printFiles(const std::vector<offline_cache::CachedFile>& files) {
    std::cout << files.size() << " cached files" << std::endl;
    for (const auto& file : files) {
        std::cout << "  " << file.id << " " << file.name
                  << " (" << file.size << " bytes, " << file.type << ", uploaded "
                  << offline_cache::formatIso8601(file.uploadDate) << ")" << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        // Set up command line options
        po::options_description desc("Offline cache maintenance options");
        desc.add_options()
            ("help,h", "Print help message")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("store,s", po::value<std::string>(), "Store backend override (memory, redis)")
            ("redis-host", po::value<std::string>(), "Redis host override")
            ("redis-port", po::value<int>(), "Redis port override")
            ("command", po::value<std::string>()->default_value("stats"),
             "stats | cleanup | enforce | clear | list-queries | list-files | get-preferences")
            ("debug,d", po::bool_switch()->default_value(false), "Enable debug logging");

        po::positional_options_description positional;
        positional.add("command", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);

        // Check for help
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        offline_cache::OfflineCacheConfig config = vm.count("config")
            ? offline_cache::ConfigLoader::loadManagerConfig(vm["config"].as<std::string>())
            : offline_cache::createDefaultConfig();

        if (vm.count("store")) {
            const auto backendName = vm["store"].as<std::string>();
            auto backend = offline_cache::parseStoreBackend(backendName);
            if (!backend) {
                std::cerr << "Unknown store backend: " << backendName << std::endl;
                return 1;
            }
            config.backend = *backend;
        }
        if (vm.count("redis-host")) {
            config.redis.host = vm["redis-host"].as<std::string>();
        }
        if (vm.count("redis-port")) {
            config.redis.port = vm["redis-port"].as<int>();
        }
        if (vm["debug"].as<bool>()) {
            config.enableDebugLogging = true;
        }

        // One-shot run, no periodic cleanup
        config.enableScheduledCleanup = false;

        if (!offline_cache::isPersistent(config.backend)) {
            spdlog::warn("Store backend '{}' keeps nothing between runs; commands see an empty cache. "
                         "Select a persistent backend with --store redis or a config file",
                         offline_cache::toString(config.backend));
        }

        offline_cache::OfflineCacheManager manager(config, offline_cache::createBlobStore(config));

        if (!manager.initialize()) {
            std::cerr << "Offline cache unavailable";
            const auto error = manager.lastError();
            if (!error.empty()) {
                std::cerr << ": " << error;
            }
            std::cerr << std::endl;
            return 1;
        }

        const auto command = vm["command"].as<std::string>();
        bool success = true;

        if (command == "stats") {
            std::cout << offline_cache::toString(manager.getCacheStats()) << std::endl;
        } else if (command == "cleanup") {
            success = manager.cleanupCache();
            std::cout << (success ? "Cleanup completed" : "Cleanup failed") << std::endl;
        } else if (command == "enforce") {
            success = manager.enforceCacheSizeLimit();
            std::cout << (success ? "Size limit enforced" : "Size limit enforcement failed") << std::endl;
        } else if (command == "clear") {
            success = manager.clearAllCache();
            std::cout << (success ? "Cache cleared" : "Clearing cache failed") << std::endl;
        } else if (command == "list-queries") {
            printQueries(manager.getAllQueries());
        } else if (command == "list-files") {
            printFiles(manager.getAllFiles());
        } else if (command == "get-preferences") {
            auto preferences = manager.lookupUserPreferences();
            if (preferences.status == offline_cache::LookupStatus::ERROR) {
                std::cerr << "Reading preferences failed: " << preferences.errorMessage << std::endl;
                success = false;
            } else if (preferences) {
                std::cout << preferences.value->dump(2) << std::endl;
            } else {
                std::cout << "No preferences stored" << std::endl;
            }
        } else {
            std::cerr << "Unknown command: " << command << "\n" << desc << std::endl;
            return 1;
        }

        if (!success) {
            std::cerr << "Error: " << manager.lastError() << std::endl;
        }

        return success ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
