// components/offline_cache/include/offline_cache/config_loader.hpp
#pragma once

#include "offline_cache/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace offline_cache {

/**
 * @brief Loads OfflineCacheConfig from JSON
 *
 * The document has a "manager" section and a "store" section; missing
 * fields keep their defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Load and validate configuration from a JSON file
     * @param filepath Path to the JSON configuration file
     * @return Parsed configuration
     * @throws std::runtime_error if the file cannot be read, parsed or
     *         contains invalid values
     */
    static OfflineCacheConfig loadManagerConfig(const std::string& filepath);

    /**
     * @brief Parse configuration from a JSON document
     * @throws std::runtime_error on unknown enum names, wrong types or an
     *         invalid resulting configuration
     */
    static OfflineCacheConfig parseManagerConfig(const nlohmann::json& json);

    /**
     * @brief Inverse of parseManagerConfig
     */
    static nlohmann::json toJson(const OfflineCacheConfig& config);

private:
    static void parseManagerSection(const nlohmann::json& json, OfflineCacheConfig& config);
    static void parseStoreSection(const nlohmann::json& json, OfflineCacheConfig& config);

    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace offline_cache
