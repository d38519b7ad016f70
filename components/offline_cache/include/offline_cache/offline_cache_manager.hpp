// components/offline_cache/include/offline_cache/offline_cache_manager.hpp
#pragma once

#include "offline_cache/blob_store.hpp"
#include "offline_cache/types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace offline_cache {

/**
 * @brief Durable cache of query results, file metadata and user preferences
 *
 * Every record is an independent JSON blob in the blob store under
 * "{storeName}://{domain}/{id}" with domain one of queries, files,
 * preferences or meta. Queries and files expire by age when read; expired
 * records are only deleted by cleanupCache(), which also keeps the total
 * stored size under the configured budget.
 *
 * Storage failures never escape: they are logged, kept in lastError() and
 * turned into false, nullopt or an empty list. The lookup* variants report
 * them as LookupStatus::ERROR instead.
 *
 * cleanupCache() and enforceCacheSizeLimit() are serialised by a
 * maintenance mutex, including the run started by the cleanup timer.
 */
class OfflineCacheManager {
public:
    static constexpr const char* kQueriesDomain = "queries";
    static constexpr const char* kFilesDomain = "files";
    static constexpr const char* kPreferencesDomain = "preferences";
    static constexpr const char* kMetaDomain = "meta";

    static constexpr const char* kUserPreferencesId = "user";
    static constexpr const char* kLastCleanupId = "lastCleanup";

    /**
     * @brief Constructor
     * @param config Manager configuration
     * @param store Blob store holding the data
     * @param clock Time source for timestamps and ages
     * @throws std::invalid_argument on invalid config or null store/clock
     */
    OfflineCacheManager(const OfflineCacheConfig& config,
                        std::shared_ptr<IBlobStore> store,
                        std::shared_ptr<const IClock> clock = memory_cache::defaultClock());

    /**
     * @brief Destructor - stops the cleanup timer
     */
    ~OfflineCacheManager();

    // Non-copyable, non-movable (contains mutex and threads)
    OfflineCacheManager(const OfflineCacheManager&) = delete;
    OfflineCacheManager& operator=(const OfflineCacheManager&) = delete;
    OfflineCacheManager(OfflineCacheManager&&) = delete;
    OfflineCacheManager& operator=(OfflineCacheManager&&) = delete;

    /**
     * @brief Probe and open the blob store, then schedule periodic cleanup
     * @return false if the store is unsupported or cannot be opened
     */
    bool initialize();

    /**
     * @brief Stop periodic cleanup
     *
     * The store stays open and the manager usable (state INITIALIZED).
     */
    void shutdown();

    ManagerState getState() const { return state_.load(); }

    /**
     * @brief true in INITIALIZED or ACTIVE
     */
    bool isReady() const;

    // Queries

    /**
     * @brief Store query results, replacing any earlier results of the same
     *        (query, fileId) pair
     */
    bool cacheQuery(const std::string& query, const nlohmann::json& results,
                    const std::optional<std::string>& fileId = std::nullopt);

    /**
     * @brief Cached results younger than maxQueryAge
     */
    std::optional<CachedQuery> getCachedQuery(const std::string& query,
                                              const std::optional<std::string>& fileId = std::nullopt);

    LookupResult<CachedQuery> lookupQuery(const std::string& query,
                                          const std::optional<std::string>& fileId = std::nullopt);

    /**
     * @brief Every unexpired query; the store is not modified
     */
    std::vector<CachedQuery> getAllQueries();

    // Files

    bool cacheFile(const CachedFile& file);

    /**
     * @brief Cached metadata whose uploadDate is younger than maxFileAge
     */
    std::optional<CachedFile> getCachedFile(const std::string& fileId);

    LookupResult<CachedFile> lookupFile(const std::string& fileId);

    std::vector<CachedFile> getAllFiles();

    // User preferences (single slot, never expires)

    bool storeUserPreferences(const nlohmann::json& preferences);
    std::optional<nlohmann::json> getUserPreferences();
    LookupResult<nlohmann::json> lookupUserPreferences();

    // Maintenance

    /**
     * @brief Size of every stored body, live record counts, last cleanup
     */
    PersistentCacheStats getCacheStats();

    /**
     * @brief Delete expired queries and files, enforce the size budget and
     *        record the cleanup time
     * @return false if any step failed
     */
    bool cleanupCache();

    /**
     * @brief Evict oldest records until the stored size is at most
     *        maxCacheSizeBytes * sizeLimitTargetRatio
     *
     * Does nothing while the size is within maxCacheSizeBytes. Which domains
     * are evicted depends on config.evictionScope.
     *
     * @return false on storage failure
     */
    bool enforceCacheSizeLimit();

    /**
     * @brief Delete every key of this manager's namespace
     */
    bool clearAllCache();

    /**
     * @brief Key of a record, e.g. "offline-cache://queries/global_cQ"
     */
    std::string makeKey(const std::string& domain, const std::string& id) const;

    /**
     * @brief Message of the most recent swallowed failure
     */
    std::string lastError() const;

    std::uint64_t getCleanupRunCount() const { return cleanupRuns_.load(); }

    const OfflineCacheConfig& getConfig() const { return config_; }

private:
    using StoredEntry = std::pair<std::string, Blob>;

    const OfflineCacheConfig config_;
    const std::shared_ptr<IBlobStore> store_;
    const std::shared_ptr<const IClock> clock_;

    std::atomic<ManagerState> state_{ManagerState::UNINITIALIZED};
    std::mutex lifecycleMutex_;
    std::mutex maintenanceMutex_;

    // Error tracking
    std::string lastError_;
    mutable std::mutex errorMutex_;

    // Scheduled cleanup
    boost::asio::io_context ioContext_;
    std::unique_ptr<boost::asio::io_context::work> workGuard_;
    std::unique_ptr<boost::asio::steady_timer> cleanupTimer_;
    std::thread timerThread_;
    std::atomic<bool> cleanupScheduled_{false};
    std::atomic<std::uint64_t> cleanupRuns_{0};

    std::string namespacePrefix() const;
    std::string domainPrefix(const std::string& domain) const;

    void storeData(const std::string& domain, const std::string& id, const nlohmann::json& data);
    std::optional<nlohmann::json> getData(const std::string& domain, const std::string& id);
    std::vector<StoredEntry> getAllEntries(const std::string& domain);

    std::uint64_t calculateCacheSize();
    bool isValidCache(TimePoint timestamp, std::chrono::milliseconds maxAge) const;

    // Callers hold maintenanceMutex_
    void enforceCacheSizeLimitLocked();

    void scheduleCleanup();
    void armCleanupTimer();
    void stopCleanupTimer();

    void recordFailure(const std::string& operation, const std::string& error);
};

} // namespace offline_cache
