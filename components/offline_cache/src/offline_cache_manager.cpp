// components/offline_cache/src/offline_cache_manager.cpp
#include "offline_cache/offline_cache_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace offline_cache {

namespace {

const char* const kNotInitializedError = "Offline cache is not initialized";

} // anonymous namespace

OfflineCacheManager::OfflineCacheManager(const OfflineCacheConfig& config,
                                         std::shared_ptr<IBlobStore> store,
                                         std::shared_ptr<const IClock> clock)
    : config_(config), store_(std::move(store)), clock_(std::move(clock)) {
    if (!isValid(config_)) {
        throw std::invalid_argument("Invalid offline cache configuration:\n" + toString(config_));
    }
    if (!store_) {
        throw std::invalid_argument("OfflineCacheManager requires a blob store");
    }
    if (!clock_) {
        throw std::invalid_argument("OfflineCacheManager requires a clock");
    }

    spdlog::debug("OfflineCacheManager created for store '{}'", config_.storeName);
}

OfflineCacheManager::~OfflineCacheManager() {
    shutdown();
}

bool OfflineCacheManager::initialize() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (isReady()) {
        spdlog::warn("OfflineCacheManager already initialized");
        return true;
    }

    if (config_.enableDebugLogging) {
        spdlog::set_level(spdlog::level::debug);
    }

    spdlog::info("Initializing offline cache '{}'", config_.storeName);

    try {
        if (!store_->isSupported()) {
            spdlog::warn("Offline cache not supported: durable store unavailable");
            state_ = ManagerState::UNAVAILABLE;
            return false;
        }

        store_->open(config_.storeName);
    } catch (const std::exception& e) {
        recordFailure("initialize", e.what());
        state_ = ManagerState::UNAVAILABLE;
        return false;
    }

    state_ = ManagerState::INITIALIZED;

    if (config_.enableScheduledCleanup) {
        scheduleCleanup();
        state_ = ManagerState::ACTIVE;
    }

    spdlog::info("Offline cache initialized ({})", toString(state_.load()));
    return true;
}

void OfflineCacheManager::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    stopCleanupTimer();

    if (state_ == ManagerState::ACTIVE) {
        state_ = ManagerState::INITIALIZED;
        spdlog::info("Offline cache '{}' scheduled cleanup stopped", config_.storeName);
    }
}

bool OfflineCacheManager::isReady() const {
    const ManagerState state = state_.load();
    return state == ManagerState::INITIALIZED || state == ManagerState::ACTIVE;
}

bool OfflineCacheManager::cacheQuery(const std::string& query, const nlohmann::json& results,
                                     const std::optional<std::string>& fileId) {
    if (!isReady()) {
        spdlog::debug("cacheQuery ignored: {}", kNotInitializedError);
        return false;
    }

    try {
        CachedQuery cachedQuery;
        cachedQuery.id = makeQueryId(query, fileId);
        cachedQuery.query = query;
        cachedQuery.results = results;
        cachedQuery.timestamp = clock_->now();
        if (fileId && !fileId->empty()) {
            cachedQuery.fileId = fileId;
        }
        cachedQuery.cached = true;

        storeData(kQueriesDomain, cachedQuery.id, cachedQuery);

        spdlog::debug("Query cached: {}", cachedQuery.id);
        return true;
    } catch (const std::exception& e) {
        recordFailure("cacheQuery", e.what());
        return false;
    }
}

std::optional<CachedQuery> OfflineCacheManager::getCachedQuery(const std::string& query,
                                                               const std::optional<std::string>& fileId) {
    return lookupQuery(query, fileId).value;
}

LookupResult<CachedQuery> OfflineCacheManager::lookupQuery(const std::string& query,
                                                           const std::optional<std::string>& fileId) {
    if (!isReady()) {
        return LookupResult<CachedQuery>::error(kNotInitializedError);
    }

    try {
        auto document = getData(kQueriesDomain, makeQueryId(query, fileId));
        if (!document) {
            return LookupResult<CachedQuery>::miss();
        }

        CachedQuery cachedQuery = document->get<CachedQuery>();
        if (!isValidCache(cachedQuery.timestamp, config_.maxQueryAge)) {
            return LookupResult<CachedQuery>::miss();
        }

        return LookupResult<CachedQuery>::hit(cachedQuery);
    } catch (const std::exception& e) {
        recordFailure("getCachedQuery", e.what());
        return LookupResult<CachedQuery>::error(e.what());
    }
}

std::vector<CachedQuery> OfflineCacheManager::getAllQueries() {
    std::vector<CachedQuery> queries;
    if (!isReady()) {
        return queries;
    }

    try {
        for (const auto& entry : getAllEntries(kQueriesDomain)) {
            try {
                CachedQuery cachedQuery = nlohmann::json::parse(entry.second.body).get<CachedQuery>();
                if (isValidCache(cachedQuery.timestamp, config_.maxQueryAge)) {
                    queries.push_back(std::move(cachedQuery));
                }
            } catch (const std::exception& e) {
                spdlog::warn("Skipping unreadable query {}: {}", entry.first, e.what());
            }
        }
    } catch (const std::exception& e) {
        recordFailure("getAllQueries", e.what());
        queries.clear();
    }

    return queries;
}

bool OfflineCacheManager::cacheFile(const CachedFile& file) {
    if (!isReady()) {
        spdlog::debug("cacheFile ignored: {}", kNotInitializedError);
        return false;
    }

    if (file.id.empty()) {
        recordFailure("cacheFile", "file id must not be empty");
        return false;
    }

    try {
        storeData(kFilesDomain, file.id, file);

        spdlog::debug("File cached: {}", file.id);
        return true;
    } catch (const std::exception& e) {
        recordFailure("cacheFile", e.what());
        return false;
    }
}

std::optional<CachedFile> OfflineCacheManager::getCachedFile(const std::string& fileId) {
    return lookupFile(fileId).value;
}

LookupResult<CachedFile> OfflineCacheManager::lookupFile(const std::string& fileId) {
    if (!isReady()) {
        return LookupResult<CachedFile>::error(kNotInitializedError);
    }

    try {
        auto document = getData(kFilesDomain, fileId);
        if (!document) {
            return LookupResult<CachedFile>::miss();
        }

        CachedFile cachedFile = document->get<CachedFile>();
        if (!isValidCache(cachedFile.uploadDate, config_.maxFileAge)) {
            return LookupResult<CachedFile>::miss();
        }

        return LookupResult<CachedFile>::hit(cachedFile);
    } catch (const std::exception& e) {
        recordFailure("getCachedFile", e.what());
        return LookupResult<CachedFile>::error(e.what());
    }
}

std::vector<CachedFile> OfflineCacheManager::getAllFiles() {
    std::vector<CachedFile> files;
    if (!isReady()) {
        return files;
    }

    try {
        for (const auto& entry : getAllEntries(kFilesDomain)) {
            try {
                CachedFile cachedFile = nlohmann::json::parse(entry.second.body).get<CachedFile>();
                if (isValidCache(cachedFile.uploadDate, config_.maxFileAge)) {
                    files.push_back(std::move(cachedFile));
                }
            } catch (const std::exception& e) {
                spdlog::warn("Skipping unreadable file {}: {}", entry.first, e.what());
            }
        }
    } catch (const std::exception& e) {
        recordFailure("getAllFiles", e.what());
        files.clear();
    }

    return files;
}

bool OfflineCacheManager::storeUserPreferences(const nlohmann::json& preferences) {
    if (!isReady()) {
        spdlog::debug("storeUserPreferences ignored: {}", kNotInitializedError);
        return false;
    }

    try {
        storeData(kPreferencesDomain, kUserPreferencesId, preferences);
        return true;
    } catch (const std::exception& e) {
        recordFailure("storeUserPreferences", e.what());
        return false;
    }
}

std::optional<nlohmann::json> OfflineCacheManager::getUserPreferences() {
    return lookupUserPreferences().value;
}

LookupResult<nlohmann::json> OfflineCacheManager::lookupUserPreferences() {
    if (!isReady()) {
        return LookupResult<nlohmann::json>::error(kNotInitializedError);
    }

    try {
        auto document = getData(kPreferencesDomain, kUserPreferencesId);
        if (!document) {
            return LookupResult<nlohmann::json>::miss();
        }
        return LookupResult<nlohmann::json>::hit(*document);
    } catch (const std::exception& e) {
        recordFailure("getUserPreferences", e.what());
        return LookupResult<nlohmann::json>::error(e.what());
    }
}

PersistentCacheStats OfflineCacheManager::getCacheStats() {
    PersistentCacheStats stats;
    if (!isReady()) {
        return stats;
    }

    try {
        stats.queryCount = getAllQueries().size();
        stats.fileCount = getAllFiles().size();
        stats.totalSize = calculateCacheSize();

        auto lastCleanup = getData(kMetaDomain, kLastCleanupId);
        if (lastCleanup && lastCleanup->is_number_integer()) {
            stats.lastCleanup = memory_cache::fromEpochMillis(lastCleanup->get<std::int64_t>());
        }
    } catch (const std::exception& e) {
        recordFailure("getCacheStats", e.what());
        return PersistentCacheStats{};
    }

    return stats;
}

bool OfflineCacheManager::cleanupCache() {
    if (!isReady()) {
        spdlog::debug("cleanupCache ignored: {}", kNotInitializedError);
        return false;
    }

    std::lock_guard<std::mutex> lock(maintenanceMutex_);
    ++cleanupRuns_;

    spdlog::info("Starting cache cleanup of '{}'", config_.storeName);

    try {
        std::size_t removedQueries = 0;
        for (const auto& entry : getAllEntries(kQueriesDomain)) {
            bool expired = true;
            try {
                CachedQuery cachedQuery = nlohmann::json::parse(entry.second.body).get<CachedQuery>();
                expired = !isValidCache(cachedQuery.timestamp, config_.maxQueryAge);
            } catch (const std::exception& e) {
                spdlog::warn("Removing unreadable query {}: {}", entry.first, e.what());
            }

            if (expired && store_->remove(entry.first)) {
                ++removedQueries;
            }
        }

        std::size_t removedFiles = 0;
        for (const auto& entry : getAllEntries(kFilesDomain)) {
            bool expired = true;
            try {
                CachedFile cachedFile = nlohmann::json::parse(entry.second.body).get<CachedFile>();
                expired = !isValidCache(cachedFile.uploadDate, config_.maxFileAge);
            } catch (const std::exception& e) {
                spdlog::warn("Removing unreadable file {}: {}", entry.first, e.what());
            }

            if (expired && store_->remove(entry.first)) {
                ++removedFiles;
            }
        }

        enforceCacheSizeLimitLocked();

        storeData(kMetaDomain, kLastCleanupId, memory_cache::toEpochMillis(clock_->now()));

        spdlog::info("Cache cleanup completed: {} queries and {} files expired",
                     removedQueries, removedFiles);
        return true;
    } catch (const std::exception& e) {
        recordFailure("cleanupCache", e.what());
        return false;
    }
}

bool OfflineCacheManager::enforceCacheSizeLimit() {
    if (!isReady()) {
        spdlog::debug("enforceCacheSizeLimit ignored: {}", kNotInitializedError);
        return false;
    }

    std::lock_guard<std::mutex> lock(maintenanceMutex_);

    try {
        enforceCacheSizeLimitLocked();
        return true;
    } catch (const std::exception& e) {
        recordFailure("enforceCacheSizeLimit", e.what());
        return false;
    }
}

bool OfflineCacheManager::clearAllCache() {
    if (!isReady()) {
        spdlog::debug("clearAllCache ignored: {}", kNotInitializedError);
        return false;
    }

    try {
        const auto keys = store_->listKeys(namespacePrefix());
        for (const auto& key : keys) {
            store_->remove(key);
        }

        spdlog::info("All offline cache entries cleared ({} keys)", keys.size());
        return true;
    } catch (const std::exception& e) {
        recordFailure("clearAllCache", e.what());
        return false;
    }
}

std::string OfflineCacheManager::makeKey(const std::string& domain, const std::string& id) const {
    return domainPrefix(domain) + id;
}

std::string OfflineCacheManager::lastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

std::string OfflineCacheManager::namespacePrefix() const {
    return config_.storeName + "://";
}

std::string OfflineCacheManager::domainPrefix(const std::string& domain) const {
    return namespacePrefix() + domain + "/";
}

void OfflineCacheManager::storeData(const std::string& domain, const std::string& id,
                                    const nlohmann::json& data) {
    Blob blob;
    blob.body = data.dump();
    blob.metadata.contentType = "application/json";
    blob.metadata.cachedAt = clock_->now();

    store_->put(makeKey(domain, id), blob);
}

std::optional<nlohmann::json> OfflineCacheManager::getData(const std::string& domain,
                                                           const std::string& id) {
    auto blob = store_->get(makeKey(domain, id));
    if (!blob) {
        return std::nullopt;
    }
    return nlohmann::json::parse(blob->body);
}

std::vector<OfflineCacheManager::StoredEntry> OfflineCacheManager::getAllEntries(const std::string& domain) {
    std::vector<StoredEntry> entries;

    for (const auto& key : store_->listKeys(domainPrefix(domain))) {
        auto blob = store_->get(key);
        // Removed since it was listed
        if (!blob) {
            continue;
        }
        entries.emplace_back(key, std::move(*blob));
    }

    return entries;
}

std::uint64_t OfflineCacheManager::calculateCacheSize() {
    std::uint64_t totalSize = 0;

    for (const auto& key : store_->listKeys(namespacePrefix())) {
        auto blob = store_->get(key);
        if (blob) {
            totalSize += blob->body.size();
        }
    }

    return totalSize;
}

bool OfflineCacheManager::isValidCache(TimePoint timestamp, std::chrono::milliseconds maxAge) const {
    return clock_->now() - timestamp < maxAge;
}

void OfflineCacheManager::enforceCacheSizeLimitLocked() {
    std::uint64_t currentSize = calculateCacheSize();
    if (currentSize <= config_.maxCacheSizeBytes) {
        return;
    }

    const auto targetSize = static_cast<std::uint64_t>(
        static_cast<double>(config_.maxCacheSizeBytes) * config_.sizeLimitTargetRatio);

    spdlog::warn("Cache size limit exceeded ({} of {} bytes), removing oldest entries",
                 currentSize, config_.maxCacheSizeBytes);

    // (age reference, key); unreadable records sort first
    std::vector<std::pair<TimePoint, std::string>> queryVictims;
    for (const auto& entry : getAllEntries(kQueriesDomain)) {
        TimePoint timestamp = TimePoint::min();
        try {
            timestamp = nlohmann::json::parse(entry.second.body).get<CachedQuery>().timestamp;
        } catch (const std::exception& e) {
            spdlog::warn("Unreadable query {} evicted first: {}", entry.first, e.what());
        }
        queryVictims.emplace_back(timestamp, entry.first);
    }
    std::stable_sort(queryVictims.begin(), queryVictims.end());

    std::vector<std::pair<TimePoint, std::string>> victims = std::move(queryVictims);

    if (config_.evictionScope == SizeEvictionScope::QUERIES_THEN_FILES) {
        std::vector<std::pair<TimePoint, std::string>> fileVictims;
        for (const auto& entry : getAllEntries(kFilesDomain)) {
            TimePoint uploadDate = TimePoint::min();
            try {
                uploadDate = nlohmann::json::parse(entry.second.body).get<CachedFile>().uploadDate;
            } catch (const std::exception& e) {
                spdlog::warn("Unreadable file {} evicted first: {}", entry.first, e.what());
            }
            fileVictims.emplace_back(uploadDate, entry.first);
        }
        std::stable_sort(fileVictims.begin(), fileVictims.end());
        victims.insert(victims.end(), fileVictims.begin(), fileVictims.end());
    }

    std::size_t evicted = 0;
    for (const auto& victim : victims) {
        store_->remove(victim.second);
        ++evicted;

        currentSize = calculateCacheSize();
        if (currentSize <= targetSize) {
            break;
        }
    }

    if (currentSize > targetSize) {
        spdlog::warn("Size limit still exceeded after evicting {} entries ({} bytes, {} scope)",
                     evicted, currentSize, toString(config_.evictionScope));
    } else {
        spdlog::info("Evicted {} entries, cache size now {} bytes", evicted, currentSize);
    }
}

void OfflineCacheManager::scheduleCleanup() {
    if (cleanupScheduled_.load()) {
        return;
    }

    ioContext_.restart();

    // Keep run() from returning between timer expirations
    workGuard_ = std::make_unique<boost::asio::io_context::work>(ioContext_);
    cleanupTimer_ = std::make_unique<boost::asio::steady_timer>(ioContext_);
    armCleanupTimer();

    timerThread_ = std::thread([this] {
        try {
            ioContext_.run();
        } catch (const std::exception& e) {
            spdlog::error("Cleanup timer thread stopped: {}", e.what());
        }
    });

    cleanupScheduled_ = true;
    spdlog::info("Periodic cleanup every {} minutes",
                 std::chrono::duration_cast<std::chrono::minutes>(config_.cleanupInterval).count());
}

void OfflineCacheManager::armCleanupTimer() {
    cleanupTimer_->expires_after(config_.cleanupInterval);
    cleanupTimer_->async_wait([this](const boost::system::error_code& error) {
        if (error) {
            return;
        }

        if (!cleanupCache()) {
            spdlog::warn("Scheduled cleanup failed: {}", lastError());
        }
        armCleanupTimer();
    });
}

void OfflineCacheManager::stopCleanupTimer() {
    if (!cleanupScheduled_.load()) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    cleanupTimer_.reset();
    cleanupScheduled_ = false;
}

void OfflineCacheManager::recordFailure(const std::string& operation, const std::string& error) {
    spdlog::error("Offline cache {} failed: {}", operation, error);

    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = operation + ": " + error;
}

} // namespace offline_cache
