// components/memory_cache/include/memory_cache/memoize.hpp
#pragma once

#include "memory_cache/memory_cache.hpp"
#include "memory_cache/size_estimator.hpp"
#include "memory_cache/types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace memory_cache {

/**
 * @brief Key generator signature for a wrapped function taking Args...
 */
template <typename... Args>
using KeyGenerator = std::function<std::string(const std::decay_t<Args>&...)>;

/**
 * @brief Options for cacheAsync
 */
struct AsyncCacheOptions {
    bool cacheErrors = false;
    std::chrono::milliseconds errorTtl{std::chrono::minutes(5)};
};

/**
 * @brief Default cache key: the arguments as a serialized JSON array
 *
 * Every argument type must be convertible to nlohmann::json.
 */
template <typename... Args>
std::string makeArgumentKey(const Args&... args) {
    nlohmann::json key = nlohmann::json::array();
    (key.push_back(nlohmann::json(args)), ...);
    return key.dump();
}

/**
 * @brief Wrap a function so repeated calls with equal arguments hit the cache
 *
 * Exceptions thrown by fn propagate to the caller and are never cached.
 *
 * @param fn Function to wrap
 * @param cache Cache holding results, shared with the caller
 * @param keyGenerator Optional key function, makeArgumentKey when empty
 * @throws std::invalid_argument if fn or cache is empty
 */
template <typename R, typename E, typename... Args>
std::function<R(Args...)> memoize(std::function<R(Args...)> fn,
                                  std::shared_ptr<MemoryCache<R, E>> cache,
                                  detail::NonDeduced<KeyGenerator<Args...>> keyGenerator = {}) {
    if (!fn || !cache) {
        throw std::invalid_argument("memoize requires a function and a cache");
    }

    return [fn = std::move(fn), cache = std::move(cache), keyGenerator = std::move(keyGenerator)](Args... args) -> R {
        const std::string key = keyGenerator ? keyGenerator(args...) : makeArgumentKey(args...);

        if (auto cached = cache->get(key)) {
            return std::move(*cached);
        }

        R result = fn(args...);
        cache->set(key, result);
        return result;
    };
}

/**
 * @brief Wrap an asynchronous function with a result cache and, optionally,
 *        an error cache
 *
 * A cached result comes back as an already satisfied future. With
 * options.cacheErrors set, a failure is remembered for options.errorTtl and
 * calls made within that window fail with the same exception without
 * invoking fn. Once the window lapses the next call retries fn.
 *
 * The error cache is created once per wrapper and shares the result cache's
 * clock and strategy.
 *
 * @throws std::invalid_argument if fn or cache is empty, or errorTtl is not positive
 */
template <typename R, typename E, typename... Args>
std::function<std::future<R>(Args...)> cacheAsync(std::function<std::future<R>(Args...)> fn,
                                                  std::shared_ptr<MemoryCache<R, E>> cache,
                                                  AsyncCacheOptions options = {},
                                                  detail::NonDeduced<KeyGenerator<Args...>> keyGenerator = {}) {
    if (!fn || !cache) {
        throw std::invalid_argument("cacheAsync requires a function and a cache");
    }

    CacheConfig errorConfig = cache->config();
    errorConfig.ttl = options.errorTtl;
    errorConfig.maxSize = std::max(errorConfig.maxSize, kFallbackEntrySize);
    auto errorCache = std::make_shared<MemoryCache<std::exception_ptr>>(errorConfig, cache->clock());

    const bool cacheErrors = options.cacheErrors;

    return [fn = std::move(fn), cache = std::move(cache), errorCache, cacheErrors,
            keyGenerator = std::move(keyGenerator)](Args... args) -> std::future<R> {
        const std::string key = keyGenerator ? keyGenerator(args...) : makeArgumentKey(args...);

        if (auto cached = cache->get(key)) {
            std::promise<R> ready;
            ready.set_value(std::move(*cached));
            return ready.get_future();
        }

        if (cacheErrors) {
            if (auto failure = errorCache->get(key)) {
                std::promise<R> failed;
                failed.set_exception(*failure);
                return failed.get_future();
            }
        }

        std::future<R> pending;
        try {
            pending = fn(args...);
        } catch (...) {
            if (cacheErrors) {
                errorCache->set(key, std::current_exception());
            }
            std::promise<R> failed;
            failed.set_exception(std::current_exception());
            return failed.get_future();
        }

        return std::async(std::launch::async,
                          [pending = std::move(pending), cache, errorCache, cacheErrors, key]() mutable -> R {
            try {
                R result = pending.get();
                cache->set(key, result);
                errorCache->remove(key);
                return result;
            } catch (...) {
                if (cacheErrors) {
                    errorCache->set(key, std::current_exception());
                }
                throw;
            }
        });
    };
}

} // namespace memory_cache
