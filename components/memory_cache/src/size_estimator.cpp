// components/memory_cache/src/size_estimator.cpp
#include "memory_cache/size_estimator.hpp"

#include <spdlog/spdlog.h>

namespace memory_cache {

std::size_t DefaultSizeEstimator<nlohmann::json>::operator()(const nlohmann::json& value) const {
    if (value.is_null()) {
        return 0;
    }

    if (value.is_boolean()) {
        return kBooleanSize;
    }

    if (value.is_number()) {
        return kNumberSize;
    }

    if (value.is_string()) {
        return value.get_ref<const std::string&>().size() * kBytesPerCharacter;
    }

    try {
        return value.dump().size() * kBytesPerCharacter;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Size estimation fell back to {} bytes: {}", kFallbackEntrySize, e.what());
        return kFallbackEntrySize;
    }
}

} // namespace memory_cache
