#ifndef CACHE_CONFIG_H
#define CACHE_CONFIG_H

#include "CacheParameters.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace core
{

    /**
     * @struct CacheConfig
     * @brief Tunables of DistanceCache.
     *
     * Recognized parameter names: poll_interval_ms, fetch_timeout_ms,
     * stripe_count, top_locations.
     */
    struct CacheConfig
    {
        std::chrono::milliseconds poll_interval{10000};
        std::chrono::milliseconds fetch_timeout{0}; ///< Bounds waits on another caller's fetch, 0 waits without bound
        std::size_t stripe_count = 64;
        std::size_t top_locations = 10;

        /// @brief Overrides only the values present in params.
        void applyParameters(const CacheParameters &params);

        /// @throws std::invalid_argument when a value is out of range
        void validate() const;

        nlohmann::json toJson() const;

        static CacheConfig fromParameters(const CacheParameters &params);
        static CacheConfig fromJson(const nlohmann::json &j);
        static CacheConfig fromJsonFile(const std::string &path);

        static bool isKnownParameter(const std::string &name);
    };

} // namespace core

#endif // CACHE_CONFIG_H
