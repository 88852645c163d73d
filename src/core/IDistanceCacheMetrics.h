#ifndef I_DISTANCE_CACHE_METRICS_H
#define I_DISTANCE_CACHE_METRICS_H

#include "Coordinate.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace core
{

    /**
     * @class IDistanceCacheMetrics
     * @brief Basic monitoring figures of a distance cache.
     */
    class IDistanceCacheMetrics
    {
    public:
        virtual ~IDistanceCacheMetrics() = default;

        virtual std::size_t cacheSize() const = 0;
        virtual uint64_t cacheMissesCount() const = 0;
        virtual std::chrono::milliseconds maxExecutionTime() const = 0;
        virtual std::chrono::milliseconds avgExecutionTime() const = 0;
        virtual std::vector<Coordinate> topLocations() const = 0;
        virtual uint64_t executionCount() const = 0;
    };

} // namespace core

#endif // I_DISTANCE_CACHE_METRICS_H
