#ifndef DISTANCE_CACHE_METRICS_H
#define DISTANCE_CACHE_METRICS_H

#include "IDistanceCacheMetrics.h"
#include "ConcurrentHashMap.hpp"

#include <atomic>
#include <memory>
#include <utility>
#include <nlohmann/json.hpp>

namespace core
{

    /**
     * @class DistanceCacheMetrics
     * @brief Point-in-time copy of the cache counters.
     */
    class DistanceCacheMetrics : public IDistanceCacheMetrics
    {
    public:
        struct Values
        {
            std::size_t cache_size = 0;
            uint64_t lookup_count = 0;
            uint64_t miss_count = 0;
            uint64_t execution_count = 0;
            uint64_t failed_execution_count = 0;
            std::chrono::milliseconds max_execution_time{0};
            std::chrono::milliseconds total_execution_time{0};
            std::vector<std::pair<Coordinate, uint64_t>> top_locations;
        };

        explicit DistanceCacheMetrics(Values values);

        std::size_t cacheSize() const override;
        uint64_t cacheMissesCount() const override;
        std::chrono::milliseconds maxExecutionTime() const override;
        std::chrono::milliseconds avgExecutionTime() const override;
        std::vector<Coordinate> topLocations() const override;
        uint64_t executionCount() const override;

        uint64_t lookupCount() const;
        uint64_t failedExecutionCount() const;

        /// @brief Most requested coordinates with their request counts.
        const std::vector<std::pair<Coordinate, uint64_t>> &topLocationCounts() const;

        nlohmann::json toJson() const;

    private:
        Values m_values;
    };

    /**
     * @class CacheMetricsRecorder
     * @brief Thread-safe counters updated by cache lookups and fetches.
     */
    class CacheMetricsRecorder
    {
    public:
        explicit CacheMetricsRecorder(std::size_t stripe_count = ConcurrentHashMap<Coordinate, int>::DEFAULT_STRIPE_COUNT);

        void recordLookup(const Coordinate &from, const Coordinate &to);
        void recordMiss();
        void recordExecution(std::chrono::milliseconds elapsed, bool succeeded);

        uint64_t lookupCount() const;
        uint64_t executionCount() const;

        DistanceCacheMetrics snapshot(std::size_t cache_size, std::size_t top_n) const;

    private:
        void countLocation(const Coordinate &location);

        std::atomic<uint64_t> m_lookups{0};
        std::atomic<uint64_t> m_misses{0};
        std::atomic<uint64_t> m_executions{0};
        std::atomic<uint64_t> m_failed_executions{0};
        std::atomic<int64_t> m_total_execution_ms{0};
        std::atomic<int64_t> m_max_execution_ms{0};

        ConcurrentHashMap<Coordinate, std::shared_ptr<std::atomic<uint64_t>>> m_location_counts;
    };

} // namespace core

#endif // DISTANCE_CACHE_METRICS_H
