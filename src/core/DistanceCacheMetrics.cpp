#include "DistanceCacheMetrics.h"

#include <algorithm>

using json = nlohmann::json;

namespace core
{

    DistanceCacheMetrics::DistanceCacheMetrics(Values values)
        : m_values(std::move(values))
    {
    }

    std::size_t DistanceCacheMetrics::cacheSize() const
    {
        return m_values.cache_size;
    }

    uint64_t DistanceCacheMetrics::cacheMissesCount() const
    {
        return m_values.miss_count;
    }

    std::chrono::milliseconds DistanceCacheMetrics::maxExecutionTime() const
    {
        return m_values.max_execution_time;
    }

    std::chrono::milliseconds DistanceCacheMetrics::avgExecutionTime() const
    {
        if (m_values.execution_count == 0)
        {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::milliseconds(m_values.total_execution_time.count() /
                                         static_cast<int64_t>(m_values.execution_count));
    }

    std::vector<Coordinate> DistanceCacheMetrics::topLocations() const
    {
        std::vector<Coordinate> result;
        result.reserve(m_values.top_locations.size());
        for (const auto &entry : m_values.top_locations)
        {
            result.push_back(entry.first);
        }
        return result;
    }

    uint64_t DistanceCacheMetrics::executionCount() const
    {
        return m_values.execution_count;
    }

    uint64_t DistanceCacheMetrics::lookupCount() const
    {
        return m_values.lookup_count;
    }

    uint64_t DistanceCacheMetrics::failedExecutionCount() const
    {
        return m_values.failed_execution_count;
    }

    const std::vector<std::pair<Coordinate, uint64_t>> &DistanceCacheMetrics::topLocationCounts() const
    {
        return m_values.top_locations;
    }

    json DistanceCacheMetrics::toJson() const
    {
        json j;
        j["cache_size"] = cacheSize();
        j["lookup_count"] = lookupCount();
        j["cache_misses"] = cacheMissesCount();
        j["execution_count"] = executionCount();
        j["failed_execution_count"] = failedExecutionCount();
        j["max_execution_time_ms"] = maxExecutionTime().count();
        j["avg_execution_time_ms"] = avgExecutionTime().count();

        json top = json::array();
        for (const auto &entry : m_values.top_locations)
        {
            json location;
            location["latitude"] = entry.first.latitude();
            location["longitude"] = entry.first.longitude();
            location["requests"] = entry.second;
            top.push_back(location);
        }
        j["top_locations"] = top;
        return j;
    }

    CacheMetricsRecorder::CacheMetricsRecorder(std::size_t stripe_count)
        : m_location_counts(stripe_count)
    {
    }

    void CacheMetricsRecorder::recordLookup(const Coordinate &from, const Coordinate &to)
    {
        m_lookups.fetch_add(1, std::memory_order_relaxed);
        countLocation(from);
        if (to != from)
        {
            countLocation(to);
        }
    }

    void CacheMetricsRecorder::recordMiss()
    {
        m_misses.fetch_add(1, std::memory_order_relaxed);
    }

    void CacheMetricsRecorder::recordExecution(std::chrono::milliseconds elapsed, bool succeeded)
    {
        m_executions.fetch_add(1, std::memory_order_relaxed);
        if (!succeeded)
        {
            m_failed_executions.fetch_add(1, std::memory_order_relaxed);
        }

        int64_t ms = elapsed.count();
        m_total_execution_ms.fetch_add(ms, std::memory_order_relaxed);

        int64_t current_max = m_max_execution_ms.load(std::memory_order_relaxed);
        while (ms > current_max &&
               !m_max_execution_ms.compare_exchange_weak(current_max, ms, std::memory_order_relaxed))
        {
        }
    }

    uint64_t CacheMetricsRecorder::lookupCount() const
    {
        return m_lookups.load(std::memory_order_relaxed);
    }

    uint64_t CacheMetricsRecorder::executionCount() const
    {
        return m_executions.load(std::memory_order_relaxed);
    }

    void CacheMetricsRecorder::countLocation(const Coordinate &location)
    {
        auto counter = m_location_counts.computeIfAbsent(location, []
                                                         { return std::make_shared<std::atomic<uint64_t>>(0); });
        counter->fetch_add(1, std::memory_order_relaxed);
    }

    DistanceCacheMetrics CacheMetricsRecorder::snapshot(std::size_t cache_size, std::size_t top_n) const
    {
        DistanceCacheMetrics::Values values;
        values.cache_size = cache_size;
        values.lookup_count = m_lookups.load(std::memory_order_relaxed);
        values.miss_count = m_misses.load(std::memory_order_relaxed);
        values.execution_count = m_executions.load(std::memory_order_relaxed);
        values.failed_execution_count = m_failed_executions.load(std::memory_order_relaxed);
        values.max_execution_time = std::chrono::milliseconds(m_max_execution_ms.load(std::memory_order_relaxed));
        values.total_execution_time = std::chrono::milliseconds(m_total_execution_ms.load(std::memory_order_relaxed));

        std::vector<std::pair<Coordinate, uint64_t>> counts;
        m_location_counts.forEach([&counts](const Coordinate &location, const std::shared_ptr<std::atomic<uint64_t>> &counter)
                                  { counts.emplace_back(location, counter->load(std::memory_order_relaxed)); });

        auto by_requests = [](const std::pair<Coordinate, uint64_t> &a, const std::pair<Coordinate, uint64_t> &b)
        {
            if (a.second != b.second)
                return a.second > b.second;
            if (a.first.latitude() != b.first.latitude())
                return a.first.latitude() < b.first.latitude();
            return a.first.longitude() < b.first.longitude();
        };

        std::size_t keep = std::min(top_n, counts.size());
        std::partial_sort(counts.begin(), counts.begin() + static_cast<std::ptrdiff_t>(keep), counts.end(), by_requests);
        counts.resize(keep);
        values.top_locations = std::move(counts);

        return DistanceCacheMetrics(std::move(values));
    }

} // namespace core
