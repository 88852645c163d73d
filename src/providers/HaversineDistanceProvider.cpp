#include "HaversineDistanceProvider.h"
#include "../core/FreshnessState.h"

#include <cmath>
#include <random>
#include <thread>
#include <spdlog/spdlog.h>

namespace providers
{

    HaversineDistanceProvider::HaversineDistanceProvider(std::chrono::milliseconds max_latency)
        : m_max_latency(max_latency)
        , m_last_update_ms(core::nowEpochMillis())
    {
    }

    int HaversineDistanceProvider::fetchDistanceInMeters(const core::Coordinate &from, const core::Coordinate &to)
    {
        if (m_max_latency.count() > 0)
        {
            thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_int_distribution<int64_t> delay(0, m_max_latency.count());
            std::this_thread::sleep_for(std::chrono::milliseconds(delay(rng)));
        }

        m_fetch_count.fetch_add(1, std::memory_order_relaxed);
        return static_cast<int>(std::lround(core::distanceBetween(from, to)));
    }

    std::chrono::system_clock::time_point HaversineDistanceProvider::lastRoadNetworkUpdate()
    {
        return core::fromEpochMillis(m_last_update_ms.load(std::memory_order_acquire));
    }

    void HaversineDistanceProvider::markRoadNetworkUpdated()
    {
        int64_t now = core::nowEpochMillis();
        m_last_update_ms.store(now, std::memory_order_release);
        spdlog::info("HaversineDistanceProvider: road network marked updated at {} ms", now);
    }

    uint64_t HaversineDistanceProvider::fetchCount() const
    {
        return m_fetch_count.load(std::memory_order_relaxed);
    }

} // namespace providers
