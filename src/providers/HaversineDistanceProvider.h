#pragma once

#include "../core/IDistanceProvider.h"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace providers
{

    /**
     * @brief Stand-in for the remote road distance service.
     *
     * Answers with the great-circle distance after a random delay of up to
     * max_latency, so the cache can be exercised without a network.
     */
    class HaversineDistanceProvider : public core::IDistanceProvider
    {
    public:
        explicit HaversineDistanceProvider(std::chrono::milliseconds max_latency = std::chrono::milliseconds(0));

        int fetchDistanceInMeters(const core::Coordinate &from, const core::Coordinate &to) override;
        std::chrono::system_clock::time_point lastRoadNetworkUpdate() override;

        /// @brief Pretends the road network changed now.
        void markRoadNetworkUpdated();

        uint64_t fetchCount() const;

    private:
        std::chrono::milliseconds m_max_latency;
        std::atomic<int64_t> m_last_update_ms;
        std::atomic<uint64_t> m_fetch_count{0};
    };

} // namespace providers
