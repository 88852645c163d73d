#ifndef I_DISTANCE_PROVIDER_H
#define I_DISTANCE_PROVIDER_H

#include "Coordinate.h"

#include <chrono>

namespace core
{

    /**
     * @class IDistanceProvider
     * @brief Interface of the external road distance service.
     *
     * Implementations may be slow and may throw. Both methods are called
     * concurrently from several threads.
     */
    class IDistanceProvider
    {
    public:
        virtual ~IDistanceProvider() = default;

        /// @brief Road distance between two points in meters. Expensive remote call.
        virtual int fetchDistanceInMeters(const Coordinate &from, const Coordinate &to) = 0;

        /// @brief Time of the last road network change. Cheap, polled periodically.
        virtual std::chrono::system_clock::time_point lastRoadNetworkUpdate() = 0;
    };

} // namespace core

#endif // I_DISTANCE_PROVIDER_H
