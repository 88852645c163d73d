#ifndef COORDINATE_H
#define COORDINATE_H

#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#define EARTH_RADIUS_METERS 6371008.8 // Mean earth radius in meters

namespace core
{

    /// @brief Calculate the Haversine distance between two geographical points.
    /// @param lat1 Latitude of point 1 in degrees.
    /// @param lon1 Longitude of point 1 in degrees.
    /// @param lat2 Latitude of point 2 in degrees.
    /// @param lon2 Longitude of point 2 in degrees.
    /// @param radius Radius of the sphere (default is EARTH_RADIUS_METERS).
    /// @return Distance in meters.
    inline static double distanceBetween(double lat1, double lon1, double lat2, double lon2, const double radius = EARTH_RADIUS_METERS)
    {
        const double toRad = M_PI / 180.0;
        double dlat = (lat2 - lat1) * toRad;
        double dlon = (lon2 - lon1) * toRad;
        double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1 * toRad) * std::cos(lat2 * toRad) *
                       std::sin(dlon / 2) * std::sin(dlon / 2);
        double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
        return radius * c;
    }

    /**
     * @class Coordinate
     * @brief Immutable geographic location used as a cache key.
     *
     * Equality and hashing are by value. Positive and negative zero compare
     * equal and hash the same.
     */
    class Coordinate
    {
    public:
        Coordinate();
        Coordinate(float latitude, float longitude);

        float latitude() const { return m_latitude; }
        float longitude() const { return m_longitude; }

        /// @brief True when both components are finite and within geographic range.
        bool isValid() const;

        std::string toString() const;

        bool operator==(const Coordinate &other) const
        {
            return m_latitude == other.m_latitude && m_longitude == other.m_longitude;
        }

        bool operator!=(const Coordinate &other) const
        {
            return !(*this == other);
        }

    private:
        float m_latitude;  ///< Degrees, [-90, 90]
        float m_longitude; ///< Degrees, [-180, 180]
    };

    /// @brief Parses "lat,lon". Returns nullopt for malformed or out-of-range input.
    std::optional<Coordinate> parseLatLon(const std::string &text);

    /// @brief Great-circle distance between two coordinates in meters.
    double distanceBetween(const Coordinate &from, const Coordinate &to);

    struct CoordinateHash
    {
        std::size_t operator()(const Coordinate &c) const;
    };

} // namespace core

namespace std
{
    template <>
    struct hash<core::Coordinate>
    {
        std::size_t operator()(const core::Coordinate &c) const
        {
            return core::CoordinateHash{}(c);
        }
    };
} // namespace std

#endif // COORDINATE_H
