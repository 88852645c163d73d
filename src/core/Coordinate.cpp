#include "Coordinate.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace core
{
    namespace
    {
        // -0.0f and 0.0f compare equal, so they must hash equal too
        float normalizeZero(float value)
        {
            return value == 0.0f ? 0.0f : value;
        }
    } // namespace

    Coordinate::Coordinate()
        : m_latitude(0.0f)
        , m_longitude(0.0f)
    {
    }

    Coordinate::Coordinate(float latitude, float longitude)
        : m_latitude(latitude)
        , m_longitude(longitude)
    {
    }

    bool Coordinate::isValid() const
    {
        if (!std::isfinite(m_latitude) || !std::isfinite(m_longitude))
        {
            return false;
        }
        return m_latitude >= -90.0f && m_latitude <= 90.0f &&
               m_longitude >= -180.0f && m_longitude <= 180.0f;
    }

    std::string Coordinate::toString() const
    {
        std::ostringstream oss;
        oss << std::setprecision(9) << "(" << m_latitude << ", " << m_longitude << ")";
        return oss.str();
    }

    std::optional<Coordinate> parseLatLon(const std::string &text)
    {
        auto comma = text.find(',');
        if (comma == std::string::npos)
        {
            return std::nullopt;
        }

        std::string lat_str = text.substr(0, comma);
        std::string lon_str = text.substr(comma + 1);
        try
        {
            std::size_t lat_used = 0;
            std::size_t lon_used = 0;
            float lat = std::stof(lat_str, &lat_used);
            float lon = std::stof(lon_str, &lon_used);
            if (lat_used != lat_str.size() || lon_used != lon_str.size())
            {
                return std::nullopt;
            }
            Coordinate parsed(lat, lon);
            if (!parsed.isValid())
            {
                return std::nullopt;
            }
            return parsed;
        }
        catch (const std::logic_error &)
        {
            // stof: no digits or out of float range
            return std::nullopt;
        }
    }

    double distanceBetween(const Coordinate &from, const Coordinate &to)
    {
        return distanceBetween(from.latitude(), from.longitude(), to.latitude(), to.longitude());
    }

    std::size_t CoordinateHash::operator()(const Coordinate &c) const
    {
        std::size_t h1 = std::hash<float>{}(normalizeZero(c.latitude()));
        std::size_t h2 = std::hash<float>{}(normalizeZero(c.longitude()));
        // boost::hash_combine mixing
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }

} // namespace core
