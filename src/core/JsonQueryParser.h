#ifndef JSON_QUERY_PARSER_H
#define JSON_QUERY_PARSER_H

#include "Coordinate.h"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace core
{
    struct DistanceQuery
    {
        Coordinate from;
        Coordinate to;
    };

    class JsonQueryParser
    {
    public:
        // Parse a {"queries": [{"from": {...}, "to": {...}}]} document
        static std::vector<DistanceQuery> parseFileToVector(const std::string &path);
        static std::vector<DistanceQuery> parseJsonToVector(const nlohmann::json &j);

        // Parse a {"latitude": .., "longitude": ..} object
        static Coordinate parseCoordinate(const nlohmann::json &j);
    };
} // namespace core

#endif // JSON_QUERY_PARSER_H
