#include "JsonQueryParser.h"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace core
{
    Coordinate JsonQueryParser::parseCoordinate(const json &j)
    {
        if (!j.is_object())
        {
            throw std::runtime_error("Coordinate must be a JSON object");
        }
        if (!j.contains("latitude") || !j["latitude"].is_number() ||
            !j.contains("longitude") || !j["longitude"].is_number())
        {
            throw std::runtime_error("Coordinate requires numeric latitude and longitude");
        }
        return Coordinate(j["latitude"].get<float>(), j["longitude"].get<float>());
    }

    std::vector<DistanceQuery> JsonQueryParser::parseJsonToVector(const json &j)
    {
        if (!j.contains("queries") || !j["queries"].is_array())
        {
            throw std::runtime_error("JSON does not contain a queries array");
        }

        const auto &arr = j["queries"];

        if (arr.size() == 0)
        {
            throw std::runtime_error("JSON queries array is empty");
        }

        std::vector<DistanceQuery> result;
        result.reserve(arr.size());

        for (const auto &item : arr)
        {
            if (!item.contains("from") || !item.contains("to"))
            {
                throw std::runtime_error("Query requires 'from' and 'to' coordinates");
            }

            DistanceQuery query;
            query.from = parseCoordinate(item["from"]);
            query.to = parseCoordinate(item["to"]);
            result.push_back(query);
        }

        return result;
    }

    std::vector<DistanceQuery> JsonQueryParser::parseFileToVector(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open JSON file: " + path);
        }

        json j;
        try
        {
            file >> j;
        }
        catch (const json::parse_error &ex)
        {
            throw std::runtime_error("Failed to parse JSON file " + path + ": " + ex.what());
        }

        return parseJsonToVector(j);
    }

} // namespace core
