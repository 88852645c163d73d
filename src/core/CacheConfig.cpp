#include "CacheConfig.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace core
{
    namespace
    {
        const std::vector<std::string> KNOWN_PARAMS = {
            "poll_interval_ms",
            "fetch_timeout_ms",
            "stripe_count",
            "top_locations"};

        std::size_t countOr(const CacheParameters &params, const std::string &name, std::size_t current)
        {
            int value = params.getOr<int>(name, static_cast<int>(current));
            if (value < 0)
            {
                throw std::invalid_argument("Parameter " + name + " must not be negative");
            }
            return static_cast<std::size_t>(value);
        }

        std::chrono::milliseconds millisOr(const CacheParameters &params, const std::string &name, std::chrono::milliseconds current)
        {
            return std::chrono::milliseconds(params.getOr<int>(name, static_cast<int>(current.count())));
        }
    } // namespace

    bool CacheConfig::isKnownParameter(const std::string &name)
    {
        return std::find(KNOWN_PARAMS.begin(), KNOWN_PARAMS.end(), name) != KNOWN_PARAMS.end();
    }

    void CacheConfig::applyParameters(const CacheParameters &params)
    {
        poll_interval = millisOr(params, "poll_interval_ms", poll_interval);
        fetch_timeout = millisOr(params, "fetch_timeout_ms", fetch_timeout);
        stripe_count = countOr(params, "stripe_count", stripe_count);
        top_locations = countOr(params, "top_locations", top_locations);

        for (const auto &name : params.names())
        {
            if (!isKnownParameter(name))
            {
                spdlog::warn("CacheConfig: ignoring unknown parameter '{}'", name);
            }
        }
    }

    void CacheConfig::validate() const
    {
        if (poll_interval.count() <= 0)
        {
            throw std::invalid_argument("CacheConfig: poll_interval_ms must be positive");
        }
        if (fetch_timeout.count() < 0)
        {
            throw std::invalid_argument("CacheConfig: fetch_timeout_ms must not be negative");
        }
        if (stripe_count == 0)
        {
            throw std::invalid_argument("CacheConfig: stripe_count must be positive");
        }
    }

    json CacheConfig::toJson() const
    {
        json j;
        j["poll_interval_ms"] = poll_interval.count();
        j["fetch_timeout_ms"] = fetch_timeout.count();
        j["stripe_count"] = stripe_count;
        j["top_locations"] = top_locations;
        return j;
    }

    CacheConfig CacheConfig::fromParameters(const CacheParameters &params)
    {
        CacheConfig config;
        config.applyParameters(params);
        config.validate();
        return config;
    }

    CacheConfig CacheConfig::fromJson(const json &j)
    {
        if (!j.is_object())
        {
            throw std::runtime_error("Cache configuration must be a JSON object");
        }

        CacheParameters params;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            const json &value = it.value();
            if (value.is_boolean())
            {
                params.set(it.key(), value.get<bool>());
            }
            else if (value.is_number_integer())
            {
                params.set(it.key(), value.get<int>());
            }
            else if (value.is_number_float())
            {
                params.set(it.key(), value.get<double>());
            }
            else
            {
                throw std::runtime_error("Cache configuration value for '" + it.key() + "' must be a number or boolean");
            }
        }
        return fromParameters(params);
    }

    CacheConfig CacheConfig::fromJsonFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open config file: " + path);
        }

        json j;
        try
        {
            file >> j;
        }
        catch (const json::parse_error &ex)
        {
            throw std::runtime_error("Failed to parse config file " + path + ": " + ex.what());
        }
        return fromJson(j);
    }

} // namespace core
