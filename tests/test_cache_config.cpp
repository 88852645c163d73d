#include <gtest/gtest.h>
#include "core/CacheConfig.h"
#include "core/CacheParameters.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <variant>

using namespace std::chrono_literals;

// ====================
// CacheParameters
// ====================

TEST(CacheParameters, ParsesIntDoubleAndBool)
{
    core::CacheParameters params;
    params.setFromString("a", "42");
    params.setFromString("b", "0.5");
    params.setFromString("c", "true");
    params.setFromString("d", "1e3");

    EXPECT_EQ(params.get<int>("a"), 42);
    EXPECT_DOUBLE_EQ(params.get<double>("b"), 0.5);
    EXPECT_TRUE(params.get<bool>("c"));
    EXPECT_DOUBLE_EQ(params.get<double>("d"), 1000.0);
}

TEST(CacheParameters, NumericConversion)
{
    core::CacheParameters params;
    params.set("int_value", 3);
    params.set("double_value", 7.9);

    EXPECT_DOUBLE_EQ(params.get<double>("int_value"), 3.0);
    EXPECT_EQ(params.get<int>("double_value"), 7);
}

TEST(CacheParameters, RejectsGarbage)
{
    core::CacheParameters params;
    EXPECT_THROW(params.setFromString("a", "12abc"), std::invalid_argument);
    EXPECT_THROW(params.setFromString("a", "fast"), std::invalid_argument);
    EXPECT_FALSE(params.has("a"));
}

TEST(CacheParameters, MissingNameThrows)
{
    core::CacheParameters params;
    EXPECT_THROW(params.get<int>("missing"), std::out_of_range);
}

TEST(CacheParameters, BoolIsNotNumeric)
{
    core::CacheParameters params;
    params.set("flag", true);
    EXPECT_THROW(params.get<int>("flag"), std::bad_variant_access);
}

// ====================
// CacheConfig
// ====================

TEST(CacheConfig, Defaults)
{
    core::CacheConfig config;

    EXPECT_EQ(config.poll_interval, 10s);
    EXPECT_EQ(config.fetch_timeout, 0ms);
    EXPECT_EQ(config.stripe_count, 64u);
    EXPECT_EQ(config.top_locations, 10u);
    EXPECT_NO_THROW(config.validate());
}

TEST(CacheConfig, ApplyParametersOverridesOnlyGiven)
{
    core::CacheParameters params;
    params.set("poll_interval_ms", 250);
    params.set("top_locations", 2);

    core::CacheConfig config;
    config.applyParameters(params);

    EXPECT_EQ(config.poll_interval, 250ms);
    EXPECT_EQ(config.top_locations, 2u);
    EXPECT_EQ(config.fetch_timeout, 0ms);
    EXPECT_EQ(config.stripe_count, 64u);
}

TEST(CacheConfig, UnknownParameterIsIgnored)
{
    core::CacheParameters params;
    params.set("cache_colour", 3);

    core::CacheConfig config = core::CacheConfig::fromParameters(params);
    EXPECT_EQ(config.poll_interval, 10s);
    EXPECT_FALSE(core::CacheConfig::isKnownParameter("cache_colour"));
    EXPECT_TRUE(core::CacheConfig::isKnownParameter("fetch_timeout_ms"));
}

TEST(CacheConfig, NegativeCountRejected)
{
    core::CacheParameters params;
    params.set("stripe_count", -1);

    EXPECT_THROW(core::CacheConfig::fromParameters(params), std::invalid_argument);
}

TEST(CacheConfig, ValidateRejectsOutOfRange)
{
    core::CacheConfig config;
    config.poll_interval = 0ms;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = core::CacheConfig();
    config.fetch_timeout = -1ms;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = core::CacheConfig();
    config.stripe_count = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(CacheConfig, FromJson)
{
    nlohmann::json j = {
        {"poll_interval_ms", 500},
        {"fetch_timeout_ms", 2000},
        {"stripe_count", 16}};

    core::CacheConfig config = core::CacheConfig::fromJson(j);

    EXPECT_EQ(config.poll_interval, 500ms);
    EXPECT_EQ(config.fetch_timeout, 2s);
    EXPECT_EQ(config.stripe_count, 16u);
    EXPECT_EQ(config.top_locations, 10u);
}

TEST(CacheConfig, FromJsonRejectsNonObject)
{
    EXPECT_THROW(core::CacheConfig::fromJson(nlohmann::json::array({1, 2})), std::runtime_error);
}

TEST(CacheConfig, FromJsonRejectsStringValue)
{
    nlohmann::json j = {{"poll_interval_ms", "fast"}};
    EXPECT_THROW(core::CacheConfig::fromJson(j), std::runtime_error);
}

TEST(CacheConfig, ToJsonRoundTrip)
{
    core::CacheConfig config;
    config.poll_interval = 1234ms;
    config.top_locations = 3;

    core::CacheConfig parsed = core::CacheConfig::fromJson(config.toJson());

    EXPECT_EQ(parsed.poll_interval, 1234ms);
    EXPECT_EQ(parsed.top_locations, 3u);
}

TEST(CacheConfig, FromJsonFile)
{
    char tmp_name[L_tmpnam];
    std::tmpnam(tmp_name);
    std::string path(tmp_name);
    {
        std::ofstream f(path);
        f << R"({"poll_interval_ms": 750, "stripe_count": 8})";
    }

    core::CacheConfig config = core::CacheConfig::fromJsonFile(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.poll_interval, 750ms);
    EXPECT_EQ(config.stripe_count, 8u);
}

TEST(CacheConfig, FromJsonFileErrors)
{
    EXPECT_THROW(core::CacheConfig::fromJsonFile("/nonexistent/cache.json"), std::runtime_error);

    char tmp_name[L_tmpnam];
    std::tmpnam(tmp_name);
    std::string path(tmp_name);
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    EXPECT_THROW(core::CacheConfig::fromJsonFile(path), std::runtime_error);
    std::remove(path.c_str());
}
