#include <gtest/gtest.h>
#include "../src/core/JsonQueryParser.h"
#include <fstream>
#include <cstdio>

// Helper class to create temporary JSON files for testing
class TempJsonFile
{
public:
    std::string path;

    TempJsonFile(const std::string &content)
    {
        char tmp_name[L_tmpnam];
        std::tmpnam(tmp_name);
        path = std::string(tmp_name);
        std::ofstream f(path);
        f << content;
        f.close();
    }

    ~TempJsonFile()
    {
        std::remove(path.c_str());
    }
};

// ====================
// parseFileToVector Tests
// ====================

TEST(JsonQueryParser, ParseFileToVector_ValidFile)
{
    TempJsonFile file(R"({
        "queries": [
            {
                "from": {"latitude": 59.3293, "longitude": 18.0686},
                "to": {"latitude": 57.7089, "longitude": 11.9746}
            },
            {
                "from": {"latitude": 57.7089, "longitude": 11.9746},
                "to": {"latitude": 55.605, "longitude": 13.0038}
            }
        ]
    })");

    auto queries = core::JsonQueryParser::parseFileToVector(file.path);

    ASSERT_EQ(queries.size(), 2u);
    EXPECT_FLOAT_EQ(queries[0].from.latitude(), 59.3293f);
    EXPECT_FLOAT_EQ(queries[0].from.longitude(), 18.0686f);
    EXPECT_FLOAT_EQ(queries[0].to.latitude(), 57.7089f);
    EXPECT_FLOAT_EQ(queries[0].to.longitude(), 11.9746f);

    // Order is preserved
    EXPECT_EQ(queries[1].from, queries[0].to);
    EXPECT_FLOAT_EQ(queries[1].to.latitude(), 55.605f);
}

TEST(JsonQueryParser, ParseFileToVector_IntegerCoordinates)
{
    TempJsonFile file(R"({
        "queries": [
            {"from": {"latitude": 57, "longitude": 11}, "to": {"latitude": 58, "longitude": -12}}
        ]
    })");

    auto queries = core::JsonQueryParser::parseFileToVector(file.path);

    ASSERT_EQ(queries.size(), 1u);
    EXPECT_FLOAT_EQ(queries[0].from.latitude(), 57.0f);
    EXPECT_FLOAT_EQ(queries[0].to.longitude(), -12.0f);
}

TEST(JsonQueryParser, ParseFileToVector_ExtraFieldsIgnored)
{
    TempJsonFile file(R"({
        "description": "commute",
        "queries": [
            {
                "id": 7,
                "from": {"latitude": 1.0, "longitude": 2.0, "name": "home"},
                "to": {"latitude": 3.0, "longitude": 4.0}
            }
        ]
    })");

    auto queries = core::JsonQueryParser::parseFileToVector(file.path);
    ASSERT_EQ(queries.size(), 1u);
    EXPECT_FLOAT_EQ(queries[0].to.longitude(), 4.0f);
}

TEST(JsonQueryParser, ParseFileToVector_FileNotFound)
{
    EXPECT_THROW(
        core::JsonQueryParser::parseFileToVector("/nonexistent/path/file.json"),
        std::runtime_error);
}

TEST(JsonQueryParser, ParseFileToVector_MalformedJson)
{
    TempJsonFile file(R"({"queries": [ {"from": )");

    EXPECT_THROW(
        core::JsonQueryParser::parseFileToVector(file.path),
        std::runtime_error);
}

TEST(JsonQueryParser, ParseFileToVector_MissingQueriesKey)
{
    TempJsonFile file(R"({"points": []})");

    EXPECT_THROW(
        core::JsonQueryParser::parseFileToVector(file.path),
        std::runtime_error);
}

TEST(JsonQueryParser, ParseFileToVector_EmptyQueries)
{
    TempJsonFile file(R"({"queries": []})");

    EXPECT_THROW(
        core::JsonQueryParser::parseFileToVector(file.path),
        std::runtime_error);
}

// ====================
// parseJsonToVector Tests
// ====================

TEST(JsonQueryParser, ParseJsonToVector_Valid)
{
    nlohmann::json j = {
        {"queries", {{{"from", {{"latitude", 10.0}, {"longitude", 20.0}}}, {"to", {{"latitude", 30.0}, {"longitude", 40.0}}}}}}};

    auto queries = core::JsonQueryParser::parseJsonToVector(j);

    ASSERT_EQ(queries.size(), 1u);
    EXPECT_EQ(queries[0].from, core::Coordinate(10.0f, 20.0f));
    EXPECT_EQ(queries[0].to, core::Coordinate(30.0f, 40.0f));
}

TEST(JsonQueryParser, ParseJsonToVector_QueriesNotArray)
{
    nlohmann::json j = {{"queries", "not an array"}};

    EXPECT_THROW(core::JsonQueryParser::parseJsonToVector(j), std::runtime_error);
}

TEST(JsonQueryParser, ParseJsonToVector_MissingDestination)
{
    nlohmann::json j = {
        {"queries", {{{"from", {{"latitude", 10.0}, {"longitude", 20.0}}}}}}};

    EXPECT_THROW(core::JsonQueryParser::parseJsonToVector(j), std::runtime_error);
}

// ====================
// parseCoordinate Tests
// ====================

TEST(JsonQueryParser, ParseCoordinate_Valid)
{
    nlohmann::json j = {{"latitude", -33.8688}, {"longitude", 151.2093}};

    auto c = core::JsonQueryParser::parseCoordinate(j);

    EXPECT_FLOAT_EQ(c.latitude(), -33.8688f);
    EXPECT_FLOAT_EQ(c.longitude(), 151.2093f);
}

TEST(JsonQueryParser, ParseCoordinate_MissingLongitude)
{
    nlohmann::json j = {{"latitude", 10.0}};

    EXPECT_THROW(core::JsonQueryParser::parseCoordinate(j), std::runtime_error);
}

TEST(JsonQueryParser, ParseCoordinate_NonNumeric)
{
    nlohmann::json j = {{"latitude", "57.7"}, {"longitude", 11.9}};

    EXPECT_THROW(core::JsonQueryParser::parseCoordinate(j), std::runtime_error);
}

TEST(JsonQueryParser, ParseCoordinate_NotAnObject)
{
    nlohmann::json j = nlohmann::json::array({57.7, 11.9});

    EXPECT_THROW(core::JsonQueryParser::parseCoordinate(j), std::runtime_error);
}

TEST(JsonQueryParser, ParseCoordinate_OutOfRangeIsParsedButInvalid)
{
    // Range checks belong to the cache, the parser only reads numbers
    nlohmann::json j = {{"latitude", 95.0}, {"longitude", 0.0}};

    auto c = core::JsonQueryParser::parseCoordinate(j);
    EXPECT_FALSE(c.isValid());
}
