#pragma once

#include "CacheParameters.h"

#include <string>
#include <spdlog/spdlog.h>

class CliParser
{
public:
    struct Result
    {
        bool valid = true;
        bool show_help = false;
        bool show_param_help = false;
        std::string error_message;

        // Default values
        std::string queries_file = "queries.json";
        std::string config_file;
        int threads = 4;
        int repeat = 1;
        int latency_ms = 0;
        bool print_metrics = false;

        spdlog::level::level_enum log_level = spdlog::level::info;

        // Cache parameters
        core::CacheParameters cache_params;
    };

    static Result parse(int argc, char *argv[]);
    static void printHelp(const std::string &exeName);
    static void printParamHelp();

private:
    static spdlog::level::level_enum parseLogLevel(const std::string &s);
    static bool parseNonNegativeInt(const std::string &s, int &out);
};
