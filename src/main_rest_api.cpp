#include "rest/DistanceServer.h"
#include "core/CacheConfig.h"
#include "core/DistanceCache.h"
#include "providers/HaversineDistanceProvider.h"

#include <iostream>
#include <cstdlib>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#define LOG_FILE_PATH "logs"

void setupFileLogging(spdlog::level::level_enum level)
{
    std::filesystem::path logs_dir(LOG_FILE_PATH);
    if (!std::filesystem::exists(logs_dir))
    {
        std::filesystem::create_directories(logs_dir);
    }

    auto now = std::chrono::system_clock::now();
    std::time_t tnow = std::chrono::system_clock::to_time_t(now);
    std::tm tmnow;
    localtime_r(&tnow, &tmnow);

    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tmnow);
    std::string filename = std::string("road-distance-rest-api_") + buf + ".log";
    std::filesystem::path log_file_path = logs_dir / filename;

    auto file_logger = spdlog::basic_logger_mt("file_logger", log_file_path.string());
    spdlog::set_default_logger(file_logger);
    spdlog::set_level(level);

    spdlog::info("REST API logging initialized.");
}

void printHelp(const char *prog_name)
{
    std::cout << "Usage: " << prog_name << " [OPTIONS]\n"
              << "\nRoad distance cache REST API server\n"
              << "\nOptions:\n"
              << "  --port PORT              Listen port (default: 8080)\n"
              << "  --config FILE            Cache configuration JSON file\n"
              << "  --latency-ms VALUE       Max simulated provider latency (default: 200)\n"
              << "  --log-level LEVEL        Logging level (trace/debug/info/warn/error)\n"
              << "  --help                   Show this help message\n"
              << std::endl;
}

int main(int argc, char *argv[])
{
    uint16_t port = 8080;
    int latency_ms = 200;
    std::string config_file;
    spdlog::level::level_enum log_level = spdlog::level::info;

    // Parse arguments
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            printHelp(argv[0]);
            return 0;
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            port = static_cast<uint16_t>(std::atoi(argv[++i]));
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_file = argv[++i];
        }
        else if (arg == "--latency-ms" && i + 1 < argc)
        {
            latency_ms = std::atoi(argv[++i]);
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            std::string level_name = argv[++i];
            log_level = spdlog::level::from_str(level_name);
            // from_str maps unknown names to off
            if (log_level == spdlog::level::off && level_name != "off")
            {
                log_level = spdlog::level::info;
            }
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            printHelp(argv[0]);
            return 1;
        }
    }

    try
    {
        setupFileLogging(log_level);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Logging init failed: " << ex.what() << std::endl;
    }

    try
    {
        core::CacheConfig config;
        if (!config_file.empty())
        {
            config = core::CacheConfig::fromJsonFile(config_file);
        }

        auto provider = std::make_shared<providers::HaversineDistanceProvider>(std::chrono::milliseconds(latency_ms));
        auto cache = std::make_shared<core::DistanceCache>(provider, config);

        rest::DistanceServer server(port, cache, provider);
        server.start();
    }
    catch (const std::exception &ex)
    {
        spdlog::error("REST API server failed: {}", ex.what());
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
