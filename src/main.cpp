#include "core/CacheConfig.h"
#include "core/CliParser.h"
#include "core/DistanceCache.h"
#include "core/JsonQueryParser.h"
#include "providers/HaversineDistanceProvider.h"

#include <iostream>
#include <iomanip>
#include <memory>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#define LOG_FILE_PATH "logs"

int main(int argc, char *argv[])
{
    CliParser::Result cli = CliParser::parse(argc, argv);
    if (!cli.valid)
    {
        std::cout << "Error: " << cli.error_message << std::endl;
        return 1;
    }

    if (cli.show_help)
    {
        CliParser::printHelp(argv[0]);
        return 0;
    }

    if (cli.show_param_help)
    {
        CliParser::printParamHelp();
        return 0;
    }

    // Setup logging
    try
    {
        std::filesystem::path logs_dir(LOG_FILE_PATH);
        if (!std::filesystem::exists(logs_dir))
        {
            std::filesystem::create_directories(logs_dir);
        }

        auto now = std::chrono::system_clock::now();
        std::time_t ts = std::chrono::system_clock::to_time_t(now);
        std::tm tmnow;
        localtime_r(&ts, &tmnow);

        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y%m%d", &tmnow);

        std::string filename = std::string("road-distance-cache_") + buf + ".log";
        std::filesystem::path filepath = std::filesystem::path(LOG_FILE_PATH) / filename;

        auto file_logger = spdlog::basic_logger_mt("file_logger", filepath.string());
        spdlog::set_default_logger(file_logger);
        spdlog::set_level(cli.log_level);

        spdlog::info("Logging initialized");
    }
    catch (const spdlog::spdlog_ex &ex)
    {
        std::cerr << "Logging init failed: " << ex.what() << std::endl;
    }
    catch (const std::filesystem::filesystem_error &ex)
    {
        std::cerr << "Logging init failed: " << ex.what() << std::endl;
    }

    // Cache configuration: file first, command line parameters on top
    core::CacheConfig config;
    try
    {
        if (!cli.config_file.empty())
        {
            config = core::CacheConfig::fromJsonFile(cli.config_file);
        }
        config.applyParameters(cli.cache_params);
        config.validate();
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Invalid cache configuration: {}", ex.what());
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }

    spdlog::info("CLI config: queries={}, threads={}, repeat={}, latency_ms={}, cache={}",
                 cli.queries_file,
                 cli.threads,
                 cli.repeat,
                 cli.latency_ms,
                 config.toJson().dump());

    // Load queries
    std::vector<core::DistanceQuery> queries;
    try
    {
        queries = core::JsonQueryParser::parseFileToVector(cli.queries_file);
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Failed to parse queries: {}", ex.what());
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }

    auto provider = std::make_shared<providers::HaversineDistanceProvider>(std::chrono::milliseconds(cli.latency_ms));
    core::DistanceCache cache(provider, config);

    // Each worker walks the query list from its own offset so workers overlap on pairs
    std::vector<std::vector<std::optional<int>>> results(cli.threads, std::vector<std::optional<int>>(queries.size()));
    std::vector<std::vector<std::string>> errors(cli.threads);
    std::vector<std::thread> workers;
    workers.reserve(cli.threads);

    for (int t = 0; t < cli.threads; ++t)
    {
        workers.emplace_back([&, t]
                             {
            for (int round = 0; round < cli.repeat; ++round)
            {
                for (std::size_t k = 0; k < queries.size(); ++k)
                {
                    std::size_t idx = (k + static_cast<std::size_t>(t)) % queries.size();
                    try
                    {
                        results[t][idx] = cache.distanceInMeters(queries[idx].from, queries[idx].to);
                    }
                    catch (const std::exception &ex)
                    {
                        errors[t].push_back(ex.what());
                    }
                }
            } });
    }

    for (auto &worker : workers)
    {
        worker.join();
    }

    std::size_t failures = 0;
    for (const auto &worker_errors : errors)
    {
        for (const auto &message : worker_errors)
        {
            spdlog::error("Lookup failed: {}", message);
            ++failures;
        }
    }

    std::unordered_map<core::Coordinate, std::unordered_set<core::Coordinate>> printed;
    for (std::size_t idx = 0; idx < queries.size(); ++idx)
    {
        const auto &query = queries[idx];
        if (!printed[query.from].insert(query.to).second)
        {
            continue;
        }

        std::optional<int> distance;
        for (int t = 0; t < cli.threads && !distance; ++t)
        {
            distance = results[t][idx];
        }

        if (distance)
        {
            std::cout << "Distance: " << query.from.toString() << " -> " << query.to.toString()
                      << " = " << *distance << " m" << std::endl;
        }
        else
        {
            std::cout << "Distance: " << query.from.toString() << " -> " << query.to.toString()
                      << " unavailable" << std::endl;
        }
    }

    if (cli.print_metrics)
    {
        std::cout << cache.getMetrics().toJson().dump(2) << std::endl;
    }

    spdlog::info("Finished: {} lookups, {} remote fetches, {} failures",
                 static_cast<uint64_t>(cli.threads) * static_cast<uint64_t>(cli.repeat) * queries.size(),
                 provider->fetchCount(),
                 failures);

    return failures == 0 ? 0 : 1;
}
