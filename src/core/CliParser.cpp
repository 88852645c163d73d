#include "CliParser.h"
#include <cctype>
#include <iostream>

namespace
{
    std::string normalizeParamName(const std::string &name)
    {
        std::string normalized = name;
        for (char &c : normalized)
        {
            if (c == '-')
                c = '_';
        }
        return normalized;
    }
} // namespace

bool CliParser::parseNonNegativeInt(const std::string &s, int &out)
{
    try
    {
        std::size_t consumed = 0;
        int value = std::stoi(s, &consumed);
        if (consumed != s.size() || value < 0)
        {
            return false;
        }
        out = value;
        return true;
    }
    catch (const std::logic_error &)
    {
        return false;
    }
}

CliParser::Result CliParser::parse(int argc, char *argv[])
{
    Result r;

    auto fail = [&r](const std::string &message)
    {
        r.valid = false;
        r.error_message = message;
        return r;
    };

    // Consumes the value following option, if there is one
    auto takeValue = [&](int &i, std::string &out) -> bool
    {
        if (i + 1 >= argc)
            return false;
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; i++)
    {
        std::string a = argv[i];
        std::string value;

        if (a == "--help" || a == "-h")
        {
            r.show_help = true;
            return r;
        }
        if (a == "--param-help")
        {
            r.show_param_help = true;
            return r;
        }
        if (a == "--metrics" || a == "-m")
        {
            r.print_metrics = true;
            continue;
        }

        std::string *string_target = nullptr;
        int *int_target = nullptr;
        if (a == "--queries-file" || a == "-q")
            string_target = &r.queries_file;
        else if (a == "--config" || a == "-c")
            string_target = &r.config_file;
        else if (a == "--threads" || a == "-n")
            int_target = &r.threads;
        else if (a == "--repeat" || a == "-r")
            int_target = &r.repeat;
        else if (a == "--latency-ms")
            int_target = &r.latency_ms;

        if (string_target || int_target)
        {
            if (!takeValue(i, value))
                return fail("Missing value for " + a);
            if (string_target)
                *string_target = value;
            else if (!parseNonNegativeInt(value, *int_target))
                return fail("Invalid value for " + a + ": " + value);
            continue;
        }

        if (a == "--log-level" || a == "-l")
        {
            if (!takeValue(i, value))
                return fail("Missing value for " + a);
            r.log_level = parseLogLevel(value);
            continue;
        }

        if (a.rfind("--", 0) != 0)
            return fail("Unknown argument: " + a);

        // Any other --name[=value] is a cache parameter
        std::string name = a.substr(2);
        auto eq_pos = name.find('=');
        if (eq_pos != std::string::npos)
        {
            value = name.substr(eq_pos + 1);
            name.resize(eq_pos);
        }
        else if (i + 1 < argc && argv[i + 1][0] != '-')
        {
            value = argv[++i];
        }
        else
        {
            // Bare flag
            value = "true";
        }

        name = normalizeParamName(name);
        try
        {
            r.cache_params.setFromString(name, value);
        }
        catch (const std::invalid_argument &e)
        {
            return fail("Invalid parameter value for --" + name + ": " + e.what());
        }
    }

    if (r.threads == 0)
        return fail("--threads must be at least 1");

    return r;
}

void CliParser::printHelp(const std::string &exeName)
{
    std::cout << "Usage: " << exeName << " [options] [--param-name value ...]\n"
              << "\n"
              << "Options:\n"
              << "  --queries-file, -q FILE      Path to queries JSON file (default queries.json)\n"
              << "  --config, -c FILE            Cache configuration JSON file\n"
              << "  --threads, -n COUNT          Worker threads issuing lookups (default 4)\n"
              << "  --repeat, -r COUNT           Times each worker runs the query list (default 1)\n"
              << "  --latency-ms VALUE           Max simulated provider latency (default 0)\n"
              << "  --metrics, -m                Print cache metrics as JSON\n"
              << "  --log-level, -l LEVEL        Logging level (trace/debug/info/warn/error)\n"
              << "  --param-help                 Show cache parameter help\n"
              << "  --help, -h                   Show this help message\n"
              << "\n"
              << "Cache parameters can be passed as --param-name=value or --param-name value.\n"
              << "They override values from --config. Use --param-help to list them.\n"
              << std::endl;
}

void CliParser::printParamHelp()
{
    std::cout << "Cache Parameters:\n"
              << "\n"
              << "  --poll-interval-ms INT       Road network update polling interval (default: 10000)\n"
              << "  --fetch-timeout-ms INT       Max wait for a remote fetch, 0 = unbounded (default: 0)\n"
              << "  --stripe-count INT           Lock stripes per map (default: 64)\n"
              << "  --top-locations INT          Entries in the most-requested list (default: 10)\n"
              << std::endl;
}

spdlog::level::level_enum CliParser::parseLogLevel(const std::string &s)
{
    std::string lvl = s;
    for (char &c : lvl)
        c = char(std::tolower(static_cast<unsigned char>(c)));

    if (lvl == "trace")
        return spdlog::level::trace;
    if (lvl == "debug")
        return spdlog::level::debug;
    if (lvl == "info")
        return spdlog::level::info;
    if (lvl == "warn" || lvl == "warning")
        return spdlog::level::warn;
    if (lvl == "err" || lvl == "error")
        return spdlog::level::err;
    if (lvl == "critical")
        return spdlog::level::critical;
    if (lvl == "off")
        return spdlog::level::off;

    return spdlog::level::info;
}
