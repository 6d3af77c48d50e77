#include "indevolt/cli/cli_options.hpp"
#include "indevolt/logging/indevolt_logging.hpp"

#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace indevolt
{

namespace
{

namespace po = boost::program_options;

std::vector<IntegerValue> parse_integer_list(const std::string& option, const std::string& text)
{
    std::vector<IntegerValue> values;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ','))
    {
        IntegerValue value(item);
        try
        {
            value.to_integer();
        }
        catch (const std::logic_error&)
        {
            throw po::error("Invalid integer '" + item + "' in --" + option);
        }
        values.push_back(std::move(value));
    }

    if (values.empty())
    {
        throw po::error("--" + option + " needs at least one integer");
    }
    return values;
}

std::chrono::milliseconds parse_seconds(const std::string& option, double seconds)
{
    if (!(seconds > 0.0))
    {
        throw po::error("--" + option + " must be positive");
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(seconds));
}

} // namespace

CliConfig parse_command_line(int argc, const char* const argv[])
{
    po::options_description desc("indevolt_cli Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show help message")
        ("timeout,t", po::value<double>()->default_value(3.0), "Discovery time in seconds")
        ("broadcast,b", po::value<std::string>()->default_value(discovery_broadcast_address), "Broadcast address for the discovery probe")
        ("host", po::value<std::string>(), "Device address, skips discovery")
        ("port", po::value<int>()->default_value(default_device_port), "Device port, used with --host")
        ("rpc-timeout", po::value<double>()->default_value(10.0), "Timeout of each device request in seconds")
        ("fetch", po::value<std::string>(), "Comma separated cJson points to read, e.g. 7101,1664")
        ("set", po::value<std::string>(), "cJson point to write, requires --values")
        ("values", po::value<std::string>(), "Comma separated values to write to the --set point");
    // clang-format on

    std::vector<std::string> arguments;
    arguments.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }

    int verbosity = 0;
    for (const std::string& argument : arguments)
    {
        if (argument.size() >= 2 && argument[0] == '-' && argument[1] == 'v')
        {
            size_t v_count = 0;
            for (size_t j = 1; j < argument.size() && argument[j] == 'v'; ++j)
            {
                ++v_count;
            }

            if (v_count == argument.size() - 1)
            {
                verbosity = static_cast<int>(v_count);
                break;
            }
        }
    }

    po::variables_map variables;

    CliConfig config;

    try
    {
        auto parser = po::command_line_parser(arguments).options(desc).allow_unregistered();

        po::store(parser.run(), variables);
        po::notify(variables);

        if (variables.count("help") != 0U)
        {
            std::cout << desc << '\n';
            std::cout << "\nVerbosity levels:\n"
                      << "  (none)  : Info level  - shows ERROR, WARNING and INFO messages\n"
                      << "  -v      : Debug level - adds DEBUG messages\n"
                      << "  -vv     : Trace level - shows all messages\n"
                      << "\nWithout --host, devices are discovered by UDP broadcast first.\n";
            config.show_help = true;
            return config;
        }

        config.discovery_timeout = parse_seconds("timeout", variables["timeout"].as<double>());
        config.rpc_timeout       = parse_seconds("rpc-timeout", variables["rpc-timeout"].as<double>());
        config.broadcast_address = variables["broadcast"].as<std::string>();

        const int port = variables["port"].as<int>();
        if (port <= 0 || port > 65535)
        {
            throw po::error("--port must be between 1 and 65535");
        }
        config.port = static_cast<unsigned short>(port);

        if (variables.count("host") != 0U)
        {
            config.host = variables["host"].as<std::string>();
        }

        if (variables.count("fetch") != 0U)
        {
            config.fetch_points = parse_integer_list("fetch", variables["fetch"].as<std::string>());
        }

        const bool has_set    = variables.count("set") != 0U;
        const bool has_values = variables.count("values") != 0U;
        if (has_set != has_values)
        {
            throw po::error("--set and --values must be given together.");
        }
        if (has_set)
        {
            auto points = parse_integer_list("set", variables["set"].as<std::string>());
            if (points.size() != 1)
            {
                throw po::error("--set takes exactly one cJson point");
            }
            config.set_point  = points.front();
            config.set_values = parse_integer_list("values", variables["values"].as<std::string>());
        }

        if (verbosity == 0)
        {
            config.log_level = logging::LogLevel::Info;
        }
        else if (verbosity == 1)
        {
            config.log_level = logging::LogLevel::Debug;
        }
        else
        {
            config.log_level = logging::LogLevel::Trace;
        }

        INDEVOLT_LOG_DEBUG("Verbosity level: " << verbosity);
        INDEVOLT_LOG_TRACE("Command line arguments parsed successfully");
    }
    catch (const po::error& error)
    {
        INDEVOLT_LOG_ERROR("Error parsing command line: " << error.what());
        std::cerr << "Error: " << error.what() << '\n';
        std::cerr << desc << '\n';
        throw;
    }

    return config;
}

} // namespace indevolt
