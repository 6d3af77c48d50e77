#include "indevolt/cli/cli_options.hpp"

#include <boost/program_options/errors.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace indevolt
{

namespace
{

CliConfig parse(std::vector<const char*> arguments)
{
    arguments.insert(arguments.begin(), "indevolt_cli");
    return parse_command_line(static_cast<int>(arguments.size()), arguments.data());
}

} // namespace

TEST(CliOptionsTest, Defaults)
{
    auto config = parse({});

    EXPECT_FALSE(config.show_help);
    EXPECT_EQ(config.discovery_timeout, std::chrono::seconds(3));
    EXPECT_EQ(config.broadcast_address, "255.255.255.255");
    EXPECT_FALSE(config.host.has_value());
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.rpc_timeout, std::chrono::seconds(10));
    EXPECT_TRUE(config.fetch_points.empty());
    EXPECT_FALSE(config.set_point.has_value());
    EXPECT_EQ(config.log_level, logging::LogLevel::Info);
}

TEST(CliOptionsTest, HelpIsReported)
{
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

TEST(CliOptionsTest, DeviceAndRequests)
{
    auto config = parse({"--host", "192.168.1.50", "--port", "9090", "--rpc-timeout", "2.5", "-t", "1", "--fetch", "7101,1664",
                         "--set", "47015", "--values", "2,700,5"});

    ASSERT_TRUE(config.host.has_value());
    EXPECT_EQ(*config.host, "192.168.1.50");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.rpc_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(config.discovery_timeout, std::chrono::seconds(1));

    ASSERT_EQ(config.fetch_points.size(), 2U);
    EXPECT_EQ(config.fetch_points[0].to_integer(), 7101);
    EXPECT_EQ(config.fetch_points[1].to_integer(), 1664);

    ASSERT_TRUE(config.set_point.has_value());
    EXPECT_EQ(config.set_point->to_integer(), 47015);
    ASSERT_EQ(config.set_values.size(), 3U);
    EXPECT_EQ(config.set_values[1].to_integer(), 700);
}

TEST(CliOptionsTest, Verbosity)
{
    EXPECT_EQ(parse({"-v"}).log_level, logging::LogLevel::Debug);
    EXPECT_EQ(parse({"-vv"}).log_level, logging::LogLevel::Trace);
}

TEST(CliOptionsTest, InvalidArgumentsThrow)
{
    EXPECT_THROW(parse({"--set", "47015"}), boost::program_options::error);
    EXPECT_THROW(parse({"--values", "1"}), boost::program_options::error);
    EXPECT_THROW(parse({"--set", "1,2", "--values", "1"}), boost::program_options::error);
    EXPECT_THROW(parse({"--fetch", "7101,abc"}), boost::program_options::error);
    EXPECT_THROW(parse({"--port", "70000"}), boost::program_options::error);
    EXPECT_THROW(parse({"--timeout", "0"}), boost::program_options::error);
    EXPECT_THROW(parse({"--rpc-timeout", "-1"}), boost::program_options::error);
}

} // namespace indevolt
