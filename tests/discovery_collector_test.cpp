#include "indevolt/net/discovery/discovery_collector.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace indevolt
{

TEST(DiscoveryCollectorTest, FirstReplyPerHostWins)
{
    DiscoveryCollector collector;

    EXPECT_TRUE(collector.add_response("10.0.0.5", R"({"port": 9090})"));
    EXPECT_FALSE(collector.add_response("10.0.0.5", R"({"port": 9191, "name": "Richer"})"));
    EXPECT_FALSE(collector.add_response("10.0.0.5", "garbage"));

    auto devices = collector.devices();
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].port(), 9090);
    EXPECT_FALSE(devices[0].name().has_value());
}

TEST(DiscoveryCollectorTest, KeepsArrivalOrder)
{
    DiscoveryCollector collector;
    collector.add_response("10.0.0.9", "");
    collector.add_response("10.0.0.1", R"({"name": "B"})");
    collector.add_response("10.0.0.9", R"({"name": "late"})");
    collector.add_response("10.0.0.5", R"({"name": "C"})");

    auto devices = collector.devices();
    ASSERT_EQ(devices.size(), 3U);
    EXPECT_EQ(devices[0].host(), "10.0.0.9");
    EXPECT_EQ(devices[1].host(), "10.0.0.1");
    EXPECT_EQ(devices[2].host(), "10.0.0.5");
    EXPECT_FALSE(devices[0].name().has_value());
}

TEST(DiscoveryCollectorTest, MalformedFirstReplyStillRecordsDevice)
{
    DiscoveryCollector collector;
    EXPECT_TRUE(collector.add_response("10.0.0.3", "\xff\xfe"));
    EXPECT_FALSE(collector.add_response("10.0.0.3", R"({"port": 9090, "name": "Foo"})"));

    auto devices = collector.devices();
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].port(), 8080);
}

TEST(DiscoveryCollectorTest, ConcurrentRepliesFromSameHostsAreDeduplicated)
{
    DiscoveryCollector collector;
    constexpr int thread_count = 4;
    constexpr int host_count   = 50;

    std::vector<std::thread> threads;
    for (int thread_index = 0; thread_index < thread_count; ++thread_index)
    {
        threads.emplace_back(
            [&collector]()
            {
                for (int host = 0; host < host_count; ++host)
                {
                    collector.add_response("10.0.1." + std::to_string(host), "{}");
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(collector.size(), static_cast<std::size_t>(host_count));
}

} // namespace indevolt
