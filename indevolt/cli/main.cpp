#include "indevolt/cli/cli_options.hpp"
#include "indevolt/logging/indevolt_logging.hpp"
#include "indevolt/net/discovery/device_discovery.hpp"
#include "indevolt/net/rpc/rpc_client.hpp"

#include <boost/program_options/errors.hpp>

#include <iostream>
#include <vector>

namespace
{

void print_devices(const std::vector<indevolt::DiscoveredDevice>& devices)
{
    std::cout << "Found " << devices.size() << " device(s):\n\n";
    int index = 1;
    for (const auto& device : devices)
    {
        std::cout << "  " << index++ << ". IP: " << device.host() << ":" << device.port() << "\n";
        if (device.name())
        {
            std::cout << "     Name: " << *device.name() << "\n";
        }
        if (!device.metadata().empty())
        {
            std::cout << "     Metadata: " << nlohmann::ordered_json(device.metadata()).dump() << "\n";
        }
        std::cout << "\n";
    }
}

void print_troubleshooting()
{
    std::cout << "No devices found on the network.\n"
              << "\nTroubleshooting:\n"
              << "  1. Ensure your device is powered on and connected to WiFi\n"
              << "  2. Verify your computer and device are on the same network\n"
              << "  3. Check that UDP port " << indevolt::discovery_listen_port << " is not blocked by a firewall\n";
}

bool talk_to_device(const indevolt::DiscoveredDevice& device, const indevolt::CliConfig& config)
{
    std::cout << "Connecting to device at " << device.host() << ":" << device.port() << "...\n\n";

    auto client = indevolt::RpcClient::from_discovered_device(device, config.rpc_timeout);
    try
    {
        auto device_config = client.get_config();
        std::cout << "Device Configuration:\n" << device_config.dump(2) << "\n\n";

        if (!config.fetch_points.empty())
        {
            std::cout << "Data:\n" << client.fetch_data(config.fetch_points).dump(2) << "\n\n";
        }

        if (config.set_point)
        {
            std::cout << "Write result:\n" << client.set_data(*config.set_point, config.set_values).dump(2) << "\n\n";
        }
    }
    catch (const indevolt::RpcError& error)
    {
        INDEVOLT_LOG_ERROR("Request to " << client.base_url() << " failed: " << error.what());
        std::cerr << "Error talking to device " << device.host() << ": " << error.what() << "\n";
        return false;
    }

    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    indevolt::CliConfig config;
    try
    {
        config = indevolt::parse_command_line(argc, argv);
    }
    catch (const boost::program_options::error&)
    {
        return 2;
    }

    if (config.show_help)
    {
        return 0;
    }

    indevolt::logging::current_log_level = config.log_level;

    std::vector<indevolt::DiscoveredDevice> devices;
    if (config.host)
    {
        devices.emplace_back(*config.host, config.port);
    }
    else
    {
        indevolt::DiscoveryConfig discovery_config;
        discovery_config.broadcast_address = config.broadcast_address;

        std::cout << "Discovering Indevolt devices on the network...\n\n";
        devices = indevolt::discover(config.discovery_timeout, discovery_config);
        if (devices.empty())
        {
            print_troubleshooting();
            return 1;
        }
        print_devices(devices);
    }

    int exit_code = 0;
    for (const auto& device : devices)
    {
        if (!talk_to_device(device, config))
        {
            exit_code = 1;
        }
    }
    return exit_code;
}
