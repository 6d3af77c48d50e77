#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "indevolt/logging/indevolt_logging.hpp"
#include "indevolt/net/discovery/device_discovery.hpp"
#include "indevolt/net/rpc/integer_value.hpp"
#include "indevolt/net/rpc/rpc_client.hpp"

namespace indevolt
{

struct CliConfig
{
    bool show_help = false;

    std::chrono::milliseconds discovery_timeout = default_discovery_timeout;
    std::string broadcast_address               = discovery_broadcast_address;

    // Set to skip discovery and talk to this device only
    std::optional<std::string> host;
    unsigned short port = default_device_port;

    std::chrono::milliseconds rpc_timeout = RpcClient::default_timeout;
    std::vector<IntegerValue> fetch_points;
    std::optional<IntegerValue> set_point;
    std::vector<IntegerValue> set_values;

    logging::LogLevel log_level = logging::LogLevel::Info;
};

} // namespace indevolt
