#pragma once

#include "indevolt/net/discovery/discovered_device.hpp"
#include "indevolt/net/rpc/http_transport.hpp"
#include "indevolt/net/rpc/integer_value.hpp"
#include "indevolt/net/rpc/rpc_errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace indevolt
{

constexpr const char* get_data_endpoint   = "Indevolt.GetData";
constexpr const char* set_data_endpoint   = "Indevolt.SetData";
constexpr const char* get_config_endpoint = "Sys.GetConfig";

/// Modbus style function code SetData uses for writing registers.
constexpr int write_function_code = 16;

/**
 * @brief Talks to the RPC interface of one device's embedded web server.
 *
 * Every call is an independent HTTP request bounded by the client's timeout. Failures are thrown as
 * TimeoutError or ApiError, nothing is retried and nothing is cached.
 */
class RpcClient
{
public:
    static constexpr std::chrono::milliseconds default_timeout {10000};

    /**
     * @param host Device address
     * @param port Port of the device's web server
     * @param timeout Limit for every call made through this client
     * @param transport Performs the HTTP exchanges, a BeastHttpTransport when null
     */
    RpcClient(std::string host, unsigned short port, std::chrono::milliseconds timeout = default_timeout,
              std::shared_ptr<HttpTransport> transport = nullptr);

    static RpcClient from_discovered_device(const DiscoveredDevice& device, std::chrono::milliseconds timeout = default_timeout,
                                            std::shared_ptr<HttpTransport> transport = nullptr);

    /**
     * Read cJson points
     * @param points Point identifiers, e.g. {"7101", "1664"}
     * @return The device's JSON reply
     */
    nlohmann::json fetch_data(const std::vector<IntegerValue>& points) const;
    nlohmann::json fetch_data(const IntegerValue& point) const;

    /**
     * Write values to a cJson point
     * @param point Point identifier, e.g. 47015
     * @param values Values to write, e.g. {2, 700, 5}
     * @return The device's JSON reply
     */
    nlohmann::json set_data(const IntegerValue& point, const std::vector<IntegerValue>& values) const;
    nlohmann::json set_data(const IntegerValue& point, const IntegerValue& value) const;

    /**
     * Read the system configuration
     * @return The device's JSON reply, with "device.generation" added when "device.type" is present
     */
    nlohmann::json get_config() const;

    const std::string& host() const { return _host; }
    unsigned short port() const { return _port; }
    std::chrono::milliseconds timeout() const { return _timeout; }

    /// "http://{host}:{port}/rpc"
    const std::string& base_url() const { return _base_url; }

private:
    nlohmann::json post(const std::string& endpoint, const nlohmann::json& config) const;
    nlohmann::json send(boost::beast::http::verb method, const std::string& endpoint, const std::string& target) const;

    std::string _host;
    unsigned short _port;
    std::chrono::milliseconds _timeout;
    std::string _base_url;
    std::shared_ptr<HttpTransport> _transport;
};

/// Device generation reported for a "device.type" model name: 2 for the second generation models, else 1.
int device_generation(const std::string& device_type);

} // namespace indevolt
