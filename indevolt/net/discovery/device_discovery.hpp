#pragma once

#include "boost/asio/io_context.hpp"
#include "boost/asio/ip/udp.hpp"
#include "indevolt/flags/flags.hpp"
#include "indevolt/net/discovery/discovered_device.hpp"
#include "indevolt/net/discovery/discovery_collector.hpp"
#include "indevolt/net/discovery/discovery_states.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace indevolt
{

/// Local port devices send their replies to.
constexpr unsigned short discovery_listen_port = 10000;
/// Port devices listen on for the probe.
constexpr unsigned short discovery_probe_port = 8099;
constexpr const char* discovery_broadcast_address = "255.255.255.255";
constexpr const char* discovery_probe = "AT+IGDEVICEIP";
constexpr std::chrono::milliseconds default_discovery_timeout {3000};
/// Largest payload a UDP datagram over IPv4 can carry, replies are never truncated below it.
constexpr std::size_t max_datagram_size = 65507;

struct DiscoveryConfig
{
    std::string listen_address    = "0.0.0.0";
    unsigned short listen_port    = discovery_listen_port;
    std::string broadcast_address = discovery_broadcast_address;
    unsigned short probe_port     = discovery_probe_port;
    std::string probe             = discovery_probe;
};

/**
 * @brief Broadcasts the discovery probe once and collects the replies until stopped.
 *
 * Runs on the given io_context. The object must outlive the completion of async_stop.
 */
class DeviceDiscovery
{
public:
    DeviceDiscovery(boost::asio::io_context& io_context, DiscoveryConfig config = {});

    ~DeviceDiscovery();

    DeviceDiscovery(const DeviceDiscovery&)            = delete;
    DeviceDiscovery& operator=(const DeviceDiscovery&) = delete;
    DeviceDiscovery(DeviceDiscovery&&)                 = delete;
    DeviceDiscovery& operator=(DeviceDiscovery&&)      = delete;

    /**
     * Open the socket with broadcast and address reuse enabled and bind it to the listen endpoint
     * @return false if any of these steps failed, the error is logged and the socket is closed again
     */
    bool open();

    /**
     * Start listening and send the probe
     * @return false if the socket isn't open or a run was already started
     */
    bool async_start();

    /**
     * Cancel outstanding operations and close the socket
     * @param on_stopped Posted to the io_context once nothing is outstanding anymore
     * @return false if a stop was already requested
     */
    bool async_stop(std::function<void()> on_stopped);

    /// Devices found so far, in the order their first reply arrived.
    std::vector<DiscoveredDevice> devices() const;

    std::optional<boost::asio::ip::udp::endpoint> local_endpoint() const;

private:
    void start_receive();
    void send_probe();
    void handle_send_complete(const boost::system::error_code& error_code);
    void handle_response(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void close_socket();
    void resolve_on_stopped();
    void set_state(DeviceDiscoveryState state);
    void clear_state(DeviceDiscoveryState state);

    mutable std::mutex _mutex;
    boost::asio::io_context& _io_context;
    DiscoveryConfig _config;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;

    std::vector<char> _recv_buffer;

    DiscoveryCollector _collector;
    std::function<void()> _on_stopped;
    Flags<DeviceDiscoveryState> _flags;
};

/**
 * Whether the receive loop is re-armed after a receive completed with the given error.
 * Errors reported for single datagrams (ICMP port unreachable, oversized datagram) don't end the
 * run, only a cancelled or closed socket or a pending stop does.
 */
bool keep_receiving_after(const boost::system::error_code& error_code, bool stopping);

/**
 * @brief Finds the devices on the local broadcast domain.
 *
 * Blocks for the whole timeout, replies can arrive until the very end. Never throws: a socket
 * that can't be bound or any other failure is logged and gives an empty result.
 *
 * @param timeout How long to listen for replies
 * @param config Addresses and ports to use, the protocol's well-known values by default
 * @return One device per replying host, in the order the first reply of each host arrived
 */
std::vector<DiscoveredDevice> discover(std::chrono::milliseconds timeout = default_discovery_timeout, const DiscoveryConfig& config = {});

} // namespace indevolt
