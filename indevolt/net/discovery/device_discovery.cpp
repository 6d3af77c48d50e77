#include "indevolt/net/discovery/device_discovery.hpp"

#include "boost/asio/error.hpp"
#include "boost/asio/post.hpp"
#include "boost/asio/steady_timer.hpp"
#include "indevolt/logging/indevolt_logging.hpp"

#include <exception>
#include <utility>

namespace indevolt
{

DeviceDiscovery::DeviceDiscovery(boost::asio::io_context& io_context, DiscoveryConfig config)
    : _io_context(io_context), _config(std::move(config)), _socket(io_context), _recv_buffer(max_datagram_size)
{
}

DeviceDiscovery::~DeviceDiscovery()
{
    std::unique_lock<std::mutex> lock(_mutex);
    close_socket();
}

bool DeviceDiscovery::open()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_flags.get_flag(DeviceDiscoveryState::open))
    {
        return false;
    }

    boost::system::error_code error_code;
    auto address = boost::asio::ip::make_address(_config.listen_address, error_code);
    if (error_code)
    {
        INDEVOLT_LOG_ERROR("Invalid listen address '" << _config.listen_address << "': " << error_code.message());
        return false;
    }
    boost::asio::ip::udp::endpoint listen_endpoint(address, _config.listen_port);

    _socket.open(listen_endpoint.protocol(), error_code);
    if (error_code)
    {
        INDEVOLT_LOG_ERROR("Failed to open discovery socket: " << error_code.message());
        return false;
    }

    _socket.set_option(boost::asio::socket_base::reuse_address(true), error_code);
    if (!error_code)
    {
        _socket.set_option(boost::asio::socket_base::broadcast(true), error_code);
    }
    if (error_code)
    {
        INDEVOLT_LOG_ERROR("Failed to configure discovery socket: " << error_code.message());
        close_socket();
        return false;
    }

    _socket.bind(listen_endpoint, error_code);
    if (error_code)
    {
        INDEVOLT_LOG_ERROR("Failed to bind to port " << _config.listen_port << ": " << error_code.message());
        close_socket();
        return false;
    }

    set_state(DeviceDiscoveryState::open);
    INDEVOLT_LOG_DEBUG("Discovery socket bound to " << listen_endpoint);
    return true;
}

bool DeviceDiscovery::async_start()
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_flags.get_flag(DeviceDiscoveryState::open) || _flags.any_of(DeviceDiscoveryState::running, DeviceDiscoveryState::stopping))
        {
            return false;
        }

        set_state(DeviceDiscoveryState::running);
    }

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> my_lock(_mutex);
                          if (!_flags.get_flag(DeviceDiscoveryState::stopping))
                          {
                              start_receive();
                              send_probe();
                          }
                          else
                          {
                              resolve_on_stopped();
                          }
                      });

    return true;
}

bool DeviceDiscovery::async_stop(std::function<void()> on_stopped)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_flags.get_flag(DeviceDiscoveryState::stopping))
        {
            return false;
        }

        set_state(DeviceDiscoveryState::stopping);
        _on_stopped = std::move(on_stopped);
    }

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> my_lock(_mutex);
                          if (_socket.is_open())
                          {
                              boost::system::error_code error_code;
                              _socket.cancel(error_code);
                              if (error_code)
                              {
                                  INDEVOLT_LOG_WARNING("Failed to cancel discovery socket operations: " << error_code.message());
                              }
                          }
                          resolve_on_stopped();
                      });

    return true;
}

std::vector<DiscoveredDevice> DeviceDiscovery::devices() const
{
    return _collector.devices();
}

std::optional<boost::asio::ip::udp::endpoint> DeviceDiscovery::local_endpoint() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    boost::system::error_code error_code;
    auto endpoint = _socket.local_endpoint(error_code);
    if (error_code)
    {
        return std::nullopt;
    }
    return endpoint;
}

void DeviceDiscovery::start_receive()
{
    set_state(DeviceDiscoveryState::receiving_async);
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                               { handle_response(error_code, bytes_transferred); });
}

void DeviceDiscovery::send_probe()
{
    boost::system::error_code error_code;
    auto address = boost::asio::ip::make_address(_config.broadcast_address, error_code);
    if (error_code)
    {
        INDEVOLT_LOG_ERROR("Invalid broadcast address '" << _config.broadcast_address << "': " << error_code.message());
        return;
    }
    boost::asio::ip::udp::endpoint broadcast_endpoint(address, _config.probe_port);

    INDEVOLT_LOG_TRACE("Sending discovery probe " << _config.probe << " to " << broadcast_endpoint);
    set_state(DeviceDiscoveryState::sending_async);
    _socket.async_send_to(boost::asio::buffer(_config.probe), broadcast_endpoint,
                          [this](const boost::system::error_code& error_code, std::size_t) { handle_send_complete(error_code); });
}

void DeviceDiscovery::handle_send_complete(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            INDEVOLT_LOG_DEBUG("Discovery probe sending aborted.");
        }
        else
        {
            INDEVOLT_LOG_ERROR("Failed to send discovery probe: " << error_code.message());
        }
    }
    clear_state(DeviceDiscoveryState::sending_async);
    resolve_on_stopped();
}

void DeviceDiscovery::handle_response(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            INDEVOLT_LOG_DEBUG("Discovery response receiving aborted.");
        }
        else
        {
            INDEVOLT_LOG_WARNING("Error receiving discovery response: " << error_code.message());
        }
    }
    else
    {
        std::string response(_recv_buffer.data(), bytes_transferred);
        INDEVOLT_LOG_TRACE("Discovery response from " << _remote_endpoint << ": " << response);
        _collector.add_response(_remote_endpoint.address().to_string(), response);
    }

    if (keep_receiving_after(error_code, _flags.get_flag(DeviceDiscoveryState::stopping)))
    {
        start_receive();
        return;
    }
    clear_state(DeviceDiscoveryState::receiving_async);
    resolve_on_stopped();
}

void DeviceDiscovery::close_socket()
{
    if (!_socket.is_open())
    {
        return;
    }

    boost::system::error_code error_code;
    _socket.close(error_code);
    if (error_code)
    {
        INDEVOLT_LOG_WARNING("Failed to close discovery socket: " << error_code.message());
    }
}

void DeviceDiscovery::set_state(DeviceDiscoveryState state)
{
    if (!_flags.get_flag(state))
    {
        INDEVOLT_LOG_TRACE("Discovery state " << to_string(state) << " set");
        _flags.set_flag(state);
    }
}

void DeviceDiscovery::clear_state(DeviceDiscoveryState state)
{
    if (_flags.get_flag(state))
    {
        INDEVOLT_LOG_TRACE("Discovery state " << to_string(state) << " cleared");
        _flags.clear_flag(state);
    }
}

void DeviceDiscovery::resolve_on_stopped()
{
    if (!_flags.get_flag(DeviceDiscoveryState::stopping) ||
        _flags.any_of(DeviceDiscoveryState::sending_async, DeviceDiscoveryState::receiving_async))
    {
        return;
    }

    close_socket();
    clear_state(DeviceDiscoveryState::open);
    clear_state(DeviceDiscoveryState::running);

    if (_on_stopped)
    {
        auto stopped_callback = std::move(_on_stopped);
        _on_stopped           = nullptr;
        boost::asio::post(_io_context, std::move(stopped_callback));
    }
}

bool keep_receiving_after(const boost::system::error_code& error_code, bool stopping)
{
    if (stopping)
    {
        return false;
    }
    return error_code != boost::asio::error::operation_aborted && error_code != boost::asio::error::bad_descriptor;
}

std::vector<DiscoveredDevice> discover(std::chrono::milliseconds timeout, const DiscoveryConfig& config)
{
    try
    {
        boost::asio::io_context io_context;
        DeviceDiscovery discovery(io_context, config);
        if (!discovery.open())
        {
            INDEVOLT_LOG_ERROR("Indevolt device discovery failed: socket unavailable");
            return {};
        }

        boost::asio::steady_timer deadline(io_context);
        deadline.expires_after(timeout);
        deadline.async_wait(
            [&discovery](const boost::system::error_code& error_code)
            {
                if (error_code)
                {
                    INDEVOLT_LOG_WARNING("Discovery deadline timer error: " << error_code.message());
                }
                if (!discovery.async_stop(nullptr))
                {
                    INDEVOLT_LOG_DEBUG("Discovery was already stopping");
                }
            });

        if (!discovery.async_start())
        {
            INDEVOLT_LOG_ERROR("Indevolt device discovery failed: could not start listening");
        }

        INDEVOLT_LOG_INFO("Discovering Indevolt devices for " << timeout.count() << " ms");
        io_context.run();

        auto devices = discovery.devices();
        INDEVOLT_LOG_INFO("Discovery finished, found " << devices.size() << " device(s)");
        return devices;
    }
    catch (const std::exception& exception)
    {
        INDEVOLT_LOG_ERROR("Indevolt device discovery failed: " << exception.what());
        return {};
    }
}

} // namespace indevolt
