#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <string>

namespace indevolt
{

/// Port a device serves its RPC interface on when its discovery reply does not say otherwise.
constexpr unsigned short default_device_port = 8080;

/**
 * @brief A device that answered a discovery probe.
 *
 * Immutable once constructed. Fields the reply carried besides "port" and "name" end up in
 * the metadata map with their JSON values untouched, in the order the device sent them.
 */
class DiscoveredDevice
{
public:
    using Metadata = nlohmann::ordered_json::object_t;

    explicit DiscoveredDevice(std::string host, unsigned short port = default_device_port, std::optional<std::string> name = std::nullopt,
                              Metadata metadata = {});

    /**
     * @brief Builds a device from one discovery reply.
     * @param host Textual source address of the datagram
     * @param payload Raw datagram contents
     * @return The device. A payload that is not a JSON object yields a device with only the host set.
     */
    static DiscoveredDevice from_response(const std::string& host, const std::string& payload);

    const std::string& host() const { return _host; }
    unsigned short port() const { return _port; }
    const std::optional<std::string>& name() const { return _name; }
    const Metadata& metadata() const { return _metadata; }

    /// "DiscoveredDevice(host='10.0.0.5', port=8080, name='Foo')"
    std::string to_string() const;

private:
    std::string _host;
    unsigned short _port;
    std::optional<std::string> _name;
    Metadata _metadata;
};

std::ostream& operator<<(std::ostream& stream, const DiscoveredDevice& device);

} // namespace indevolt
