#include "indevolt/net/discovery/discovered_device.hpp"

#include "indevolt/logging/indevolt_logging.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <utility>

namespace indevolt
{

namespace
{

constexpr const char* port_key = "port";
constexpr const char* name_key = "name";

std::optional<unsigned short> port_from_json(const nlohmann::ordered_json& value)
{
    constexpr auto max_port = std::numeric_limits<unsigned short>::max();

    if (value.is_number_unsigned())
    {
        auto port = value.get<std::uint64_t>();
        if (port <= max_port)
        {
            return static_cast<unsigned short>(port);
        }
    }
    else if (value.is_number_integer())
    {
        auto port = value.get<std::int64_t>();
        if (port >= 0 && port <= max_port)
        {
            return static_cast<unsigned short>(port);
        }
    }
    else if (value.is_string())
    {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty() || text.size() > 5)
        {
            return std::nullopt;
        }
        unsigned long port = 0;
        for (char character : text)
        {
            if (std::isdigit(static_cast<unsigned char>(character)) == 0)
            {
                return std::nullopt;
            }
            port = port * 10 + static_cast<unsigned long>(character - '0');
        }
        if (port <= max_port)
        {
            return static_cast<unsigned short>(port);
        }
    }

    return std::nullopt;
}

} // namespace

DiscoveredDevice::DiscoveredDevice(std::string host, unsigned short port, std::optional<std::string> name, Metadata metadata)
    : _host(std::move(host)), _port(port), _name(std::move(name)), _metadata(std::move(metadata))
{
}

DiscoveredDevice DiscoveredDevice::from_response(const std::string& host, const std::string& payload)
{
    // parse() rejects malformed UTF-8 as well as malformed JSON
    nlohmann::ordered_json response = nlohmann::ordered_json::parse(payload, nullptr, false);
    if (response.is_discarded() || !response.is_object())
    {
        INDEVOLT_LOG_DEBUG("Reply from " << host << " is not a JSON object, keeping address only");
        return DiscoveredDevice(host);
    }

    unsigned short port = default_device_port;
    std::optional<std::string> name;
    Metadata metadata;

    for (auto item = response.begin(); item != response.end(); ++item)
    {
        const std::string& key = item.key();
        nlohmann::ordered_json& value = item.value();
        if (key == port_key)
        {
            auto parsed_port = port_from_json(value);
            if (parsed_port)
            {
                port = *parsed_port;
            }
            else
            {
                INDEVOLT_LOG_WARNING("Ignoring invalid port " << value.dump() << " from " << host);
            }
        }
        else if (key == name_key)
        {
            if (value.is_string())
            {
                name = value.get<std::string>();
            }
            else if (!value.is_null())
            {
                name = value.dump();
            }
        }
        else
        {
            metadata.emplace(key, std::move(value));
        }
    }

    return DiscoveredDevice(host, port, std::move(name), std::move(metadata));
}

std::string DiscoveredDevice::to_string() const
{
    std::string result = "DiscoveredDevice(host='" + _host + "', port=" + std::to_string(_port) + ", name=";
    result += _name ? "'" + *_name + "'" : std::string("None");
    result += ")";
    return result;
}

std::ostream& operator<<(std::ostream& stream, const DiscoveredDevice& device)
{
    return stream << device.to_string();
}

} // namespace indevolt
