#include "indevolt/net/rpc/rpc_client.hpp"

#include "boost/asio/error.hpp"
#include "indevolt/logging/indevolt_logging.hpp"
#include "indevolt/net/rpc/url_encoding.hpp"

#include <boost/beast/core/error.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace indevolt
{

namespace
{

constexpr std::array<const char*, 2> second_generation_models = {"CMS-SP2000", "CMS-SF2000"};

std::vector<std::int64_t> to_integers(const std::vector<IntegerValue>& values)
{
    std::vector<std::int64_t> integers;
    integers.reserve(values.size());
    for (const auto& value : values)
    {
        integers.push_back(value.to_integer());
    }
    return integers;
}

std::string make_base_url(const std::string& host, unsigned short port)
{
    return "http://" + format_authority(host, port) + "/rpc";
}

bool is_timeout(const boost::system::error_code& error_code)
{
    return error_code == boost::beast::error::timeout || error_code == boost::asio::error::timed_out;
}

} // namespace

int device_generation(const std::string& device_type)
{
    auto match = std::find_if(second_generation_models.begin(), second_generation_models.end(),
                              [&device_type](const char* model) { return device_type == model; });
    return match != second_generation_models.end() ? 2 : 1;
}

RpcClient::RpcClient(std::string host, unsigned short port, std::chrono::milliseconds timeout, std::shared_ptr<HttpTransport> transport)
    : _host(std::move(host))
    , _port(port)
    , _timeout(timeout)
    , _base_url(make_base_url(_host, port))
    , _transport(transport ? std::move(transport) : std::make_shared<BeastHttpTransport>())
{
}

RpcClient RpcClient::from_discovered_device(const DiscoveredDevice& device, std::chrono::milliseconds timeout,
                                            std::shared_ptr<HttpTransport> transport)
{
    return RpcClient(device.host(), device.port(), timeout, std::move(transport));
}

nlohmann::json RpcClient::fetch_data(const std::vector<IntegerValue>& points) const
{
    nlohmann::json config;
    config["t"] = to_integers(points);
    return post(get_data_endpoint, config);
}

nlohmann::json RpcClient::fetch_data(const IntegerValue& point) const
{
    return fetch_data(std::vector<IntegerValue> {point});
}

nlohmann::json RpcClient::set_data(const IntegerValue& point, const std::vector<IntegerValue>& values) const
{
    nlohmann::json config;
    config["f"] = write_function_code;
    config["t"] = point.to_integer();
    config["v"] = to_integers(values);
    return post(set_data_endpoint, config);
}

nlohmann::json RpcClient::set_data(const IntegerValue& point, const IntegerValue& value) const
{
    return set_data(point, std::vector<IntegerValue> {value});
}

nlohmann::json RpcClient::get_config() const
{
    nlohmann::json data = send(boost::beast::http::verb::get, get_config_endpoint, std::string("/rpc/") + get_config_endpoint);

    if (data.is_object())
    {
        auto device = data.find("device");
        if (device != data.end() && device->is_object())
        {
            auto type = device->find("type");
            if (type != device->end())
            {
                int generation = type->is_string() ? device_generation(type->get<std::string>()) : 1;
                (*device)["generation"] = generation;
                INDEVOLT_LOG_DEBUG("Device type " << type->dump() << " is generation " << generation);
            }
        }
    }

    return data;
}

nlohmann::json RpcClient::post(const std::string& endpoint, const nlohmann::json& config) const
{
    // dump() without indentation is compact, the device rejects whitespace in the parameter
    std::string config_parameter = config.dump();
    INDEVOLT_LOG_DEBUG(endpoint << " config=" << config_parameter);
    return send(boost::beast::http::verb::post, endpoint, "/rpc/" + endpoint + "?config=" + url_encode(config_parameter));
}

nlohmann::json RpcClient::send(boost::beast::http::verb method, const std::string& endpoint, const std::string& target) const
{
    HttpRequest request {method, _host, _port, target, _timeout};

    boost::system::error_code error_code;
    HttpResponse response = _transport->perform(request, error_code);
    if (error_code)
    {
        INDEVOLT_LOG_DEBUG(endpoint << " request to " << _base_url << " failed: " << error_code.message());
        if (is_timeout(error_code))
        {
            throw TimeoutError(endpoint);
        }
        throw ApiError(endpoint, error_code);
    }

    if (response.status != 200)
    {
        INDEVOLT_LOG_DEBUG(endpoint << " request to " << _base_url << " returned status " << response.status);
        throw ApiError(endpoint, response.status);
    }

    nlohmann::json data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded())
    {
        throw ApiError(endpoint, std::string("Invalid JSON response"));
    }
    return data;
}

} // namespace indevolt
