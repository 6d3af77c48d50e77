#pragma once

#include <boost/system/error_code.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace indevolt
{

/// Base of the failures an RPC call reports.
class RpcError : public std::runtime_error
{
public:
    RpcError(std::string endpoint, const std::string& message) : std::runtime_error(message), _endpoint(std::move(endpoint)) {}

    /// RPC endpoint the failed call was made to, e.g. "Indevolt.GetData".
    const std::string& endpoint() const { return _endpoint; }

private:
    std::string _endpoint;
};

/// The device did not answer within the client's timeout.
class TimeoutError : public RpcError
{
public:
    explicit TimeoutError(const std::string& endpoint) : RpcError(endpoint, endpoint + " Request timed out") {}
};

/**
 * The call failed for any other reason: a transport error, a status other than 200, or a body that
 * isn't JSON. Exactly one of status_code() and cause() is set for the first two cases, neither for
 * the last.
 */
class ApiError : public RpcError
{
public:
    ApiError(const std::string& endpoint, unsigned int status_code)
        : RpcError(endpoint, endpoint + " HTTP status error: " + std::to_string(status_code)), _status_code(status_code)
    {
    }

    ApiError(const std::string& endpoint, const boost::system::error_code& cause)
        : RpcError(endpoint, endpoint + " Network error: " + cause.message()), _cause(cause)
    {
    }

    ApiError(const std::string& endpoint, const std::string& message) : RpcError(endpoint, endpoint + " " + message) {}

    const std::optional<unsigned int>& status_code() const { return _status_code; }

    const std::optional<boost::system::error_code>& cause() const { return _cause; }

private:
    std::optional<unsigned int> _status_code;
    std::optional<boost::system::error_code> _cause;
};

} // namespace indevolt
