#pragma once

#include <boost/beast/http/verb.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <string>

namespace indevolt
{

struct HttpRequest
{
    boost::beast::http::verb method;
    std::string host;
    unsigned short port;
    std::string target; ///< Path and query, e.g. "/rpc/Sys.GetConfig"
    std::chrono::milliseconds timeout;
};

struct HttpResponse
{
    unsigned int status = 0;
    std::string body;
};

/// "host:port" as used in URLs and the Host header, IPv6 literals in brackets: "[fe80::1]:8080"
std::string format_authority(const std::string& host, unsigned short port);

/**
 * @brief Performs one HTTP exchange.
 *
 * Implementations must be safe to call from several threads at once.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Send the request and wait for the complete response
     * @param request What to send and how long the whole exchange may take
     * @param error_code Set on failure, boost::beast::error::timeout when the deadline expired
     * @return The response, meaningless if error_code is set
     */
    virtual HttpResponse perform(const HttpRequest& request, boost::system::error_code& error_code) = 0;
};

/**
 * @brief HTTP/1.1 over a fresh TCP connection per request, using Boost.Beast.
 *
 * Every call runs on its own io_context, so concurrent calls share nothing.
 */
class BeastHttpTransport : public HttpTransport
{
public:
    HttpResponse perform(const HttpRequest& request, boost::system::error_code& error_code) override;
};

} // namespace indevolt
