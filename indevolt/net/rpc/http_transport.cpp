#include "indevolt/net/rpc/http_transport.hpp"

#include "boost/asio/io_context.hpp"
#include "boost/asio/ip/tcp.hpp"
#include "boost/asio/steady_timer.hpp"
#include "indevolt/logging/indevolt_logging.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <utility>

namespace indevolt
{

namespace
{

namespace http = boost::beast::http;

// One request/response on a private io_context. run() returns once the exchange completed or failed.
class HttpExchange
{
public:
    explicit HttpExchange(const HttpRequest& request)
        : _request(request), _resolver(_io_context), _resolve_timer(_io_context), _stream(_io_context)
    {
    }

    HttpResponse run(boost::system::error_code& error_code)
    {
        _deadline = std::chrono::steady_clock::now() + _request.timeout;

        _http_request.method(_request.method);
        _http_request.target(_request.target);
        _http_request.version(11);
        _http_request.set(http::field::host, format_authority(_request.host, _request.port));
        _http_request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        _http_request.keep_alive(false);
        _http_request.prepare_payload();

        _resolve_timer.expires_at(_deadline);
        _resolve_timer.async_wait([this](const boost::system::error_code& error_code) { handle_resolve_timeout(error_code); });

        INDEVOLT_LOG_TRACE(_request.method << " http://" << format_authority(_request.host, _request.port) << _request.target);
        _resolver.async_resolve(_request.host, std::to_string(_request.port),
                                [this](const boost::system::error_code& error_code, boost::asio::ip::tcp::resolver::results_type results)
                                { handle_resolve(error_code, std::move(results)); });

        _io_context.run();

        error_code = _error_code;
        HttpResponse response;
        if (!error_code)
        {
            response.status = _http_response.result_int();
            response.body   = std::move(_http_response.body());
        }
        return response;
    }

private:
    void handle_resolve_timeout(const boost::system::error_code& error_code)
    {
        if (!error_code)
        {
            _resolve_timed_out = true;
            _resolver.cancel();
        }
    }

    void handle_resolve(const boost::system::error_code& error_code, boost::asio::ip::tcp::resolver::results_type results)
    {
        _resolve_timer.cancel();
        if (error_code)
        {
            fail(_resolve_timed_out ? boost::system::error_code(boost::beast::error::timeout) : error_code, "resolve");
            return;
        }

        _stream.expires_at(_deadline);
        _stream.async_connect(results,
                              [this](const boost::system::error_code& error_code, const boost::asio::ip::tcp::endpoint&)
                              { handle_connect(error_code); });
    }

    void handle_connect(const boost::system::error_code& error_code)
    {
        if (error_code)
        {
            fail(error_code, "connect");
            return;
        }

        http::async_write(_stream, _http_request,
                          [this](const boost::system::error_code& error_code, std::size_t) { handle_write(error_code); });
    }

    void handle_write(const boost::system::error_code& error_code)
    {
        if (error_code)
        {
            fail(error_code, "write");
            return;
        }

        http::async_read(_stream, _buffer, _http_response,
                         [this](const boost::system::error_code& error_code, std::size_t) { handle_read(error_code); });
    }

    void handle_read(const boost::system::error_code& error_code)
    {
        if (error_code)
        {
            fail(error_code, "read");
            return;
        }

        INDEVOLT_LOG_TRACE("HTTP " << _http_response.result_int() << " from " << _request.host << ": " << _http_response.body());

        boost::system::error_code shutdown_error;
        _stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, shutdown_error);
        if (shutdown_error && shutdown_error != boost::beast::errc::not_connected)
        {
            INDEVOLT_LOG_DEBUG("Shutdown of connection to " << _request.host << " failed: " << shutdown_error.message());
        }
    }

    void fail(const boost::system::error_code& error_code, const char* stage)
    {
        INDEVOLT_LOG_DEBUG("HTTP " << stage << " to " << _request.host << ":" << _request.port << " failed: " << error_code.message());
        _error_code = error_code;
    }

    const HttpRequest& _request;
    boost::asio::io_context _io_context;
    boost::asio::ip::tcp::resolver _resolver;
    boost::asio::steady_timer _resolve_timer;
    boost::beast::tcp_stream _stream;
    boost::beast::flat_buffer _buffer;
    http::request<http::empty_body> _http_request;
    http::response<http::string_body> _http_response;
    std::chrono::steady_clock::time_point _deadline;
    bool _resolve_timed_out = false;
    boost::system::error_code _error_code;
};

} // namespace

std::string format_authority(const std::string& host, unsigned short port)
{
    bool is_ipv6 = host.find(':') != std::string::npos;
    return (is_ipv6 ? "[" + host + "]" : host) + ":" + std::to_string(port);
}

HttpResponse BeastHttpTransport::perform(const HttpRequest& request, boost::system::error_code& error_code)
{
    HttpExchange exchange(request);
    return exchange.run(error_code);
}

} // namespace indevolt
