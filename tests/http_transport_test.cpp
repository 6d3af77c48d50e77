#include "indevolt/net/rpc/http_transport.hpp"

#include "boost/asio/io_context.hpp"
#include "boost/asio/ip/tcp.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <string>
#include <thread>

namespace indevolt
{

namespace
{

namespace http = boost::beast::http;
using boost::asio::ip::tcp;

// Serves exactly one connection on 127.0.0.1 from a background thread.
class LoopbackHttpServer
{
public:
    LoopbackHttpServer() : _acceptor(_io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {}

    ~LoopbackHttpServer() { join(); }

    unsigned short port() const { return _acceptor.local_endpoint().port(); }

    void respond_once(http::status status, std::string body)
    {
        _thread = std::thread(
            [this, status, body = std::move(body)]()
            {
                tcp::socket socket(_io_context);
                boost::system::error_code error_code;
                _acceptor.accept(socket, error_code);
                if (error_code)
                {
                    return;
                }

                boost::beast::flat_buffer buffer;
                http::request<http::string_body> request;
                http::read(socket, buffer, request, error_code);
                if (error_code)
                {
                    return;
                }
                received_method = request.method();
                received_target = std::string(request.target());
                received_host   = std::string(request[http::field::host]);

                http::response<http::string_body> response {status, request.version()};
                response.set(http::field::content_type, "application/json");
                response.keep_alive(false);
                response.body() = body;
                response.prepare_payload();
                http::write(socket, response, error_code);
                socket.shutdown(tcp::socket::shutdown_send, error_code);
            });
    }

    // Reads whatever arrives and never answers, until the client goes away.
    void stay_silent()
    {
        _thread = std::thread(
            [this]()
            {
                tcp::socket socket(_io_context);
                boost::system::error_code error_code;
                _acceptor.accept(socket, error_code);
                std::array<char, 1024> buffer {};
                while (!error_code)
                {
                    socket.read_some(boost::asio::buffer(buffer), error_code);
                }
            });
    }

    void join()
    {
        if (_thread.joinable())
        {
            _thread.join();
        }
    }

    http::verb received_method = http::verb::unknown;
    std::string received_target;
    std::string received_host;

private:
    boost::asio::io_context _io_context;
    tcp::acceptor _acceptor;
    std::thread _thread;
};

HttpRequest make_request(http::verb method, unsigned short port, std::string target, std::chrono::milliseconds timeout)
{
    return HttpRequest {method, "127.0.0.1", port, std::move(target), timeout};
}

} // namespace

TEST(FormatAuthorityTest, Ipv6LiteralsAreBracketed)
{
    EXPECT_EQ(format_authority("192.168.1.50", 8080), "192.168.1.50:8080");
    EXPECT_EQ(format_authority("indevolt.local", 80), "indevolt.local:80");
    EXPECT_EQ(format_authority("fe80::1", 8080), "[fe80::1]:8080");
}

TEST(BeastHttpTransportTest, PostReturnsStatusAndBody)
{
    LoopbackHttpServer server;
    server.respond_once(http::status::ok, R"({"7101":512})");

    BeastHttpTransport transport;
    boost::system::error_code error_code;
    auto response = transport.perform(
        make_request(http::verb::post, server.port(), "/rpc/Indevolt.GetData?config=%7B%22t%22%3A%5B7101%5D%7D", std::chrono::seconds(5)),
        error_code);
    server.join();

    ASSERT_FALSE(error_code) << error_code.message();
    EXPECT_EQ(response.status, 200U);
    EXPECT_EQ(response.body, R"({"7101":512})");
    EXPECT_EQ(server.received_method, http::verb::post);
    EXPECT_EQ(server.received_target, "/rpc/Indevolt.GetData?config=%7B%22t%22%3A%5B7101%5D%7D");
    EXPECT_EQ(server.received_host, "127.0.0.1:" + std::to_string(server.port()));
}

TEST(BeastHttpTransportTest, ErrorStatusIsReturnedNotReported)
{
    LoopbackHttpServer server;
    server.respond_once(http::status::internal_server_error, "boom");

    BeastHttpTransport transport;
    boost::system::error_code error_code;
    auto response = transport.perform(make_request(http::verb::get, server.port(), "/rpc/Sys.GetConfig", std::chrono::seconds(5)), error_code);
    server.join();

    ASSERT_FALSE(error_code) << error_code.message();
    EXPECT_EQ(response.status, 500U);
    EXPECT_EQ(response.body, "boom");
    EXPECT_EQ(server.received_method, http::verb::get);
    EXPECT_EQ(server.received_target, "/rpc/Sys.GetConfig");
}

TEST(BeastHttpTransportTest, SilentServerTimesOut)
{
    LoopbackHttpServer server;
    server.stay_silent();

    BeastHttpTransport transport;
    boost::system::error_code error_code;
    const auto timeout = std::chrono::milliseconds(200);
    const auto start   = std::chrono::steady_clock::now();
    transport.perform(make_request(http::verb::get, server.port(), "/rpc/Sys.GetConfig", timeout), error_code);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    server.join();

    EXPECT_EQ(error_code, boost::beast::error::timeout);
    EXPECT_GE(elapsed, timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(BeastHttpTransportTest, RefusedConnectionIsReportedAsOtherError)
{
    unsigned short closed_port = 0;
    {
        boost::asio::io_context io_context;
        tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        closed_port = acceptor.local_endpoint().port();
    }

    BeastHttpTransport transport;
    boost::system::error_code error_code;
    transport.perform(make_request(http::verb::get, closed_port, "/rpc/Sys.GetConfig", std::chrono::seconds(5)), error_code);

    EXPECT_TRUE(error_code);
    EXPECT_NE(error_code, boost::beast::error::timeout);
}

} // namespace indevolt
