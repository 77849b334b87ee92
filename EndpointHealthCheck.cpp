#include <chrono>
#include <cstddef>
#include <sstream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "EndpointHealthCheck.hpp"

#include "logging.hpp"

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

//=============================================================================================
HttpEndpointHealthCheck::HttpEndpointHealthCheck(EventLog&                        log,
                                                 const std::chrono::milliseconds& timeout) :
    log(log),
    timeout(timeout)
{
}

//=============================================================================================
HttpEndpointHealthCheck::~HttpEndpointHealthCheck()
{
}

//=============================================================================================
// The exchange runs asynchronously on a private io_context because tcp_stream only enforces
// its deadline on asynchronous operations
//=============================================================================================
bool HttpEndpointHealthCheck::isEndpointHealthy(const std::string& self_address,
                                                unsigned short     port)
{
    beast::error_code error;

    net::ip::address address = net::ip::make_address(self_address, error);
    if (error)
    {
        log.debug("Web server health check failed: invalid address " + self_address);
        return false;
    }

    std::ostringstream host;
    if (address.is_v6())
    {
        host << "[" << self_address << "]:" << port;
    }
    else
    {
        host << self_address << ":" << port;
    }

    net::io_context io_context;
    beast::tcp_stream stream(io_context);
    beast::flat_buffer buffer;

    http::request<http::empty_body> request(http::verb::get, "/", 11);
    request.set(http::field::host, host.str());
    request.set(http::field::user_agent, "castkeeper");

    http::response<http::string_body> response;

    bool completed = false;

    stream.expires_after(timeout);

    stream.async_connect(
        tcp::endpoint(address, port),
        [&](beast::error_code connect_error)
        {
            if (connect_error)
            {
                error = connect_error;
                return;
            }

            http::async_write(
                stream,
                request,
                [&](beast::error_code write_error, std::size_t)
                {
                    if (write_error)
                    {
                        error = write_error;
                        return;
                    }

                    http::async_read(
                        stream,
                        buffer,
                        response,
                        [&](beast::error_code read_error, std::size_t)
                        {
                            error     = read_error;
                            completed = !read_error;
                        });
                });
        });

    io_context.run();

    beast::error_code shutdown_error;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_error);

    if (!completed)
    {
        log.debug("Web server health check failed: " + error.message());
        return false;
    }

    unsigned int status = response.result_int();
    if (status < 200 || status >= 300)
    {
        std::ostringstream message;
        message << "Web server health check failed: status " << status;
        log.debug(message.str());
        return false;
    }

    return true;
}
