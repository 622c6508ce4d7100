#pragma once

#include "d2p/network/http_parser.hpp"
#include "d2p/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace d2p::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection: read a request, answer it, close
 *
 * Kept alive by the shared_ptr captured in its pending async handlers.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    /// Status requests carry no meaningful body
    static constexpr std::size_t kMaxRequestBody = 64 * 1024;

    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    static HttpResponse make_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 4096> buffer_{};
};

/**
 * @brief Small event-driven HTTP server on Boost.Asio
 *
 * Accepts connections on `port` and hands every parsed request to the
 * handler. Runs on whatever thread(s) call io_context.run().
 *
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 2112);
 * server.set_handler([](const HttpRequest&) { return HttpResponse(HttpStatus::OK); });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /// Binds immediately; throws boost::system::system_error if the port is taken
    HttpServerAsio(asio::io_context& io_context, std::uint16_t port);

    void set_handler(HttpRequestHandler handler);

    /// Actual bound port (useful when constructed with port 0)
    std::uint16_t get_port() const { return acceptor_.local_endpoint().port(); }

    void close();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
};

} // namespace d2p::network
