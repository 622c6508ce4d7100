#include "d2p/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace d2p::network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(HttpMessageKind::Request, kMaxRequestBody) {}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Status connection read error: {}", ec.message());
                }
                return;
            }

            auto parsed = parser_.parse(buffer_.data(), bytes_transferred);
            if (parsed.is_error()) {
                handle_error("Parse error: " + parsed.error());
                return;
            }
            if (!parsed.value()) {
                do_read();
                return;
            }

            const HttpRequest request = parser_.get_request();
            spdlog::debug("{} {}", HttpMethodUtils::to_string(request.method), request.url);

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Status handler threw: {}", e.what());
                response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
            }
            do_write(response);
        });
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    // Owned by the handler so the bytes outlive the async write
    auto data = std::make_shared<std::vector<std::uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, std::size_t) {
            if (ec && ec != asio::error::operation_aborted) {
                spdlog::debug("Status connection write error: {}", ec.message());
                return;
            }
            boost::system::error_code ignored;
            socket_.shutdown(tcp::socket::shutdown_both, ignored);
        });
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Status connection error: {}", message);
    do_write(make_error_response(HttpStatus::BAD_REQUEST, message));
}

HttpResponse HttpConnection::make_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    response.set_header("Connection", "close");
    response.set_body(message + "\n");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, std::uint16_t port)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port)) {
    spdlog::info("Status server listening on port {}", get_port());
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::close() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("Status server accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace d2p::network
