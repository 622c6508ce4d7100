#include "d2p/network/http_client.hpp"
#include "d2p/network/http_parser.hpp"
#include "d2p/network/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace d2p::network {
namespace {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;

constexpr std::size_t kWriteSlice = 64 * 1024;

/**
 * @brief State of one request/response exchange
 *
 * Async chain: resolve -> connect -> [TLS handshake] -> write head ->
 * write body slices -> read (repeated until the parser reports a complete
 * response or the peer closes).
 * Every handler runs on the exchange's private io_context. The idle timer is
 * re-armed after each completed step.
 */
class ClientExchange {
public:
    ClientExchange(asio::io_context& io_context, ssl::context& tls_context, Url url, std::string head,
                   const std::vector<std::uint8_t>& body, std::chrono::milliseconds idle_timeout)
        : resolver_(io_context)
        , stream_(io_context, tls_context)
        , timer_(io_context)
        , url_(std::move(url))
        , tls_(url_.scheme == "https")
        , head_(std::move(head))
        , body_(body)
        , idle_timeout_(idle_timeout)
        , parser_(HttpMessageKind::Response) {}

    void start() {
        arm_timer();
        do_resolve();
    }

    bool finished() const { return outcome_.has_value(); }

    Result<HttpResponse> take_outcome() { return std::move(*outcome_); }

private:
    tcp::socket& socket() { return stream_.next_layer(); }

    template <typename Operation>
    void with_stream(Operation&& operation) {
        if (tls_) {
            operation(stream_);
        } else {
            operation(socket());
        }
    }

    void arm_timer() {
        timer_.expires_after(idle_timeout_);
        timer_.async_wait([this](boost::system::error_code ec) {
            if (ec == asio::error::operation_aborted || finished()) {
                return;
            }
            // Completed just before a re-arm: the new wait is still pending
            if (timer_.expiry() > std::chrono::steady_clock::now()) {
                return;
            }
            fail("Request to " + url_.host_header() + " timed out: no progress for " +
                 std::to_string(idle_timeout_.count()) + "ms");
        });
    }

    void do_resolve() {
        resolver_.async_resolve(url_.host, std::to_string(url_.port),
            [this](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    fail("Failed to resolve " + url_.host + ": " + ec.message());
                    return;
                }
                do_connect(endpoints);
            });
    }

    void do_connect(const tcp::resolver::results_type& endpoints) {
        arm_timer();
        asio::async_connect(socket(), endpoints,
            [this](boost::system::error_code ec, const tcp::endpoint& endpoint) {
                if (ec) {
                    fail("Failed to connect to " + url_.host + ":" + std::to_string(url_.port) + ": " + ec.message());
                    return;
                }
                spdlog::debug("Connected to {}:{}", endpoint.address().to_string(), endpoint.port());
                if (tls_) {
                    do_handshake();
                } else {
                    do_write_head();
                }
            });
    }

    void do_handshake() {
        arm_timer();

        boost::system::error_code ec;
        asio::ip::make_address(url_.host, ec);
        if (ec && !SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
            fail("Failed to set TLS server name for " + url_.host);
            return;
        }
        stream_.set_verify_mode(ssl::verify_peer, ec);
        if (!ec) {
            stream_.set_verify_callback(ssl::host_name_verification(url_.host), ec);
        }
        if (ec) {
            fail("Failed to configure TLS for " + url_.host + ": " + ec.message());
            return;
        }

        stream_.async_handshake(ssl::stream_base::client, [this](boost::system::error_code ec) {
            if (ec) {
                fail("TLS handshake with " + url_.host + " failed: " + ec.message());
                return;
            }
            do_write_head();
        });
    }

    void do_write_head() {
        arm_timer();
        with_stream([this](auto& stream) {
            asio::async_write(stream, asio::buffer(head_),
                [this](boost::system::error_code ec, std::size_t) {
                    if (ec) {
                        fail("Failed to send request: " + ec.message());
                        return;
                    }
                    do_write_body();
                });
        });
    }

    void do_write_body() {
        if (body_offset_ == body_.size()) {
            spdlog::debug("Sent {} body bytes to {}", body_.size(), url_.host);
            do_read();
            return;
        }

        arm_timer();
        const std::size_t slice = std::min(kWriteSlice, body_.size() - body_offset_);
        with_stream([this, slice](auto& stream) {
            asio::async_write(stream, asio::buffer(body_.data() + body_offset_, slice),
                [this](boost::system::error_code ec, std::size_t bytes_transferred) {
                    if (ec) {
                        fail("Failed to send request: " + ec.message());
                        return;
                    }
                    body_offset_ += bytes_transferred;
                    do_write_body();
                });
        });
    }

    void do_read() {
        arm_timer();
        with_stream([this](auto& stream) {
            stream.async_read_some(asio::buffer(buffer_),
                [this](boost::system::error_code ec, std::size_t bytes_transferred) {
                    on_read(ec, bytes_transferred);
                });
        });
    }

    void on_read(boost::system::error_code ec, std::size_t bytes_transferred) {
        // Servers commonly drop TLS connections without close_notify
        if (ec == asio::error::eof || ec == ssl::error::stream_truncated) {
            auto done = parser_.finish();
            if (done.is_error()) {
                fail("Failed to read response: " + done.error());
                return;
            }
            succeed();
            return;
        }
        if (ec) {
            fail("Failed to read response: " + ec.message());
            return;
        }

        auto parsed = parser_.parse(buffer_.data(), bytes_transferred);
        if (parsed.is_error()) {
            fail("Malformed response: " + parsed.error());
            return;
        }
        if (parsed.value()) {
            succeed();
            return;
        }
        do_read();
    }

    void close() {
        boost::system::error_code ignored;
        resolver_.cancel();
        timer_.cancel();
        socket().shutdown(tcp::socket::shutdown_both, ignored);
        socket().close(ignored);
    }

    void succeed() {
        if (finished()) {
            return;
        }
        outcome_.emplace(Ok(parser_.get_response()));
        close();
    }

    void fail(std::string message) {
        if (finished()) {
            return;
        }
        outcome_.emplace(Err<HttpResponse>(std::move(message)));
        close();
    }

    tcp::resolver resolver_;
    ssl::stream<tcp::socket> stream_;
    asio::steady_timer timer_;
    Url url_;
    bool tls_;
    std::string head_;
    const std::vector<std::uint8_t>& body_;
    std::size_t body_offset_ = 0;
    std::chrono::milliseconds idle_timeout_;
    HttpParser parser_;
    std::array<char, 8192> buffer_{};
    std::optional<Result<HttpResponse>> outcome_;
};

} // namespace

AsioHttpClient::AsioHttpClient(std::chrono::milliseconds idle_timeout)
    : AsioHttpClient(Options{idle_timeout, {}}) {}

AsioHttpClient::AsioHttpClient(Options options)
    : options_(std::move(options))
    , tls_context_(ssl::context::tls_client) {
    boost::system::error_code ec;
    tls_context_.set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("Could not load the system CA store: {}", ec.message());
    }
    if (!options_.ca_file.empty()) {
        tls_context_.load_verify_file(options_.ca_file, ec);
        if (ec) {
            tls_error_ = "Failed to load CA file " + options_.ca_file + ": " + ec.message();
            spdlog::error(tls_error_);
        }
    }
}

Result<HttpResponse> AsioHttpClient::execute(const HttpRequest& request) {
    auto url = parse_url(request.url);
    if (url.is_error()) {
        return Err<HttpResponse>(url.error());
    }
    if (url.value().scheme == "https" && !tls_error_.empty()) {
        return Err<HttpResponse>(tls_error_);
    }

    HttpHeaders transport_headers{
        {"Host", url.value().host_header()},
        {"Connection", "close"},
    };
    if (!request.has_header("User-Agent")) {
        transport_headers.emplace("User-Agent", "doc2paperless");
    }
    std::string head = request.serialize_head(url.value().target, transport_headers);

    asio::io_context io_context;
    ClientExchange exchange(io_context, tls_context_, url.value(), std::move(head), request.body,
                            options_.idle_timeout);
    try {
        exchange.start();
        io_context.run();
    } catch (const std::exception& e) {
        // Pending handlers are destroyed with the io_context without running
        return Err<HttpResponse>("Request to " + request.url + " failed: " + e.what());
    }
    if (!exchange.finished()) {
        return Err<HttpResponse>("Request to " + request.url + " ended without a response");
    }
    return exchange.take_outcome();
}

} // namespace d2p::network
