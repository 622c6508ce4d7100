#pragma once

#include "d2p/core/result.hpp"
#include "d2p/network/http_types.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <string>

namespace d2p::network {

/**
 * @brief Executes one fully constructed request
 *
 * `request.url` must be absolute. An error result means no usable response
 * was received (resolve, connect, timeout, reset, malformed reply); any
 * status code the server sends comes back as a response.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> execute(const HttpRequest& request) = 0;
};

/**
 * @brief HttpClient over Boost.Asio, one connection per request
 *
 * Each call runs its own io_context on the calling thread, so concurrent
 * uploads from different threads do not share any state.
 *
 * https URLs go through OpenSSL with peer and host name verification against
 * the system trust store, plus `ca_file` when set.
 *
 * The timeout is an idle timeout: it restarts whenever a step of the
 * exchange completes (connect, handshake, each body slice written, each read),
 * so a large upload on a slow link only fails if the link stalls.
 */
class AsioHttpClient : public HttpClient {
public:
    static constexpr std::chrono::seconds kDefaultIdleTimeout{60};

    struct Options {
        std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout;
        std::string ca_file;  ///< PEM bundle trusted in addition to the system store
    };

    explicit AsioHttpClient(std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout);
    explicit AsioHttpClient(Options options);

    Result<HttpResponse> execute(const HttpRequest& request) override;

    /// Why https requests cannot be made ("" when TLS is usable)
    const std::string& tls_error() const { return tls_error_; }

private:
    Options options_;
    boost::asio::ssl::context tls_context_;
    std::string tls_error_;
};

} // namespace d2p::network
