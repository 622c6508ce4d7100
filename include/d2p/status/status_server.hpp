#pragma once

#include "d2p/core/result.hpp"
#include "d2p/network/http_server_asio.hpp"
#include "d2p/network/http_types.hpp"
#include "d2p/pipeline/metrics.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace d2p::status {

/**
 * @brief Prometheus text exposition (format 0.0.4) of the upload counters
 */
std::string render_prometheus(const pipeline::UploadMetrics::Snapshot& snapshot);

/**
 * @brief Metrics and health endpoints
 *
 * GET /metrics           Prometheus counters
 * GET /health/liveness   always 200 "OK"
 * GET /health/readiness  always 200 "OK" (does not reflect upload health)
 * GET /api/stats         counters as JSON
 *
 * HEAD is answered like GET without the body.
 * The server runs its own io_context on a background thread.
 */
class StatusServer {
public:
    StatusServer(const pipeline::UploadMetrics& metrics, std::uint16_t port);
    ~StatusServer();

    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

    /// Bind and start serving; fails if the port cannot be bound
    Result<void> start();

    void stop();

    /// Route one request; no I/O
    network::HttpResponse handle(const network::HttpRequest& request) const;

    /// Bound port once started (resolves port 0), the configured one before
    std::uint16_t port() const;

private:
    void run();

    network::HttpResponse dispatch(const network::HttpRequest& request) const;

    const pipeline::UploadMetrics& metrics_;
    std::uint16_t port_;
    network::asio::io_context io_context_;
    std::unique_ptr<network::HttpServerAsio> server_;
    std::thread thread_;
};

} // namespace d2p::status
