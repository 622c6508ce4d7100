#include "d2p/core/config.hpp"
#include "d2p/fs/file_system.hpp"
#include "d2p/network/http_client.hpp"
#include "d2p/pipeline/metrics.hpp"
#include "d2p/pipeline/pipeline.hpp"
#include "d2p/status/status_server.hpp"
#include "d2p/upload/document_uploader.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>

#ifndef D2P_VERSION
#define D2P_VERSION "dev"
#endif

int main() {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    spdlog::info("Starting doc2paperless Version: {}", D2P_VERSION);

    auto loaded = d2p::core::load_config_from_environment();
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error());
        return 1;
    }
    const d2p::core::Config& config = loaded.value();

    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::info("Verbose logging is enabled.");
    }

    d2p::pipeline::UploadMetrics metrics;

    d2p::status::StatusServer status_server(metrics, config.metrics_port);
    if (auto res = status_server.start(); res.is_error()) {
        spdlog::error("{}", res.error());
        return 1;
    }

    d2p::fs::LocalFileSystem file_system;
    d2p::network::AsioHttpClient http_client({config.upload_timeout, config.ca_file});
    if (!http_client.tls_error().empty()) {
        status_server.stop();
        return 1;
    }
    d2p::upload::DocumentUploader uploader(file_system, http_client, config.base_url, config.auth_token);

    d2p::pipeline::Pipeline pipeline({config, metrics, file_system, uploader});
    if (auto res = pipeline.start(); res.is_error()) {
        spdlog::error("Failed to start watching {}: {}", config.watch_directory.string(), res.error());
        status_server.stop();
        return 1;
    }

    // Block until SIGINT/SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down", signal_number);
        }
    });
    signals_context.run();

    pipeline.stop();
    status_server.stop();

    const auto totals = metrics.snapshot();
    spdlog::info("Uploaded: {}  Failed attempts: {}  Retries: {}  Abandoned: {}",
                 totals.successful_uploads, totals.failed_uploads,
                 totals.upload_retries, totals.abandoned_files);
    return 0;
}
