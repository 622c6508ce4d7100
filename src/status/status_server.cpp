#include "d2p/status/status_server.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace d2p::status {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

void write_counter(std::ostringstream& out, const char* name, const char* help, std::uint64_t value) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
}

HttpResponse make_text_response(HttpStatus status, const std::string& content_type, const std::string& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", content_type);
    response.set_header("Connection", "close");
    response.set_body(body);
    return response;
}

// Strip the query string: "/metrics?x=1" routes like "/metrics"
std::string route_of(const std::string& url) {
    return url.substr(0, url.find('?'));
}

} // namespace

std::string render_prometheus(const pipeline::UploadMetrics::Snapshot& snapshot) {
    std::ostringstream out;
    write_counter(out, "successful_uploads", "Number of successful uploads", snapshot.successful_uploads);
    write_counter(out, "failed_uploads", "Number of failed uploads", snapshot.failed_uploads);
    write_counter(out, "upload_retries", "Number of upload retries", snapshot.upload_retries);
    write_counter(out, "abandoned_files", "Number of files abandoned during the stability check",
                  snapshot.abandoned_files);
    return out.str();
}

StatusServer::StatusServer(const pipeline::UploadMetrics& metrics, std::uint16_t port)
    : metrics_(metrics), port_(port) {}

StatusServer::~StatusServer() {
    stop();
}

Result<void> StatusServer::start() {
    try {
        server_ = std::make_unique<network::HttpServerAsio>(io_context_, port_);
    } catch (const boost::system::system_error& e) {
        return Err<void>("Failed to bind status server to port " + std::to_string(port_) + ": " + e.what());
    }

    port_ = server_->get_port();
    server_->set_handler([this](const HttpRequest& request) { return handle(request); });
    thread_ = std::thread([this]() { run(); });
    return Ok();
}

void StatusServer::run() {
    // A throwing handler unwinds out of run(); keep serving the remaining connections
    for (;;) {
        try {
            io_context_.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("Status server error: {}", e.what());
        }
    }
}

void StatusServer::stop() {
    if (server_) {
        server_->close();
    }
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::uint16_t StatusServer::port() const {
    return port_;
}

HttpResponse StatusServer::handle(const HttpRequest& request) const {
    HttpResponse response = dispatch(request);
    if (request.method == HttpMethod::HEAD) {
        // Same headers as GET, Content-Length included
        response.body.clear();
    }
    return response;
}

HttpResponse StatusServer::dispatch(const HttpRequest& request) const {
    const std::string route = route_of(request.url);

    if (request.method != HttpMethod::GET && request.method != HttpMethod::HEAD) {
        return make_text_response(HttpStatus::METHOD_NOT_ALLOWED, "text/plain; charset=utf-8",
                                  "Method Not Allowed\n");
    }

    if (route == "/health/liveness" || route == "/health/readiness") {
        return make_text_response(HttpStatus::OK, "text/plain; charset=utf-8", "OK");
    }

    const auto snapshot = metrics_.snapshot();

    if (route == "/metrics") {
        return make_text_response(HttpStatus::OK, "text/plain; version=0.0.4; charset=utf-8",
                                  render_prometheus(snapshot));
    }

    if (route == "/api/stats") {
        json body;
        body["successful_uploads"] = snapshot.successful_uploads;
        body["failed_uploads"] = snapshot.failed_uploads;
        body["upload_retries"] = snapshot.upload_retries;
        body["abandoned_files"] = snapshot.abandoned_files;
        return make_text_response(HttpStatus::OK, "application/json", body.dump(2));
    }

    return make_text_response(HttpStatus::NOT_FOUND, "text/plain; charset=utf-8", "Not Found\n");
}

} // namespace d2p::status
