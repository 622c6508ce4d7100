#include "d2p/upload/document_uploader.hpp"
#include "d2p/network/url.hpp"
#include "d2p/upload/multipart.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace d2p::upload {
namespace {

constexpr int kAcceptedStatus = 200;

UploadResult upload_error(UploadError::Kind kind, std::string message,
                          int status_code = 0, std::string body = {}) {
    UploadError error;
    error.kind = kind;
    error.message = std::move(message);
    error.status_code = status_code;
    error.body = std::move(body);
    return Err<void>(std::move(error));
}

} // namespace

const char* to_string(UploadError::Kind kind) {
    switch (kind) {
        case UploadError::Kind::LocalIo: return "local-io";
        case UploadError::Kind::Transport: return "transport";
        case UploadError::Kind::Rejected: return "rejected";
    }
    return "unknown";
}

DocumentUploader::DocumentUploader(fs::FileSystem& file_system,
                                   network::HttpClient& client,
                                   std::string base_url,
                                   std::string auth_token)
    : file_system_(file_system)
    , client_(client)
    , endpoint_(network::join_url(base_url, kEndpointPath))
    , auth_token_(std::move(auth_token)) {}

network::HttpRequest DocumentUploader::build_request(const std::string& path,
                                                     const std::vector<std::uint8_t>& content) const {
    const std::string title = std::filesystem::path(path).filename().string();

    MultipartFormBuilder form;
    form.add_file("document", title, content);
    form.add_field("title", title);

    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = endpoint_;
    request.set_header("Content-Type", form.content_type());
    request.set_header("Authorization", "Token " + auth_token_);
    request.body = form.finish();
    return request;
}

UploadResult DocumentUploader::upload(const std::string& path) {
    network::HttpRequest request;
    {
        // The raw file is only needed until it is framed into the form body
        auto content = file_system_.read_file(path);
        if (content.is_error()) {
            return upload_error(UploadError::Kind::LocalIo, content.error());
        }
        request = build_request(path, content.value());
    }
    spdlog::debug("POST {} ({} bytes) for {}", endpoint_, request.body.size(), path);

    auto response = client_.execute(request);
    if (response.is_error()) {
        return upload_error(UploadError::Kind::Transport, response.error());
    }

    const auto& reply = response.value();
    if (reply.status_code != kAcceptedStatus) {
        const std::string body = reply.body_as_string();
        spdlog::warn("Failed to upload document: Status {}, Response: {}", reply.status_code, body);
        return upload_error(UploadError::Kind::Rejected,
                            "Server answered " + std::to_string(reply.status_code),
                            reply.status_code, body);
    }

    return Ok<UploadError>();
}

} // namespace d2p::upload
