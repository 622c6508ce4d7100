#pragma once

#include "d2p/core/result.hpp"
#include "d2p/fs/file_system.hpp"
#include "d2p/network/http_client.hpp"

#include <string>

namespace d2p::upload {

struct UploadError {
    enum class Kind {
        LocalIo,    ///< The local file could not be read; nothing was sent
        Transport,  ///< No response (connect failure, timeout, reset)
        Rejected    ///< Server answered with a status other than 200
    };

    Kind kind = Kind::Transport;
    std::string message;
    int status_code = 0;   ///< Rejected only
    std::string body;      ///< Rejected only, for diagnostics

    /// Failures that reached (or tried to reach) the server
    bool is_remote() const noexcept { return kind != Kind::LocalIo; }
};

const char* to_string(UploadError::Kind kind);

using UploadResult = Result<void, UploadError>;

/**
 * @brief Single upload attempt of one file
 *
 * Implementations must not retry and must never delete the file.
 */
class Uploader {
public:
    virtual ~Uploader() = default;

    virtual UploadResult upload(const std::string& path) = 0;
};

/**
 * @brief Posts a file to the Paperless document endpoint
 *
 * POST {base_url}/api/documents/post_document/ with multipart fields
 * `document` (file bytes, filename = base name) and `title` (base name),
 * authorised by `Authorization: Token {token}`. Only HTTP 200 counts as
 * success.
 */
class DocumentUploader : public Uploader {
public:
    static constexpr const char* kEndpointPath = "/api/documents/post_document/";

    DocumentUploader(fs::FileSystem& file_system,
                     network::HttpClient& client,
                     std::string base_url,
                     std::string auth_token);

    UploadResult upload(const std::string& path) override;

    /// Assemble the request for `path` from already loaded contents
    network::HttpRequest build_request(const std::string& path,
                                       const std::vector<std::uint8_t>& content) const;

    const std::string& endpoint() const noexcept { return endpoint_; }

private:
    fs::FileSystem& file_system_;
    network::HttpClient& client_;
    std::string endpoint_;
    std::string auth_token_;
};

} // namespace d2p::upload
