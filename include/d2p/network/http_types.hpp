#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace d2p::network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE clashes with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

/// Case-insensitive header lookup (RFC 7230 field names); "" when absent
inline std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (::strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method) {
        if (method == "GET") return HttpMethod::GET;
        if (method == "POST") return HttpMethod::POST;
        if (method == "PUT") return HttpMethod::PUT;
        if (method == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method == "HEAD") return HttpMethod::HEAD;
        if (method == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

inline std::string version_to_string(HttpVersion version) {
    return version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
}

/**
 * @brief An HTTP request, either received by the status server or sent
 *        by the upload client
 *
 * For outgoing requests `url` is absolute ("http://host:8000/api/...");
 * for received ones it is the request target ("/metrics").
 * The body is a byte vector because uploads carry binary documents.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    /**
     * @brief Request line and header block with `target` in the request line
     *
     * `extra_headers` are written after the request's own headers and win
     * over same-named ones. Content-Length is always written from the body
     * size. The body itself is not included, so callers can send it from
     * `body` without copying.
     */
    std::string serialize_head(const std::string& target, const HttpHeaders& extra_headers = {}) const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << target << " " << version_to_string(version) << "\r\n";
        for (const auto& [name, value] : headers) {
            if (::strcasecmp(name.c_str(), "Content-Length") == 0 || !find_header(extra_headers, name).empty()) {
                continue;
            }
            oss << name << ": " << value << "\r\n";
        }
        for (const auto& [name, value] : extra_headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n\r\n";
        return oss.str();
    }
};

struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {}

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    std::vector<std::uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        const std::string head = oss.str();
        std::vector<std::uint8_t> wire(head.begin(), head.end());
        wire.insert(wire.end(), body.begin(), body.end());
        return wire;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::UNAUTHORIZED: return "Unauthorized";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }
};

} // namespace d2p::network
