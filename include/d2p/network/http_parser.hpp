#pragma once

#include "d2p/core/result.hpp"
#include "d2p/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <string>

namespace d2p::network {

enum class HttpMessageKind {
    Request,   // parsed by the status server
    Response   // parsed by the upload client
};

/**
 * @brief Parser states
 *
 * HTTP/1.x message layout:
 * START-LINE CRLF            <- request line or status line
 * Header-Name: value CRLF    <- zero or more
 * CRLF
 * [body]                     <- Content-Length bytes, chunked, or until close
 */
enum class ParseState {
    START_LINE,
    HEADER_LINE,
    BODY_FIXED,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    BODY_UNTIL_CLOSE,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x parser for requests and responses
 *
 * Data may be fed in arbitrary pieces as it arrives from the socket:
 * ```cpp
 * HttpParser parser(HttpMessageKind::Response);
 * auto done = parser.parse(buffer.data(), bytes_read);
 * if (done.is_ok() && done.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * // peer closed the connection:
 * auto done_at_eof = parser.finish();
 * ```
 * A response without Content-Length or chunked encoding is delimited by the
 * connection closing, so finish() completes it.
 *
 * Bodies larger than `max_body_length` are rejected as malformed, whichever
 * way their length is announced.
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxLineLength = 16 * 1024;
    static constexpr std::size_t kDefaultMaxBodyLength = 16 * 1024 * 1024;

    explicit HttpParser(HttpMessageKind kind = HttpMessageKind::Request,
                        std::size_t max_body_length = kDefaultMaxBodyLength)
        : kind_(kind), max_body_length_(max_body_length) {
        reset();
    }

    std::size_t max_body_length() const { return max_body_length_; }

    /**
     * @brief Consume bytes
     *
     * RETURNS: true when a full message has been parsed, false if more data is
     *          needed, error on malformed input
     */
    Result<bool> parse(const char* data, std::size_t len) {
        for (std::size_t i = 0; i < len; ++i) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>(error_);
            }
            if (!consume(data[i])) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(error_);
            }
        }
        if (state_ == ParseState::PARSE_ERROR) {
            return Err<bool>(error_);
        }
        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     */
    Result<bool> finish() {
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            state_ = ParseState::COMPLETE;
        }
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        return Err<bool>(std::string("Connection closed before the message was complete"));
    }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    ParseState state() const { return state_; }

    HttpRequest get_request() const { return request_; }

    HttpResponse get_response() const { return response_; }

    void reset() {
        state_ = ParseState::START_LINE;
        request_ = HttpRequest();
        response_ = HttpResponse();
        line_.clear();
        error_.clear();
        remaining_ = 0;
        line_number_ = 1;
    }

private:
    static constexpr std::size_t kReserveLimit = 64 * 1024;

    HttpMessageKind kind_;
    std::size_t max_body_length_;
    ParseState state_ = ParseState::START_LINE;
    HttpRequest request_;
    HttpResponse response_;
    std::string line_;          // Current start/header/chunk-size line
    std::string error_;
    std::size_t remaining_ = 0; // Body or chunk bytes still expected
    std::size_t line_number_ = 1;

    HttpHeaders& headers() {
        return kind_ == HttpMessageKind::Request ? request_.headers : response_.headers;
    }

    std::vector<std::uint8_t>& body() {
        return kind_ == HttpMessageKind::Request ? request_.body : response_.body;
    }

    bool fail(const std::string& message) {
        error_ = message + " at line " + std::to_string(line_number_);
        return false;
    }

    // Collect one CRLF-terminated line into `line_`; false only on overflow
    bool take_line(char c, bool& complete) {
        complete = false;
        if (c == '\n') {
            if (!line_.empty() && line_.back() == '\r') {
                line_.pop_back();
            }
            ++line_number_;
            complete = true;
            return true;
        }
        if (line_.size() >= kMaxLineLength) {
            return fail("Line too long");
        }
        line_ += c;
        return true;
    }

    bool consume(char c) {
        bool line_done = false;
        switch (state_) {
            case ParseState::START_LINE:
                if (!take_line(c, line_done)) return false;
                if (line_done) {
                    if (line_.empty()) {
                        return true;  // tolerate leading CRLF between messages
                    }
                    bool ok = kind_ == HttpMessageKind::Request ? parse_request_line() : parse_status_line();
                    line_.clear();
                    if (!ok) return false;
                    state_ = ParseState::HEADER_LINE;
                }
                return true;

            case ParseState::HEADER_LINE:
                if (!take_line(c, line_done)) return false;
                if (line_done) {
                    if (line_.empty()) {
                        return begin_body();
                    }
                    bool ok = parse_header_line();
                    line_.clear();
                    return ok;
                }
                return true;

            case ParseState::BODY_FIXED:
                body().push_back(static_cast<std::uint8_t>(c));
                if (--remaining_ == 0) {
                    state_ = ParseState::COMPLETE;
                }
                return true;

            case ParseState::CHUNK_SIZE:
                if (!take_line(c, line_done)) return false;
                if (line_done) {
                    return parse_chunk_size();
                }
                return true;

            case ParseState::CHUNK_DATA:
                body().push_back(static_cast<std::uint8_t>(c));
                if (--remaining_ == 0) {
                    state_ = ParseState::CHUNK_DATA_END;
                }
                return true;

            case ParseState::CHUNK_DATA_END:
                if (!take_line(c, line_done)) return false;
                if (line_done) {
                    if (!line_.empty()) {
                        return fail("Missing CRLF after chunk data");
                    }
                    state_ = ParseState::CHUNK_SIZE;
                }
                return true;

            case ParseState::CHUNK_TRAILER:
                if (!take_line(c, line_done)) return false;
                if (line_done) {
                    if (line_.empty()) {
                        state_ = ParseState::COMPLETE;
                    }
                    line_.clear();  // trailer fields are ignored
                }
                return true;

            case ParseState::BODY_UNTIL_CLOSE:
                if (body().size() >= max_body_length_) {
                    return fail("Body too large");
                }
                body().push_back(static_cast<std::uint8_t>(c));
                return true;

            case ParseState::COMPLETE:
                return true;

            case ParseState::PARSE_ERROR:
                return false;
        }
        return false;
    }

    static bool parse_version(const std::string& token, HttpVersion& version) {
        if (token == "HTTP/1.1") {
            version = HttpVersion::HTTP_1_1;
            return true;
        }
        if (token == "HTTP/1.0") {
            version = HttpVersion::HTTP_1_0;
            return true;
        }
        return false;
    }

    // METHOD SP request-target SP HTTP-version
    bool parse_request_line() {
        const auto first = line_.find(' ');
        const auto second = first == std::string::npos ? std::string::npos : line_.find(' ', first + 1);
        if (first == std::string::npos || second == std::string::npos || second == first + 1) {
            return fail("Malformed request line");
        }

        request_.method = HttpMethodUtils::from_string(line_.substr(0, first));
        if (request_.method == HttpMethod::UNKNOWN) {
            return fail("Unknown HTTP method");
        }
        request_.url = line_.substr(first + 1, second - first - 1);
        if (!parse_version(line_.substr(second + 1), request_.version)) {
            return fail("Unsupported HTTP version");
        }
        return true;
    }

    // HTTP-version SP status-code SP [reason-phrase]
    bool parse_status_line() {
        const auto first = line_.find(' ');
        if (first == std::string::npos || !parse_version(line_.substr(0, first), response_.version)) {
            return fail("Malformed status line");
        }

        const std::string code = line_.substr(first + 1, 3);
        if (code.size() != 3 || !std::isdigit(static_cast<unsigned char>(code[0])) ||
            !std::isdigit(static_cast<unsigned char>(code[1])) ||
            !std::isdigit(static_cast<unsigned char>(code[2]))) {
            return fail("Malformed status code");
        }
        response_.status_code = std::atoi(code.c_str());
        if (line_.size() > first + 5) {
            response_.reason_phrase = line_.substr(first + 5);
        }
        return true;
    }

    bool parse_header_line() {
        const auto colon = line_.find(':');
        if (colon == std::string::npos || colon == 0) {
            return fail("Malformed header");
        }
        std::string name = line_.substr(0, colon);
        for (char ch : name) {
            if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '-' && ch != '_') {
                return fail("Invalid header name");
            }
        }

        std::string value = line_.substr(colon + 1);
        const auto start = value.find_first_not_of(" \t");
        const auto end = value.find_last_not_of(" \t");
        value = start == std::string::npos ? std::string() : value.substr(start, end - start + 1);

        headers()[name] = value;
        return true;
    }

    bool begin_body() {
        line_.clear();

        const std::string transfer_encoding = find_header(headers(), "Transfer-Encoding");
        if (!transfer_encoding.empty() && ::strcasecmp(transfer_encoding.c_str(), "identity") != 0) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = find_header(headers(), "Content-Length");
        if (!content_length.empty()) {
            char* end = nullptr;
            errno = 0;
            const unsigned long long length = std::strtoull(content_length.c_str(), &end, 10);
            if (end == content_length.c_str() || *end != '\0' || content_length.front() == '-') {
                return fail("Invalid Content-Length");
            }
            if (errno == ERANGE || length > max_body_length_) {
                return fail("Content-Length too large");
            }
            remaining_ = static_cast<std::size_t>(length);
            if (remaining_ == 0) {
                state_ = ParseState::COMPLETE;
            } else {
                // Grow with the data actually received beyond the first 64K
                body().reserve(std::min(remaining_, kReserveLimit));
                state_ = ParseState::BODY_FIXED;
            }
            return true;
        }

        if (kind_ == HttpMessageKind::Request || response_has_no_body()) {
            state_ = ParseState::COMPLETE;
        } else {
            state_ = ParseState::BODY_UNTIL_CLOSE;
        }
        return true;
    }

    bool response_has_no_body() const {
        const int code = response_.status_code;
        return (code >= 100 && code < 200) || code == 204 || code == 304;
    }

    bool parse_chunk_size() {
        // chunk-size [; extensions]
        const std::string size_text = line_.substr(0, line_.find(';'));
        line_.clear();

        char* end = nullptr;
        errno = 0;
        const unsigned long long size = std::strtoull(size_text.c_str(), &end, 16);
        if (size_text.empty() || end == size_text.c_str() || size_text.front() == '-') {
            return fail("Invalid chunk size");
        }
        if (errno == ERANGE || size > max_body_length_ - body().size()) {
            return fail("Chunked body too large");
        }

        remaining_ = static_cast<std::size_t>(size);
        state_ = remaining_ == 0 ? ParseState::CHUNK_TRAILER : ParseState::CHUNK_DATA;
        return true;
    }
};

} // namespace d2p::network
