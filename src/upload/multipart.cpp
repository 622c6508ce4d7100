#include "d2p/upload/multipart.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace d2p::upload {

MultipartFormBuilder::MultipartFormBuilder() : boundary_(random_boundary()) {}

MultipartFormBuilder::MultipartFormBuilder(std::string boundary) : boundary_(std::move(boundary)) {}

void MultipartFormBuilder::add_file(const std::string& field_name,
                                    const std::string& file_name,
                                    const std::vector<std::uint8_t>& content) {
    body_.reserve(body_.size() + content.size() + 512);
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + escape_quotes(field_name) +
           "\"; filename=\"" + escape_quotes(file_name) + "\"\r\n");
    append("Content-Type: application/octet-stream\r\n\r\n");
    body_.insert(body_.end(), content.begin(), content.end());
    append("\r\n");
}

void MultipartFormBuilder::add_field(const std::string& field_name, const std::string& value) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + escape_quotes(field_name) + "\"\r\n\r\n");
    append(value);
    append("\r\n");
}

std::string MultipartFormBuilder::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::vector<std::uint8_t> MultipartFormBuilder::finish() {
    append("--" + boundary_ + "--\r\n");
    return std::move(body_);
}

void MultipartFormBuilder::append(const std::string& text) {
    body_.insert(body_.end(), text.begin(), text.end());
}

std::string MultipartFormBuilder::escape_quotes(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string MultipartFormBuilder::random_boundary() {
    std::random_device device;
    std::uniform_int_distribution<int> byte(0, 255);
    std::ostringstream oss;
    for (int i = 0; i < 30; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << byte(device);
    }
    return oss.str();
}

} // namespace d2p::upload
