#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace d2p::upload {

/**
 * @brief Builds a multipart/form-data request body (RFC 7578)
 *
 * Parts are written in the order they are added; finish() appends the
 * closing delimiter and returns the body.
 */
class MultipartFormBuilder {
public:
    /// Random 60-character hexadecimal boundary
    MultipartFormBuilder();
    explicit MultipartFormBuilder(std::string boundary);

    void add_file(const std::string& field_name,
                  const std::string& file_name,
                  const std::vector<std::uint8_t>& content);

    void add_field(const std::string& field_name, const std::string& value);

    /// Value for the Content-Type header
    std::string content_type() const;

    std::vector<std::uint8_t> finish();

    const std::string& boundary() const noexcept { return boundary_; }

private:
    void append(const std::string& text);
    static std::string escape_quotes(const std::string& text);
    static std::string random_boundary();

    std::string boundary_;
    std::vector<std::uint8_t> body_;
};

} // namespace d2p::upload
