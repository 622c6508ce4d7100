#pragma once

#include "d2p/core/result.hpp"

#include <cstdint>
#include <string>

namespace d2p::network {

/**
 * @brief Components of an absolute http(s) URL
 */
struct Url {
    std::string scheme;   ///< "http" or "https", lower-case
    std::string host;     ///< Host name or address, IPv6 without brackets
    std::uint16_t port = 0;
    std::string target;   ///< Path plus query, always starting with '/'

    /// Value for the Host header: port omitted when it is the scheme default
    std::string host_header() const;
};

Result<Url> parse_url(const std::string& text);

/// `base` with trailing slashes removed, followed by `path`
std::string join_url(const std::string& base, const std::string& path);

} // namespace d2p::network
