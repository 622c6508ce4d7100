#include "d2p/network/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace d2p::network {
namespace {

std::uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

} // namespace

std::string Url::host_header() const {
    const bool ipv6 = host.find(':') != std::string::npos;
    std::string value = ipv6 ? "[" + host + "]" : host;
    if (port != default_port(scheme)) {
        value += ":" + std::to_string(port);
    }
    return value;
}

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Err<Url>("URL has no scheme: " + text);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>("Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?#", authority_start);
    std::string authority = text.substr(authority_start, path_start == std::string::npos
                                                             ? std::string::npos
                                                             : path_start - authority_start);

    // Credentials in the authority are not used; the API token is sent as a header
    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>("Malformed IPv6 host in URL: " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err<Url>("Malformed authority in URL: " + text);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return Err<Url>("URL has no host: " + text);
    }

    url.port = default_port(url.scheme);
    if (!port_text.empty()) {
        unsigned int port = 0;
        const char* end = port_text.data() + port_text.size();
        auto [ptr, ec] = std::from_chars(port_text.data(), end, port);
        if (ec != std::errc() || ptr != end || port == 0 || port > 65535) {
            return Err<Url>("Invalid port in URL: " + text);
        }
        url.port = static_cast<std::uint16_t>(port);
    }

    if (path_start == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(path_start, text.find('#', path_start) - path_start);
        if (url.target.empty() || url.target.front() != '/') {
            url.target = "/" + url.target;
        }
    }

    return Ok(std::move(url));
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string trimmed = base;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    return trimmed + path;
}

} // namespace d2p::network
