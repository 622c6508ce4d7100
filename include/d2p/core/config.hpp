#pragma once

#include "d2p/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace d2p::core {

/**
 * @brief Process-wide settings, read once at startup and never mutated
 */
struct Config {
    static constexpr std::chrono::milliseconds kDefaultStabilityInterval{2000};
    static constexpr int kDefaultStabilityCount = 5;
    static constexpr std::chrono::milliseconds kDefaultRetryDelay{5000};
    static constexpr std::uint16_t kDefaultMetricsPort = 2112;
    static constexpr std::chrono::milliseconds kDefaultUploadTimeout{60000};

    std::string base_url;                   ///< PAPERLESS_BASE_URL
    std::string auth_token;                 ///< PAPERLESS_AUTH_TOKEN
    std::filesystem::path watch_directory;  ///< CONSUME_FOLDER
    std::string allow_list;                 ///< FILE_CONSUME_WHITELIST, e.g. "*.pdf,*.txt"
    std::chrono::milliseconds stability_interval = kDefaultStabilityInterval;
    int stability_count = kDefaultStabilityCount;
    std::chrono::milliseconds retry_delay = kDefaultRetryDelay;
    bool verbose = false;
    std::uint16_t metrics_port = kDefaultMetricsPort;
    /// HTTP_UPLOAD_TIMEOUT_SECONDS: longest stall allowed during one upload
    std::chrono::milliseconds upload_timeout = kDefaultUploadTimeout;
    std::string ca_file;                    ///< PAPERLESS_CA_FILE, extra PEM trust anchors for https
};

/// Returns the value of a variable, or nullopt when it is not set
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

Result<Config> load_config(const EnvironmentLookup& lookup);

Result<Config> load_config_from_environment();

/**
 * @brief Parse a duration such as "2s", "500ms" or "1m30s"
 *
 * Accepts one or more <decimal><unit> groups with units ns, us, µs, ms, s, m, h.
 * A bare number without unit is rejected, and so is a total that does not
 * fit in milliseconds.
 */
std::optional<std::chrono::milliseconds> parse_duration(const std::string& text);

/// Accepts 1/t/true and 0/f/false in any letter case
std::optional<bool> parse_bool(const std::string& text);

} // namespace d2p::core
