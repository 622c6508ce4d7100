#include "d2p/core/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <vector>

namespace d2p::core {
namespace {

constexpr const char* kBaseUrlVar = "PAPERLESS_BASE_URL";
constexpr const char* kAuthTokenVar = "PAPERLESS_AUTH_TOKEN";
constexpr const char* kWatchDirectoryVar = "CONSUME_FOLDER";
constexpr const char* kAllowListVar = "FILE_CONSUME_WHITELIST";
constexpr const char* kStabilityIntervalVar = "FILE_STABILITY_CHECK_INTERVAL_SECONDS";
constexpr const char* kStabilityCountVar = "FILE_STABILITY_CHECK_COUNT";
constexpr const char* kRetryDelayVar = "HTTP_UPLOAD_RETRY_DELAY_SECONDS";
constexpr const char* kVerboseVar = "VERBOSE";
constexpr const char* kMetricsPortVar = "METRICS_PORT";
constexpr const char* kUploadTimeoutVar = "HTTP_UPLOAD_TIMEOUT_SECONDS";
constexpr const char* kCaFileVar = "PAPERLESS_CA_FILE";

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<double> unit_to_nanoseconds(const std::string& unit) {
    if (unit == "ns") return 1.0;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1e3;
    if (unit == "ms") return 1e6;
    if (unit == "s") return 1e9;
    if (unit == "m") return 60e9;
    if (unit == "h") return 3600e9;
    return std::nullopt;
}

std::chrono::milliseconds duration_or_default(const std::optional<std::string>& raw,
                                              const char* name,
                                              std::chrono::milliseconds fallback) {
    if (!raw || raw->empty()) {
        return fallback;
    }
    auto parsed = parse_duration(*raw);
    if (!parsed) {
        spdlog::warn("{}='{}' is not a valid duration, using {}ms", name, *raw, fallback.count());
        return fallback;
    }
    return *parsed;
}

// Reads the leading integer of the value, ignoring whatever trails it
int count_or_default(const std::optional<std::string>& raw, int fallback) {
    if (!raw || raw->empty()) {
        return fallback;
    }
    const char* begin = raw->data();
    const char* end = begin + raw->size();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr == begin || value < 1) {
        spdlog::warn("{}='{}' is not a positive count, using {}", kStabilityCountVar, *raw, fallback);
        return fallback;
    }
    return value;
}

std::uint16_t port_or_default(const std::optional<std::string>& raw, std::uint16_t fallback) {
    if (!raw || raw->empty()) {
        return fallback;
    }
    unsigned int value = 0;
    const char* end = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(raw->data(), end, value);
    if (ec != std::errc() || ptr != end || value == 0 || value > 65535) {
        spdlog::warn("{}='{}' is not a valid port, using {}", kMetricsPortVar, *raw, fallback);
        return fallback;
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

std::optional<std::chrono::milliseconds> parse_duration(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text == "0") {
        return std::chrono::milliseconds{0};
    }

    double total_ns = 0.0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t number_start = pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            ++pos;
        }
        if (pos == number_start) {
            return std::nullopt;
        }
        const std::string number = text.substr(number_start, pos - number_start);
        if (number == "." || std::count(number.begin(), number.end(), '.') > 1) {
            return std::nullopt;
        }

        const std::size_t unit_start = pos;
        while (pos < text.size() && !std::isdigit(static_cast<unsigned char>(text[pos])) && text[pos] != '.') {
            ++pos;
        }
        auto scale = unit_to_nanoseconds(text.substr(unit_start, pos - unit_start));
        if (!scale) {
            return std::nullopt;
        }
        total_ns += std::strtod(number.c_str(), nullptr) * *scale;
    }

    const double total_ms = total_ns / 1e6;
    // 2^63 is exactly representable, so this rejects everything that does not fit
    if (!std::isfinite(total_ms) ||
        total_ms >= static_cast<double>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(total_ms)};
}

std::optional<bool> parse_bool(const std::string& text) {
    const std::string lowered = to_lower(text);
    if (lowered == "1" || lowered == "t" || lowered == "true") {
        return true;
    }
    if (lowered == "0" || lowered == "f" || lowered == "false") {
        return false;
    }
    return std::nullopt;
}

Result<Config> load_config(const EnvironmentLookup& lookup) {
    Config config;
    std::vector<std::string> missing;

    auto required = [&](const char* name, std::string& target) {
        auto value = lookup(name);
        if (!value || value->empty()) {
            missing.emplace_back(name);
            return;
        }
        target = *value;
    };

    required(kBaseUrlVar, config.base_url);
    required(kAuthTokenVar, config.auth_token);

    std::string directory;
    required(kWatchDirectoryVar, directory);
    config.watch_directory = directory;

    if (!missing.empty()) {
        std::string message = "Missing required environment variables:";
        for (const auto& name : missing) {
            message += " " + name;
        }
        if (std::find(missing.begin(), missing.end(), kAuthTokenVar) != missing.end()) {
            message += " (only API tokens are supported, not Base64(user:pass))";
        }
        return Err<Config>(message);
    }

    config.allow_list = lookup(kAllowListVar).value_or("");
    config.stability_interval = duration_or_default(lookup(kStabilityIntervalVar), kStabilityIntervalVar,
                                                    Config::kDefaultStabilityInterval);
    config.stability_count = count_or_default(lookup(kStabilityCountVar), Config::kDefaultStabilityCount);
    config.retry_delay = duration_or_default(lookup(kRetryDelayVar), kRetryDelayVar,
                                             Config::kDefaultRetryDelay);
    config.metrics_port = port_or_default(lookup(kMetricsPortVar), Config::kDefaultMetricsPort);
    config.upload_timeout = duration_or_default(lookup(kUploadTimeoutVar), kUploadTimeoutVar,
                                                Config::kDefaultUploadTimeout);
    if (config.upload_timeout.count() == 0) {
        spdlog::warn("{} must be positive, using {}ms", kUploadTimeoutVar, Config::kDefaultUploadTimeout.count());
        config.upload_timeout = Config::kDefaultUploadTimeout;
    }
    config.ca_file = lookup(kCaFileVar).value_or("");

    if (auto verbose = lookup(kVerboseVar); verbose && !verbose->empty()) {
        config.verbose = parse_bool(*verbose).value_or(false);
    }

    return Ok(std::move(config));
}

Result<Config> load_config_from_environment() {
    return load_config([](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

} // namespace d2p::core
