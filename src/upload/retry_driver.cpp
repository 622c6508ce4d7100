#include "d2p/upload/retry_driver.hpp"

#include <spdlog/spdlog.h>

namespace d2p::upload {

RetryDriver::RetryDriver(Uploader& uploader,
                         fs::FileSystem& file_system,
                         pipeline::UploadMetrics& metrics,
                         core::TaskGroup& tasks,
                         std::chrono::milliseconds retry_delay)
    : uploader_(uploader)
    , file_system_(file_system)
    , metrics_(metrics)
    , tasks_(tasks)
    , retry_delay_(retry_delay) {}

void RetryDriver::submit(const std::string& path) {
    tasks_.spawn("upload:" + path, [this, path](const core::StopToken& stop) {
        upload_until_accepted(path, stop);
    });
}

std::uint64_t RetryDriver::upload_until_accepted(const std::string& path, const core::StopToken& stop) {
    std::uint64_t attempts = 0;

    while (!stop.stop_requested()) {
        ++attempts;
        auto result = uploader_.upload(path);
        if (result.is_ok()) {
            metrics_.record_success();
            spdlog::info("Successfully uploaded: {}", path);

            if (auto removed = file_system_.remove(path); removed.is_error()) {
                spdlog::error("Uploaded {} but could not delete it: {}", path, removed.error());
            }
            return attempts;
        }

        const auto& error = result.error();
        metrics_.record_failure();
        if (error.is_remote()) {
            metrics_.record_retry();
        }
        spdlog::warn("Failed to upload: {} ({}: {}), retrying in {}ms",
                     path, to_string(error.kind), error.message, retry_delay_.count());

        if (!stop.sleep_for(retry_delay_)) {
            break;
        }
    }

    spdlog::info("Upload of {} interrupted by shutdown after {} attempt(s); file kept", path, attempts);
    return attempts;
}

} // namespace d2p::upload
