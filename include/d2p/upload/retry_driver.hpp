#pragma once

#include "d2p/core/task_group.hpp"
#include "d2p/fs/file_system.hpp"
#include "d2p/pipeline/metrics.hpp"
#include "d2p/upload/document_uploader.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace d2p::upload {

/**
 * @brief Uploads stable files until the server accepts them
 *
 * One task per submitted path. Each attempt that fails is counted and
 * followed by a fixed `retry_delay`; there is no attempt limit and no
 * backoff growth. The local file is removed only after a successful
 * attempt, and a failed removal does not undo the success.
 */
class RetryDriver {
public:
    RetryDriver(Uploader& uploader,
                fs::FileSystem& file_system,
                pipeline::UploadMetrics& metrics,
                core::TaskGroup& tasks,
                std::chrono::milliseconds retry_delay);

    void submit(const std::string& path);

    /**
     * @brief Body of one upload task, run on the calling thread
     *
     * RETURNS: number of attempts made; ends early only on shutdown
     */
    std::uint64_t upload_until_accepted(const std::string& path, const core::StopToken& stop);

    std::chrono::milliseconds retry_delay() const noexcept { return retry_delay_; }

private:
    Uploader& uploader_;
    fs::FileSystem& file_system_;
    pipeline::UploadMetrics& metrics_;
    core::TaskGroup& tasks_;
    std::chrono::milliseconds retry_delay_;
};

} // namespace d2p::upload
