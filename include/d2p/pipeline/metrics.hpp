#pragma once

#include <atomic>
#include <cstdint>

namespace d2p::pipeline {

/**
 * @brief Monotonic upload counters shared by every per-file task
 *
 * Each hook is a single atomic increment; the status server reads them
 * through snapshot().
 */
class UploadMetrics {
public:
    struct Snapshot {
        std::uint64_t successful_uploads = 0;
        std::uint64_t failed_uploads = 0;
        std::uint64_t upload_retries = 0;
        std::uint64_t abandoned_files = 0;
    };

    UploadMetrics() = default;

    UploadMetrics(const UploadMetrics&) = delete;
    UploadMetrics& operator=(const UploadMetrics&) = delete;

    void record_success() { successful_uploads_.fetch_add(1, std::memory_order_relaxed); }
    void record_failure() { failed_uploads_.fetch_add(1, std::memory_order_relaxed); }
    void record_retry() { upload_retries_.fetch_add(1, std::memory_order_relaxed); }

    // Stability probe failed; the file was left in place and will not be uploaded
    void record_abandoned() { abandoned_files_.fetch_add(1, std::memory_order_relaxed); }

    Snapshot snapshot() const {
        Snapshot s;
        s.successful_uploads = successful_uploads_.load(std::memory_order_relaxed);
        s.failed_uploads = failed_uploads_.load(std::memory_order_relaxed);
        s.upload_retries = upload_retries_.load(std::memory_order_relaxed);
        s.abandoned_files = abandoned_files_.load(std::memory_order_relaxed);
        return s;
    }

private:
    std::atomic<std::uint64_t> successful_uploads_{0};
    std::atomic<std::uint64_t> failed_uploads_{0};
    std::atomic<std::uint64_t> upload_retries_{0};
    std::atomic<std::uint64_t> abandoned_files_{0};
};

} // namespace d2p::pipeline
