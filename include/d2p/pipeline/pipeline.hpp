#pragma once

#include "d2p/core/config.hpp"
#include "d2p/core/result.hpp"
#include "d2p/core/task_group.hpp"
#include "d2p/fs/file_system.hpp"
#include "d2p/pipeline/channel.hpp"
#include "d2p/pipeline/metrics.hpp"
#include "d2p/pipeline/stability_detector.hpp"
#include "d2p/upload/retry_driver.hpp"
#include "d2p/watch/directory_watcher.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace d2p::pipeline {

/**
 * @brief Everything the pipeline stages share, owned by the caller
 */
struct PipelineContext {
    const core::Config& config;
    UploadMetrics& metrics;
    fs::FileSystem& file_system;
    upload::Uploader& uploader;
};

/**
 * @brief Wires watcher -> stability detector -> retry driver
 *
 * Two channels carry paths between the stages and one dispatcher thread
 * drains each of them, fanning out a task per path. Files are independent:
 * completion order need not match discovery order.
 *
 * USAGE:
 * Pipeline pipeline(context);
 * if (auto res = pipeline.start(); res.is_error()) { ...fatal... }
 * ...
 * pipeline.stop();
 */
class Pipeline {
public:
    explicit Pipeline(PipelineContext context);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Start watching; an error here is fatal for the process
     */
    Result<void> start();

    /**
     * @brief Stop watching, close the channels and wait for every task
     *
     * In-flight stability checks and upload loops are abandoned; their
     * files stay on disk.
     */
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    /// Number of per-file tasks still in flight
    std::size_t active_tasks() const { return tasks_.active(); }

    Channel<std::string>& candidates() { return candidates_; }
    Channel<std::string>& stable() { return stable_; }

private:
    void dispatch_candidates();
    void dispatch_stable();

    PipelineContext context_;
    Channel<std::string> candidates_;
    Channel<std::string> stable_;
    core::TaskGroup tasks_;
    StabilityDetector detector_;
    upload::RetryDriver retry_driver_;
    watch::DirectoryWatcher watcher_;

    std::atomic<bool> running_{false};
    std::thread candidate_dispatcher_;
    std::thread stable_dispatcher_;
};

} // namespace d2p::pipeline
