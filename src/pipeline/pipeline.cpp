#include "d2p/pipeline/pipeline.hpp"

#include <spdlog/spdlog.h>

namespace d2p::pipeline {

Pipeline::Pipeline(PipelineContext context)
    : context_(context)
    , detector_(context.file_system, stable_, context.metrics, tasks_,
                StabilitySettings{context.config.stability_interval, context.config.stability_count})
    , retry_driver_(context.uploader, context.file_system, context.metrics, tasks_,
                    context.config.retry_delay)
    , watcher_(context.config.watch_directory.string(),
               watch::AllowList(context.config.allow_list),
               context.file_system,
               candidates_) {}

Pipeline::~Pipeline() {
    stop();
}

Result<void> Pipeline::start() {
    if (running_) {
        return Err<void>(std::string("Pipeline already running"));
    }

    // Dispatchers first so the watcher's initial listing is consumed right away
    running_ = true;
    candidate_dispatcher_ = std::thread([this]() { dispatch_candidates(); });
    stable_dispatcher_ = std::thread([this]() { dispatch_stable(); });

    auto started = watcher_.start();
    if (started.is_error()) {
        stop();
        return started;
    }

    spdlog::info("Pipeline started: stability {}x{}ms, retry delay {}ms",
                 context_.config.stability_count,
                 context_.config.stability_interval.count(),
                 context_.config.retry_delay.count());
    return Ok();
}

void Pipeline::stop() {
    const bool was_running = running_.exchange(false);

    watcher_.stop();
    candidates_.close();
    stable_.close();

    if (candidate_dispatcher_.joinable()) {
        candidate_dispatcher_.join();
    }
    if (stable_dispatcher_.joinable()) {
        stable_dispatcher_.join();
    }

    tasks_.shutdown();

    if (was_running) {
        spdlog::info("Pipeline stopped");
    }
}

void Pipeline::dispatch_candidates() {
    while (auto path = candidates_.receive()) {
        detector_.track(*path);
    }
}

void Pipeline::dispatch_stable() {
    while (auto path = stable_.receive()) {
        retry_driver_.submit(*path);
    }
}

} // namespace d2p::pipeline
