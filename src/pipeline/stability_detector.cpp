#include "d2p/pipeline/stability_detector.hpp"

#include <spdlog/spdlog.h>

namespace d2p::pipeline {

bool StabilityState::observe(std::uint64_t size) {
    if (last_size_ && *last_size_ == size) {
        ++stable_readings_;
    } else {
        stable_readings_ = 0;
    }
    last_size_ = size;
    return stable_readings_ >= required_;
}

StabilityDetector::StabilityDetector(fs::FileSystem& file_system,
                                     Channel<std::string>& stable,
                                     UploadMetrics& metrics,
                                     core::TaskGroup& tasks,
                                     StabilitySettings settings)
    : file_system_(file_system)
    , stable_(stable)
    , metrics_(metrics)
    , tasks_(tasks)
    , settings_(settings) {}

void StabilityDetector::track(const std::string& path) {
    tasks_.spawn("stability:" + path, [this, path](const core::StopToken& stop) {
        watch_until_stable(path, stop);
    });
}

bool StabilityDetector::watch_until_stable(const std::string& path, const core::StopToken& stop) {
    StabilityState state(settings_.required_readings);

    while (!stop.stop_requested()) {
        spdlog::debug("Checking stability for {} Consecutive readings with same size: {}/{}",
                      path, state.stable_readings(), settings_.required_readings);

        auto size = file_system_.file_size(path);
        if (size.is_error()) {
            metrics_.record_abandoned();
            spdlog::warn("[abandoned] {}: {}", path, size.error());
            return false;
        }

        if (state.observe(size.value())) {
            spdlog::debug("Checking stability for {}: Consecutive readings with same size: {}/{} -> OK, ready for upload",
                          path, state.stable_readings(), settings_.required_readings);
            return stable_.send(path);
        }

        if (!stop.sleep_for(settings_.interval)) {
            break;
        }
    }

    spdlog::debug("Stability check for {} cancelled by shutdown", path);
    return false;
}

} // namespace d2p::pipeline
