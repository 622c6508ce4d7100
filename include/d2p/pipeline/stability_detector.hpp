#pragma once

#include "d2p/core/task_group.hpp"
#include "d2p/fs/file_system.hpp"
#include "d2p/pipeline/channel.hpp"
#include "d2p/pipeline/metrics.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace d2p::pipeline {

struct StabilitySettings {
    std::chrono::milliseconds interval{2000};  ///< Delay between two size samples
    int required_readings = 5;                 ///< Consecutive unchanged samples needed
};

/**
 * @brief Per-file size tracking state
 *
 * The first sample only establishes the baseline; it never counts as an
 * unchanged reading, so a file needs required_readings + 1 samples.
 */
class StabilityState {
public:
    explicit StabilityState(int required_readings) : required_(required_readings) {}

    /**
     * @brief Record one size sample
     *
     * RETURNS: true once `required_readings` consecutive samples matched
     */
    bool observe(std::uint64_t size);

    int stable_readings() const noexcept { return stable_readings_; }
    std::optional<std::uint64_t> last_size() const noexcept { return last_size_; }

private:
    int required_;
    int stable_readings_ = 0;
    std::optional<std::uint64_t> last_size_;
};

/**
 * @brief Confirms that candidate files have stopped growing
 *
 * Every track() call starts an independent task that samples the file
 * size each interval. A stable file is sent to the stable channel exactly
 * once per task; a failed size probe abandons the file (logged and counted,
 * nothing emitted).
 */
class StabilityDetector {
public:
    StabilityDetector(fs::FileSystem& file_system,
                      Channel<std::string>& stable,
                      UploadMetrics& metrics,
                      core::TaskGroup& tasks,
                      StabilitySettings settings);

    /// Start a stability task for `path`; duplicates get their own task
    void track(const std::string& path);

    /**
     * @brief Body of one stability task, run on the calling thread
     *
     * RETURNS: true if the file was declared stable and sent
     */
    bool watch_until_stable(const std::string& path, const core::StopToken& stop);

    const StabilitySettings& settings() const noexcept { return settings_; }

private:
    fs::FileSystem& file_system_;
    Channel<std::string>& stable_;
    UploadMetrics& metrics_;
    core::TaskGroup& tasks_;
    StabilitySettings settings_;
};

} // namespace d2p::pipeline
