#pragma once

#include "d2p/core/result.hpp"
#include "d2p/fs/file_system.hpp"
#include "d2p/pipeline/channel.hpp"
#include "d2p/watch/allow_list.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace d2p::watch {

/**
 * @brief Feeds candidate files of one directory into the pipeline
 *
 * On start() every allow-listed, non-directory entry already present is
 * sent to the candidate channel; afterwards inotify creation events
 * (IN_CREATE, IN_MOVED_TO) are filtered the same way and sent as they
 * arrive. The directory is not watched recursively.
 *
 * Errors while starting are returned and must be treated as fatal. Errors
 * from the event stream once running are logged and watching continues.
 */
class DirectoryWatcher {
public:
    DirectoryWatcher(std::string directory,
                     AllowList allow_list,
                     fs::FileSystem& file_system,
                     pipeline::Channel<std::string>& candidates);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    /**
     * @brief Subscribe to events, emit existing files, start the event thread
     */
    Result<void> start();

    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    const std::string& directory() const noexcept { return directory_; }

private:
    Result<void> open_watch();
    Result<void> emit_existing_files();
    void watch_loop();
    void handle_event(std::uint32_t mask, const std::string& name);
    void close_watch();

    std::string directory_;
    AllowList allow_list_;
    fs::FileSystem& file_system_;
    pipeline::Channel<std::string>& candidates_;

    int inotify_fd_ = -1;
    int watch_descriptor_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace d2p::watch
