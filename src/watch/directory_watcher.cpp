#include "d2p/watch/directory_watcher.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace d2p::watch {
namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO | IN_ONLYDIR;
constexpr int kPollTimeoutMs = 200;

std::string absolute_directory(const std::string& directory) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(directory, ec);
    if (ec) {
        return directory;
    }
    return absolute.lexically_normal().string();
}

std::string errno_message() {
    return std::strerror(errno);
}

} // namespace

DirectoryWatcher::DirectoryWatcher(std::string directory,
                                   AllowList allow_list,
                                   fs::FileSystem& file_system,
                                   pipeline::Channel<std::string>& candidates)
    : directory_(absolute_directory(directory))
    , allow_list_(std::move(allow_list))
    , file_system_(file_system)
    , candidates_(candidates) {}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

Result<void> DirectoryWatcher::start() {
    if (running_) {
        return Err<void>(std::string("Watcher already running for ") + directory_);
    }

    // Subscribe before listing so nothing created in between is missed
    if (auto res = open_watch(); res.is_error()) {
        return res;
    }

    if (auto res = emit_existing_files(); res.is_error()) {
        close_watch();
        return res;
    }

    running_ = true;
    thread_ = std::thread([this]() { watch_loop(); });

    std::string filter = "all files";
    if (!allow_list_.empty()) {
        filter.clear();
        for (const auto& pattern : allow_list_.patterns()) {
            filter += (filter.empty() ? "" : ",") + pattern;
        }
    }
    spdlog::info("Watching {} for new files ({})", directory_, filter);
    return Ok();
}

void DirectoryWatcher::stop() {
    if (running_.exchange(false)) {
        spdlog::debug("Stopping watcher for {}", directory_);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    close_watch();
}

Result<void> DirectoryWatcher::open_watch() {
    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        return Err<void>("Failed to initialise inotify: " + errno_message());
    }

    watch_descriptor_ = ::inotify_add_watch(inotify_fd_, directory_.c_str(), kWatchMask);
    if (watch_descriptor_ < 0) {
        const std::string reason = errno_message();
        close_watch();
        return Err<void>("Failed to watch " + directory_ + ": " + reason);
    }
    return Ok();
}

Result<void> DirectoryWatcher::emit_existing_files() {
    auto listing = file_system_.list_directory(directory_);
    if (listing.is_error()) {
        return Err<void>(listing.error());
    }

    for (const auto& entry : listing.value()) {
        if (entry.is_directory || !allow_list_.matches(entry.path)) {
            continue;
        }
        spdlog::info("Found existing file. Starting stability check for: {}", entry.path);
        if (!candidates_.send(entry.path)) {
            return Err<void>(std::string("Candidate channel closed while listing ") + directory_);
        }
    }
    return Ok();
}

void DirectoryWatcher::watch_loop() {
    // inotify_event is variable length; keep the buffer aligned for it
    alignas(alignof(struct inotify_event)) char buffer[16 * 1024];

    while (running_) {
        pollfd pfd{};
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno != EINTR) {
                spdlog::error("Watch error on {}: {}", directory_, errno_message());
            }
            continue;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        const ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                spdlog::error("Watch error on {}: {}", directory_, errno_message());
            }
            continue;
        }

        for (ssize_t offset = 0; offset < length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
            const std::string name = event->len > 0 ? std::string(event->name) : std::string();
            handle_event(event->mask, name);
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);
        }
    }
}

void DirectoryWatcher::handle_event(std::uint32_t mask, const std::string& name) {
    if (mask & IN_Q_OVERFLOW) {
        spdlog::warn("Watch event queue overflowed for {}; some new files may be missed", directory_);
        return;
    }
    if (mask & IN_IGNORED) {
        spdlog::error("Watch on {} was removed by the kernel", directory_);
        return;
    }
    if ((mask & IN_ISDIR) || name.empty()) {
        return;
    }

    const std::string path = (std::filesystem::path(directory_) / name).string();
    if (!allow_list_.matches(path)) {
        spdlog::debug("Ignoring {}: extension not allowed", path);
        return;
    }

    spdlog::info("Detected new file. Starting stability check for: {}", path);
    if (!candidates_.send(path)) {
        spdlog::debug("Candidate channel closed, dropping {}", path);
    }
}

void DirectoryWatcher::close_watch() {
    if (inotify_fd_ >= 0) {
        if (watch_descriptor_ >= 0) {
            ::inotify_rm_watch(inotify_fd_, watch_descriptor_);
            watch_descriptor_ = -1;
        }
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
}

} // namespace d2p::watch
