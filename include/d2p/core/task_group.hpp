#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace d2p::core {

/**
 * @brief Shutdown signal shared by every task of a TaskGroup
 *
 * Tasks never block on anything but sleep_for(), so requesting stop wakes
 * all of them within one scheduling round.
 */
class StopToken {
public:
    bool stop_requested() const { return stopped_.load(std::memory_order_acquire); }

    /**
     * @brief Suspend the calling task
     *
     * RETURNS: true after the full duration, false if stop was requested first
     */
    template<typename Rep, typename Period>
    bool sleep_for(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, duration, [this]() { return stop_requested(); });
    }

    void request_stop() {
        {
            std::unique_lock lock(mutex_);
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

private:
    std::atomic<bool> stopped_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

/**
 * @brief Spawns one thread per task, with no cap on how many run at once
 *
 * Tasks are fire-and-forget: their only observable result is what they do
 * before returning. Finished threads are joined lazily on the next spawn()
 * and all remaining ones in shutdown().
 *
 * THREAD SAFETY: spawn() and active() may be called from any thread.
 */
class TaskGroup {
public:
    using Task = std::function<void(const StopToken&)>;

    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /**
     * @brief Start a task on its own thread
     *
     * RETURNS: false if the group is already shut down (task not started)
     */
    bool spawn(const std::string& name, Task task);

    /// Number of tasks that have not yet returned
    std::size_t active() const;

    /// Request stop and join every task
    void shutdown();

    const StopToken& stop_token() const { return stop_; }

private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void reap_finished();

    StopToken stop_;
    mutable std::mutex mutex_;
    std::list<std::unique_ptr<Worker>> workers_;
};

} // namespace d2p::core
