/**
 * @file channel.hpp
 * @brief Unbounded hand-off channel between pipeline stages
 *
 * The watcher sends candidate paths to the stability detector and the
 * detector sends stable paths to the retry driver through a Channel.
 *
 * EXAMPLE:
 * Channel<std::string> stable;
 * stable.send("/consume/scan.pdf");   // Producer
 * auto path = stable.receive();       // Consumer (blocks until available)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace d2p::pipeline {

/**
 * @brief Thread-safe FIFO with close semantics
 *
 * THREAD SAFETY:
 * - Any number of senders and receivers
 * - send() never blocks and never drops (no capacity limit)
 * - After close(), queued items are still delivered; receive() returns
 *   nullopt once the channel is closed and drained
 */
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue an item
     *
     * RETURNS: false if the channel is closed (item dropped)
     */
    bool send(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Blocking receive
     *
     * RETURNS: next item, or nullopt once closed and empty
     */
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        return take_locked();
    }

    /**
     * @brief Receive, waiting at most `timeout`
     */
    template<typename Rep, typename Period>
    std::optional<T> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        return take_locked();
    }

    std::optional<T> try_receive() {
        std::unique_lock lock(mutex_);
        return take_locked();
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /// Wake all receivers; further sends are refused
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace d2p::pipeline
