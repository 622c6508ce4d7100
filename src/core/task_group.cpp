#include "d2p/core/task_group.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace d2p::core {

TaskGroup::~TaskGroup() {
    shutdown();
}

bool TaskGroup::spawn(const std::string& name, Task task) {
    std::unique_lock lock(mutex_);
    if (stop_.stop_requested()) {
        spdlog::debug("Task group stopped, not starting task {}", name);
        return false;
    }

    reap_finished();

    auto worker = std::make_unique<Worker>();
    Worker* raw = worker.get();
    raw->thread = std::thread([this, raw, name, task = std::move(task)]() {
        try {
            task(stop_);
        } catch (const std::exception& e) {
            spdlog::error("Task {} terminated with exception: {}", name, e.what());
        }
        raw->done.store(true, std::memory_order_release);
    });
    workers_.push_back(std::move(worker));
    return true;
}

std::size_t TaskGroup::active() const {
    std::unique_lock lock(mutex_);
    std::size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker->done.load(std::memory_order_acquire)) {
            ++count;
        }
    }
    return count;
}

void TaskGroup::shutdown() {
    stop_.request_stop();

    std::list<std::unique_ptr<Worker>> remaining;
    {
        std::unique_lock lock(mutex_);
        remaining.swap(workers_);
    }

    if (!remaining.empty()) {
        spdlog::debug("Waiting for {} task(s) to finish", remaining.size());
    }
    for (auto& worker : remaining) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
}

void TaskGroup::reap_finished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->done.load(std::memory_order_acquire)) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace d2p::core
