#pragma once

#include "d2p/fs/file_system.hpp"
#include "d2p/network/http_client.hpp"
#include "d2p/upload/document_uploader.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <string>
#include <vector>

namespace d2p::test_support {

/**
 * @brief In-memory FileSystem
 *
 * A size script makes successive file_size() calls return the given
 * values; the last one repeats.
 */
class FakeFileSystem : public fs::FileSystem {
public:
    void add_file(const std::string& path, const std::string& content) {
        std::lock_guard lock(mutex_);
        files_[path].content.assign(content.begin(), content.end());
    }

    void add_directory(const std::string& path) {
        std::lock_guard lock(mutex_);
        files_[path].is_directory = true;
    }

    void set_size_script(const std::string& path, std::vector<std::uint64_t> sizes) {
        std::lock_guard lock(mutex_);
        auto& file = files_[path];
        file.sizes.assign(sizes.begin(), sizes.end());
    }

    // Simulates another process deleting the file
    void delete_externally(const std::string& path) {
        std::lock_guard lock(mutex_);
        files_.erase(path);
    }

    bool exists(const std::string& path) const {
        std::lock_guard lock(mutex_);
        return files_.count(path) > 0;
    }

    int stat_calls(const std::string& path) const { return count(stat_calls_, path); }
    int open_calls(const std::string& path) const { return count(open_calls_, path); }
    int remove_calls(const std::string& path) const { return count(remove_calls_, path); }

    Result<std::vector<fs::DirectoryEntry>> list_directory(const std::string&) override {
        std::lock_guard lock(mutex_);
        std::vector<fs::DirectoryEntry> entries;
        for (const auto& [path, file] : files_) {
            entries.push_back(fs::DirectoryEntry{path, file.is_directory});
        }
        return Ok(std::move(entries));
    }

    Result<std::uint64_t> file_size(const std::string& path) override {
        std::lock_guard lock(mutex_);
        ++stat_calls_[path];
        auto it = files_.find(path);
        if (it == files_.end()) {
            return Err<std::uint64_t>("stat " + path + ": No such file or directory");
        }
        auto& sizes = it->second.sizes;
        if (sizes.empty()) {
            return Ok(static_cast<std::uint64_t>(it->second.content.size()));
        }
        const std::uint64_t size = sizes.front();
        if (sizes.size() > 1) {
            sizes.pop_front();
        }
        return Ok(size);
    }

    Result<std::vector<std::uint8_t>> read_file(const std::string& path) override {
        std::lock_guard lock(mutex_);
        ++open_calls_[path];
        auto it = files_.find(path);
        if (it == files_.end()) {
            return Err<std::vector<std::uint8_t>>("Failed to open " + path);
        }
        return Ok(it->second.content);
    }

    Result<void> remove(const std::string& path) override {
        std::lock_guard lock(mutex_);
        ++remove_calls_[path];
        if (files_.erase(path) == 0) {
            return Err<void>("Failed to remove " + path + ": no such file");
        }
        return Ok();
    }

private:
    struct File {
        std::vector<std::uint8_t> content;
        std::deque<std::uint64_t> sizes;
        bool is_directory = false;
    };

    int count(const std::map<std::string, int>& calls, const std::string& path) const {
        std::lock_guard lock(mutex_);
        auto it = calls.find(path);
        return it == calls.end() ? 0 : it->second;
    }

    mutable std::mutex mutex_;
    std::map<std::string, File> files_;
    std::map<std::string, int> stat_calls_;
    std::map<std::string, int> open_calls_;
    std::map<std::string, int> remove_calls_;
};

/**
 * @brief Returns scripted responses and records every request
 */
class FakeHttpClient : public network::HttpClient {
public:
    void respond(int status_code, const std::string& body = {}) {
        network::HttpResponse response;
        response.status_code = status_code;
        response.set_body(body);
        std::lock_guard lock(mutex_);
        script_.push_back(Ok(std::move(response)));
    }

    void fail(const std::string& message) {
        std::lock_guard lock(mutex_);
        script_.push_back(Err<network::HttpResponse>(message));
    }

    Result<network::HttpResponse> execute(const network::HttpRequest& request) override {
        std::lock_guard lock(mutex_);
        requests_.push_back(request);
        if (script_.empty()) {
            return Err<network::HttpResponse>(std::string("no scripted response"));
        }
        auto outcome = script_.front();
        if (script_.size() > 1) {
            script_.pop_front();
        }
        return outcome;
    }

    std::vector<network::HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Result<network::HttpResponse>> script_;
    std::vector<network::HttpRequest> requests_;
};

/**
 * @brief Uploader whose attempts fail until a given attempt number
 */
class FakeUploader : public upload::Uploader {
public:
    using Kind = upload::UploadError::Kind;

    /// Fail `failures` times with `kind`, then succeed; -1 fails forever
    void fail_times(int failures, Kind kind = Kind::Transport) {
        std::lock_guard lock(mutex_);
        failures_ = failures;
        kind_ = kind;
    }

    upload::UploadResult upload(const std::string& path) override {
        std::lock_guard lock(mutex_);
        attempts_[path].push_back(std::chrono::steady_clock::now());
        const int attempt = static_cast<int>(attempts_[path].size());
        if (failures_ < 0 || attempt <= failures_) {
            upload::UploadError error;
            error.kind = kind_;
            error.message = "scripted failure";
            if (kind_ == Kind::Rejected) {
                error.status_code = 500;
                error.body = "server error";
            }
            return Err<void>(std::move(error));
        }
        return Ok<upload::UploadError>();
    }

    int attempts(const std::string& path) const {
        std::lock_guard lock(mutex_);
        auto it = attempts_.find(path);
        return it == attempts_.end() ? 0 : static_cast<int>(it->second.size());
    }

    std::vector<std::chrono::steady_clock::time_point> attempt_times(const std::string& path) const {
        std::lock_guard lock(mutex_);
        auto it = attempts_.find(path);
        return it == attempts_.end() ? std::vector<std::chrono::steady_clock::time_point>{} : it->second;
    }

private:
    mutable std::mutex mutex_;
    int failures_ = 0;
    Kind kind_ = Kind::Transport;
    std::map<std::string, std::vector<std::chrono::steady_clock::time_point>> attempts_;
};

/// Poll `condition` until it holds or `timeout` passes
template<typename Predicate>
bool wait_until(Predicate condition, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

} // namespace d2p::test_support
