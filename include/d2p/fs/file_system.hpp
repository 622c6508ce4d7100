#pragma once

#include "d2p/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace d2p::fs {

struct DirectoryEntry {
    std::string path;          ///< Absolute path of the entry
    bool is_directory = false;
};

/**
 * @brief Filesystem operations the pipeline depends on
 *
 * Injected into the watcher, the stability detector, the uploader and the
 * retry driver so the pipeline can run against an in-memory fake in tests.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Entries directly inside `directory` (non-recursive)
    virtual Result<std::vector<DirectoryEntry>> list_directory(const std::string& directory) = 0;

    virtual Result<std::uint64_t> file_size(const std::string& path) = 0;

    /// Open `path` for reading and return its full contents
    virtual Result<std::vector<std::uint8_t>> read_file(const std::string& path) = 0;

    virtual Result<void> remove(const std::string& path) = 0;
};

/**
 * @brief FileSystem backed by std::filesystem
 */
class LocalFileSystem : public FileSystem {
public:
    Result<std::vector<DirectoryEntry>> list_directory(const std::string& directory) override;
    Result<std::uint64_t> file_size(const std::string& path) override;
    Result<std::vector<std::uint8_t>> read_file(const std::string& path) override;
    Result<void> remove(const std::string& path) override;
};

} // namespace d2p::fs
