#include "d2p/fs/file_system.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace d2p::fs {
namespace stdfs = std::filesystem;

Result<std::vector<DirectoryEntry>> LocalFileSystem::list_directory(const std::string& directory) {
    std::error_code ec;
    stdfs::directory_iterator it(directory, ec);
    if (ec) {
        return Err<std::vector<DirectoryEntry>>("Failed to list " + directory + ": " + ec.message());
    }

    std::vector<DirectoryEntry> entries;
    for (; it != stdfs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Err<std::vector<DirectoryEntry>>("Failed to list " + directory + ": " + ec.message());
        }
        std::error_code type_ec;
        DirectoryEntry entry;
        entry.path = it->path().string();
        entry.is_directory = it->is_directory(type_ec);
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return Err<std::vector<DirectoryEntry>>("Failed to list " + directory + ": " + ec.message());
    }
    return Ok(std::move(entries));
}

Result<std::uint64_t> LocalFileSystem::file_size(const std::string& path) {
    std::error_code ec;
    const auto size = stdfs::file_size(path, ec);
    if (ec) {
        return Err<std::uint64_t>("stat " + path + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<std::vector<std::uint8_t>> LocalFileSystem::read_file(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>("Failed to open " + path);
    }

    std::vector<std::uint8_t> data;
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        data.insert(data.end(), buffer, buffer + input.gcount());
    }
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>("Failed to read " + path);
    }
    return Ok(std::move(data));
}

Result<void> LocalFileSystem::remove(const std::string& path) {
    std::error_code ec;
    if (!stdfs::remove(path, ec)) {
        return Err<void>("Failed to remove " + path + ": " +
                         (ec ? ec.message() : std::string("no such file")));
    }
    return Ok();
}

} // namespace d2p::fs
