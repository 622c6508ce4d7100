#include "d2p/watch/allow_list.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace d2p::watch {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

AllowList::AllowList(const std::string& comma_separated_patterns) {
    std::istringstream stream(comma_separated_patterns);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto pattern = to_lower(trim(item));
        if (!pattern.empty()) {
            patterns_.push_back(std::move(pattern));
        }
    }
}

std::string AllowList::extension_of(const std::string& path) {
    // Leading-dot names such as ".hidden" have no extension per std::filesystem
    return to_lower(std::filesystem::path(path).filename().extension().string());
}

bool AllowList::matches(const std::string& path) const {
    if (patterns_.empty()) {
        return true;
    }

    const std::string extension = extension_of(path);
    for (const auto& pattern : patterns_) {
        if (::fnmatch(pattern.c_str(), extension.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace d2p::watch
