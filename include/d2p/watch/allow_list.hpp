#pragma once

#include <string>
#include <vector>

namespace d2p::watch {

/**
 * @brief File extension filter built from "*.pdf,*.txt"-style pattern lists
 *
 * The lower-cased extension of a file (".pdf", or "" when it has none) is
 * glob-matched against each pattern. Matching is case-insensitive because
 * both sides are lower-cased. An allow-list without patterns admits all files.
 */
class AllowList {
public:
    AllowList() = default;
    explicit AllowList(const std::string& comma_separated_patterns);

    bool matches(const std::string& path) const;

    bool empty() const noexcept { return patterns_.empty(); }
    const std::vector<std::string>& patterns() const noexcept { return patterns_; }

    /// Lower-cased extension of the base name including the dot, "" if none
    static std::string extension_of(const std::string& path);

private:
    std::vector<std::string> patterns_;
};

} // namespace d2p::watch
