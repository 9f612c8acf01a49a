#pragma once

#include "core/glob_matcher.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Traverses a directory and classifies every regular file found
 *
 * Filters run in a fixed order and the first one that rejects a file wins:
 *   1. exclude patterns
 *   2. include patterns (when given, the file must match one)
 *   3. supported image extension
 * Paths are matched relative to the walk root. Unreadable entries and
 * subdirectories are logged and left out of the result; they never abort the
 * walk. Symlinked files are followed, symlinked directories are not.
 */
class DirectoryWalker
{
public:
    static constexpr const char *kExcludedReason = "Excluded by pattern";
    static constexpr const char *kNotIncludedReason = "Not included by pattern";
    static constexpr const char *kUnsupportedReason = "Not an image file (unsupported extension)";

    struct Entry
    {
        std::string path;
        std::optional<std::string> skip_reason; // unset for files that should be scanned

        bool isCandidate() const { return !skip_reason.has_value(); }
    };

    DirectoryWalker(std::optional<GlobMatcher> include, std::optional<GlobMatcher> exclude);

    /**
     * @brief Walk a directory
     * @param root Directory to traverse
     * @param recursive false visits only the direct children of root
     * @return Every regular file found, sorted by path, with its filter verdict
     */
    std::vector<Entry> walk(const std::string &root, bool recursive) const;

    /**
     * @brief Apply the filter chain to one file below root
     */
    Entry classify(const std::filesystem::path &root, const std::filesystem::path &file) const;

private:
    void visitDirectory(const std::filesystem::path &root, const std::filesystem::path &dir,
                        bool recursive, std::vector<Entry> &out) const;

    std::optional<GlobMatcher> include_;
    std::optional<GlobMatcher> exclude_;
};
