#include "core/directory_walker.hpp"
#include "core/media_classifier.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace fs = std::filesystem;

DirectoryWalker::DirectoryWalker(std::optional<GlobMatcher> include, std::optional<GlobMatcher> exclude)
    : include_(std::move(include)), exclude_(std::move(exclude))
{
}

std::vector<DirectoryWalker::Entry> DirectoryWalker::walk(const std::string &root, bool recursive) const
{
    Logger::debug("Walking " + root + " (recursive: " + (recursive ? "yes" : "no") + ")");

    std::vector<Entry> entries;
    visitDirectory(fs::path(root), fs::path(root), recursive, entries);

    std::sort(entries.begin(), entries.end(),
              [](const Entry &a, const Entry &b)
              { return a.path < b.path; });
    return entries;
}

void DirectoryWalker::visitDirectory(const fs::path &root, const fs::path &dir,
                                     bool recursive, std::vector<Entry> &out) const
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        Logger::warn("Error accessing directory " + dir.string() + ": " + ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            Logger::warn("Error reading directory " + dir.string() + ": " + ec.message());
            return;
        }

        const fs::directory_entry &entry = *it;
        std::error_code entry_ec;

        // Do not descend through directory symlinks, they can form cycles
        if (entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec))
        {
            if (recursive)
            {
                visitDirectory(root, entry.path(), recursive, out);
            }
            continue;
        }

        bool regular = entry.is_regular_file(entry_ec);
        if (entry_ec)
        {
            Logger::warn("Skipping entry " + entry.path().string() + ": " + entry_ec.message());
            continue;
        }
        if (!regular)
        {
            Logger::trace("Ignoring non-regular entry: " + entry.path().string());
            continue;
        }

        out.push_back(classify(root, entry.path()));
    }
    if (ec)
    {
        Logger::warn("Error reading directory " + dir.string() + ": " + ec.message());
    }
}

DirectoryWalker::Entry DirectoryWalker::classify(const fs::path &root, const fs::path &file) const
{
    Entry entry{file.string(), std::nullopt};
    std::string relative = file.lexically_relative(root).generic_string();
    if (relative.empty() || relative == ".")
    {
        relative = file.filename().generic_string();
    }

    if (exclude_ && exclude_->matches(relative))
    {
        entry.skip_reason = kExcludedReason;
    }
    else if (include_ && !include_->matches(relative))
    {
        entry.skip_reason = kNotIncludedReason;
    }
    else if (!MediaClassifier::isSupportedFile(entry.path))
    {
        entry.skip_reason = kUnsupportedReason;
    }

    if (entry.skip_reason)
    {
        Logger::debug("Skipping " + entry.path + ": " + *entry.skip_reason);
    }
    return entry;
}
