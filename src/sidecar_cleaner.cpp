#include "core/sidecar_cleaner.hpp"
#include "core/file_utils.hpp"
#include "core/media_classifier.hpp"
#include "core/scan_error.hpp"
#include "core/sidecar_writer.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace
{
    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool originalIsSupported(const std::string &path, const std::string &suffix)
    {
        return MediaClassifier::isSupportedFile(path.substr(0, path.size() - suffix.size()));
    }
}

bool CleanupOptions::accepts(GeneratedFileType type) const
{
    switch (type)
    {
    case GeneratedFileType::Sidecar:
        return sidecars;
    case GeneratedFileType::Backup:
        return backups;
    case GeneratedFileType::Temporary:
        return temporaries;
    }
    return false;
}

std::optional<GeneratedFileType> SidecarCleaner::classify(const std::string &path)
{
    if (endsWith(path, ".json"))
    {
        if (originalIsSupported(path, ".json"))
            return GeneratedFileType::Sidecar;
        return std::nullopt;
    }
    if (endsWith(path, ".json.tmp"))
    {
        if (originalIsSupported(path, ".json.tmp"))
            return GeneratedFileType::Temporary;
        return std::nullopt;
    }
    for (int generation = 1; generation <= SidecarWriter::kBackupDepth; ++generation)
    {
        std::string suffix = ".json.bak" + std::to_string(generation);
        if (endsWith(path, suffix))
        {
            if (originalIsSupported(path, suffix))
                return GeneratedFileType::Backup;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

CleanupResult SidecarCleaner::cleanupPath(const std::string &path, bool recursive,
                                          const CleanupOptions &options, bool dry_run,
                                          ProgressObserver *observer)
{
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (!fs::exists(status))
    {
        throw ScanError::io("Path not found: " + path);
    }

    CleanupResult result;

    if (fs::is_regular_file(status))
    {
        // A single original: clean up everything generated beside it
        handleFile(SidecarWriter::sidecarPathFor(path), options, dry_run, observer, result);
        handleFile(SidecarWriter::tempPathFor(path), options, dry_run, observer, result);
        for (int generation = 1; generation <= SidecarWriter::kBackupDepth; ++generation)
        {
            handleFile(SidecarWriter::backupPathFor(path, generation), options, dry_run, observer, result);
        }
        return result;
    }
    if (!fs::is_directory(status))
    {
        throw ScanError::validation("Path is neither a file nor a directory: " + path);
    }

    Logger::info("Starting cleanup: " + path + (dry_run ? " (dry run)" : ""));

    std::vector<std::string> files;
    auto collect = [&files](const fs::directory_entry &entry)
    {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && classify(entry.path().string()))
        {
            files.push_back(entry.path().string());
        }
    };

    if (recursive)
    {
        fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            collect(*it);
        }
    }
    else
    {
        fs::directory_iterator it(path, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec))
        {
            collect(*it);
        }
    }
    if (ec)
    {
        Logger::warn("Error while listing " + path + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    for (const auto &file : files)
    {
        handleFile(file, options, dry_run, observer, result);
    }

    Logger::info("Cleanup completed. Matched: " + std::to_string(result.total_files) +
                 ", Deleted: " + std::to_string(result.deleted) +
                 ", Failed: " + std::to_string(result.failed));
    return result;
}

void SidecarCleaner::handleFile(const std::string &path, const CleanupOptions &options,
                                bool dry_run, ProgressObserver *observer, CleanupResult &result)
{
    auto type = classify(path);
    if (!type || !options.accepts(*type))
    {
        return;
    }

    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec)
    {
        // Nothing there (single-file mode checks every generated name)
        return;
    }

    DeletedFile deleted;
    deleted.path = path;
    deleted.type = *type;
    deleted.size_bytes = size;
    ++result.total_files;
    if (observer)
    {
        observer->onProgress(FileStarted{path});
    }

    if (!dry_run && !fs::remove(path, ec))
    {
        std::string message = ec ? ec.message() : "file vanished";
        Logger::error("Failed to remove " + path + ": " + message);
        deleted.error = message;
        ++result.failed;
    }
    else
    {
        Logger::debug(std::string(dry_run ? "Would remove: " : "Removed: ") + path);
        ++result.deleted;
        result.total_bytes += size;
    }

    if (observer)
    {
        FileCompleted completed;
        completed.path = path;
        completed.success = !deleted.error.has_value();
        if (completed.success)
            completed.size_bytes = size;
        else
            completed.error = deleted.error;
        observer->onProgress(completed);
    }
    result.deleted_files.push_back(std::move(deleted));
}

void to_json(nlohmann::ordered_json &j, const DeletedFile &file)
{
    j = nlohmann::ordered_json{
        {"path", file.path},
        {"type", file.type},
        {"size_bytes", file.size_bytes}};
    if (file.error)
        j["error"] = *file.error;
}

void to_json(nlohmann::ordered_json &j, const CleanupResult &result)
{
    j = nlohmann::ordered_json{
        {"deleted_files", result.deleted_files},
        {"total_files", result.total_files},
        {"deleted", result.deleted},
        {"failed", result.failed},
        {"total_bytes", result.total_bytes}};
}
