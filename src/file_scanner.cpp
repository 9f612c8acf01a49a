#include "core/file_scanner.hpp"
#include "core/directory_walker.hpp"
#include "core/file_utils.hpp"
#include "core/glob_matcher.hpp"
#include "core/media_classifier.hpp"
#include "core/scan_error.hpp"
#include "core/sidecar_writer.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <vector>

FileScanner::FileScanner(ProgressObserver *observer)
    : observer_(observer)
{
}

ScanResult FileScanner::scanPath(const ScanOptions &options)
{
    validateOptions(options);

    std::error_code ec;
    fs::file_status status = fs::status(options.path, ec);
    if (!fs::exists(status))
    {
        throw ScanError::io("Path not found: " + options.path);
    }

    if (fs::is_regular_file(status))
    {
        return scanSingleFile(options);
    }
    if (fs::is_directory(status))
    {
        return scanDirectory(options);
    }
    throw ScanError::validation("Path is neither a file nor a directory: " + options.path);
}

Sidecar FileScanner::scanFile(const std::string &file_path, bool dry_run)
{
    std::error_code ec;
    fs::file_status status = fs::status(file_path, ec);
    if (!fs::exists(status))
    {
        throw ScanError::io("File not found: " + file_path);
    }
    if (!fs::is_regular_file(status))
    {
        throw ScanError::validation("Path is not a file: " + file_path);
    }

    FileMetadata metadata = FileUtils::getFileMetadata(file_path);

    SourceInfo source;
    source.file_path = file_path;
    source.file_size_bytes = metadata.file_size;
    source.file_hash = FileUtils::computeFileHash(file_path);
    source.file_modified_at = FileUtils::toRfc3339(metadata.modification_time);

    Sidecar sidecar = Sidecar::create(std::move(source), FileUtils::nowRfc3339());

    if (!dry_run)
    {
        SidecarWriter::write(file_path, sidecar);
    }
    Logger::debug(std::string(dry_run ? "Dry run, not persisted: " : "Scanned: ") + file_path +
                  " (" + std::to_string(sidecar.source.file_size_bytes) + " bytes)");
    return sidecar;
}

void FileScanner::validateOptions(const ScanOptions &options)
{
    if (options.max_threads == 0)
    {
        throw ScanError::user("max_threads must be greater than 0");
    }
    if (options.hash_mode != "file")
    {
        throw ScanError::user("Unsupported hash mode '" + options.hash_mode + "': only 'file' is available");
    }
}

ScanResult FileScanner::scanSingleFile(const ScanOptions &options)
{
    if (!MediaClassifier::isSupportedFile(options.path))
    {
        throw ScanError::validation("Not an image file: " + options.path);
    }

    Logger::info("Scanning single file: " + options.path + (options.dry_run ? " (dry run)" : ""));

    ScanResult result;
    result.record(scanCandidate(options.path, options.dry_run));
    return result;
}

ScanResult FileScanner::scanDirectory(const ScanOptions &options)
{
    Logger::info("Starting directory scan: " + options.path +
                 " (recursive: " + (options.recursive ? "yes" : "no") +
                 ", dry run: " + (options.dry_run ? "yes" : "no") +
                 ", threads: " + std::to_string(options.max_threads) + ")");

    std::optional<GlobMatcher> include;
    std::optional<GlobMatcher> exclude;
    if (options.include)
    {
        include = GlobMatcher::compile(*options.include);
    }
    if (options.exclude)
    {
        exclude = GlobMatcher::compile(*options.exclude);
    }

    DirectoryWalker walker(std::move(include), std::move(exclude));
    std::vector<DirectoryWalker::Entry> entries = walker.walk(options.path, options.recursive);

    // One slot per entry, each written by exactly one worker
    std::vector<ScannedFile> outcomes(entries.size());
    std::vector<size_t> candidates;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        if (entries[i].isCandidate())
        {
            candidates.push_back(i);
        }
        else
        {
            outcomes[i] = ScannedFile::filtered(entries[i].path, *entries[i].skip_reason);
        }
    }

    tbb::task_arena arena(arenaConcurrency(options.max_threads, candidates.size()));
    arena.execute(
        [&]
        {
            tbb::parallel_for(
                tbb::blocked_range<size_t>(0, candidates.size()),
                [&](const tbb::blocked_range<size_t> &range)
                {
                    for (size_t c = range.begin(); c != range.end(); ++c)
                    {
                        const size_t index = candidates[c];
                        const std::string &path = entries[index].path;

                        emit(FileStarted{path});
                        ScannedFile outcome = scanCandidate(path, options.dry_run);

                        FileCompleted completed;
                        completed.path = path;
                        completed.success = outcome.action != ScanAction::Failed;
                        if (completed.success)
                        {
                            completed.size_bytes = outcome.size_bytes;
                        }
                        else
                        {
                            completed.error = outcome.error;
                        }
                        emit(completed);

                        outcomes[index] = std::move(outcome);
                    }
                });
        });

    ScanResult result;
    for (auto &outcome : outcomes)
    {
        result.record(std::move(outcome));
    }

    Logger::info("Directory scan completed. Total: " + std::to_string(result.total_files) +
                 ", Successful: " + std::to_string(result.successful) +
                 ", Failed: " + std::to_string(result.failed) +
                 ", Skipped: " + std::to_string(result.skipped));
    return result;
}

ScannedFile FileScanner::scanCandidate(const std::string &file_path, bool dry_run)
{
    try
    {
        Sidecar sidecar = scanFile(file_path, dry_run);
        if (dry_run)
        {
            return ScannedFile::dryRun(file_path, sidecar.source.file_hash, sidecar.source.file_size_bytes);
        }
        return ScannedFile::written(file_path, SidecarWriter::sidecarPathFor(file_path),
                                    sidecar.source.file_hash, sidecar.source.file_size_bytes);
    }
    catch (const ScanError &e)
    {
        Logger::error("Failed to scan " + file_path + ": " + e.what());
        return ScannedFile::failed(file_path, e.what());
    }
    catch (const std::exception &e)
    {
        ScanError internal = ScanError::internal(e.what());
        Logger::error("Unexpected failure scanning " + file_path + ": " + internal.what());
        return ScannedFile::failed(file_path, internal.what());
    }
}

int FileScanner::arenaConcurrency(size_t max_threads, size_t candidate_count)
{
    // More slots than the machine has cores or than there are files buy nothing
    size_t limit = static_cast<size_t>(std::max(1, tbb::this_task_arena::max_concurrency()));
    limit = std::min(limit, std::max<size_t>(candidate_count, 1));
    return static_cast<int>(std::min(max_threads, limit));
}

void FileScanner::emit(const ProgressEvent &event)
{
    if (!observer_)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_->onProgress(event);
}
