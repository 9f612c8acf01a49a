#pragma once

#include "core/progress_observer.hpp"
#include "core/scan_options.hpp"
#include "core/scan_result.hpp"
#include "core/sidecar.hpp"
#include <cstddef>
#include <mutex>
#include <string>

/**
 * @brief Entry point for scanning files and directories into sidecars
 *
 * Directory scans fan out over at most ScanOptions::max_threads workers. Each
 * file is handled by exactly one worker, results keep the walker's order and
 * progress events are delivered to the observer one at a time.
 */
class FileScanner
{
public:
    explicit FileScanner(ProgressObserver *observer = nullptr);
    ~FileScanner() = default;

    FileScanner(const FileScanner &) = delete;
    FileScanner &operator=(const FileScanner &) = delete;

    /**
     * @brief Scan a file or a directory
     *
     * Per-file failures are recorded in the result and never fail the call.
     *
     * @throws ScanError (ErrorKind::Io) if the path does not exist
     * @throws ScanError (ErrorKind::Validation) for an unsupported single file, a malformed pattern
     *         or a path that is neither file nor directory
     * @throws ScanError (ErrorKind::User) for an invalid thread count or hash mode
     */
    ScanResult scanPath(const ScanOptions &options);

    /**
     * @brief Hash one file and build its sidecar, persisting it unless dry_run
     *
     * A dry run performs no filesystem writes at all.
     *
     * @throws ScanError (ErrorKind::Io) if the file is missing or unreadable or
     *         the sidecar cannot be written
     * @throws ScanError (ErrorKind::Validation) if the path is not a regular file
     */
    static Sidecar scanFile(const std::string &file_path, bool dry_run);

private:
    ScanResult scanSingleFile(const ScanOptions &options);
    ScanResult scanDirectory(const ScanOptions &options);

    // Never throws for file-level problems, they become a failed entry
    static ScannedFile scanCandidate(const std::string &file_path, bool dry_run);

    static void validateOptions(const ScanOptions &options);

    // Worker count handed to TBB, never above the machine or the number of files
    static int arenaConcurrency(size_t max_threads, size_t candidate_count);

    void emit(const ProgressEvent &event);

    ProgressObserver *observer_;
    std::mutex observer_mutex_;
};
