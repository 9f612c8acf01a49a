#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief File metadata read from the filesystem without touching file contents
 */
struct FileMetadata
{
    std::string file_path;
    std::chrono::system_clock::time_point modification_time;
    uint64_t file_size = 0; // File size in bytes
};

/**
 * @brief File utilities shared by the scanner, the sidecar writer and cleanup
 */
class FileUtils
{
public:
    /// Size of each read when streaming a file through the hasher
    static constexpr size_t kHashChunkSize = 8192;

    /**
     * @brief Get file metadata (no file content reading)
     * @param file_path Path to the file
     * @throws ScanError (ErrorKind::Io) if the path cannot be stat'ed
     */
    static FileMetadata getFileMetadata(const std::string &file_path);

    /**
     * @brief Compute the SHA-256 digest of a file's contents
     *
     * The file is streamed in fixed-size chunks, never loaded whole.
     *
     * @param file_path Path to the file
     * @return 64 lowercase hexadecimal characters
     * @throws ScanError (ErrorKind::Io) if the file cannot be opened or read
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * @brief Compute the SHA-256 digest of an in-memory buffer
     */
    static std::string computeHash(const std::string &data);

    /**
     * @brief Format a point in time as an RFC3339 UTC timestamp
     *
     * Sub-second digits are emitted only when non-zero, trailing zeros trimmed
     * ("2025-01-15T14:30:00Z", "2025-01-15T14:30:00.25Z").
     *
     * @throws ScanError (ErrorKind::Internal) if the time cannot be broken down
     */
    static std::string toRfc3339(std::chrono::system_clock::time_point time);

    static std::string nowRfc3339();

private:
    static std::string toHex(const unsigned char *digest, unsigned int length);
};
