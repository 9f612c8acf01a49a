#pragma once

#include "core/progress_observer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class GeneratedFileType
{
    Sidecar,   // photo.jpg.json
    Backup,    // photo.jpg.json.bak1 .. bak3
    Temporary  // photo.jpg.json.tmp left behind by an interrupted write
};

NLOHMANN_JSON_SERIALIZE_ENUM(GeneratedFileType, {
                                                    {GeneratedFileType::Sidecar, "sidecar"},
                                                    {GeneratedFileType::Backup, "backup"},
                                                    {GeneratedFileType::Temporary, "temporary"},
                                                })

struct CleanupOptions
{
    bool sidecars = true;
    bool backups = true;
    bool temporaries = true;

    static CleanupOptions all() { return CleanupOptions{}; }
    static CleanupOptions sidecarsOnly() { return CleanupOptions{true, false, false}; }
    static CleanupOptions backupsOnly() { return CleanupOptions{false, true, false}; }

    bool accepts(GeneratedFileType type) const;
};

struct DeletedFile
{
    std::string path;
    GeneratedFileType type = GeneratedFileType::Sidecar;
    uint64_t size_bytes = 0;
    std::optional<std::string> error; // set when removal failed
};

struct CleanupResult
{
    std::vector<DeletedFile> deleted_files;
    size_t total_files = 0; // generated files matched
    size_t deleted = 0;
    size_t failed = 0;
    uint64_t total_bytes = 0; // bytes freed (or that would be freed in a dry run)
};

/**
 * @brief Removes files this tool generated beside originals
 *
 * Only files whose name is a supported image name followed by one of the
 * generated suffixes are touched; originals and unrelated .json files never are.
 */
class SidecarCleaner
{
public:
    /**
     * @brief Classify a file name as one of our generated files
     * @return Unset if the name does not look like something we produced
     */
    static std::optional<GeneratedFileType> classify(const std::string &path);

    /**
     * @brief Remove generated files under a directory, or beside a single original
     * @param dry_run Report what would be removed without removing anything
     * @param observer Receives FileStarted/FileCompleted around each matched file
     * @throws ScanError (ErrorKind::Io) if path does not exist
     */
    static CleanupResult cleanupPath(const std::string &path, bool recursive,
                                     const CleanupOptions &options, bool dry_run,
                                     ProgressObserver *observer = nullptr);

private:
    static void handleFile(const std::string &path, const CleanupOptions &options,
                           bool dry_run, ProgressObserver *observer, CleanupResult &result);
};

void to_json(nlohmann::ordered_json &j, const DeletedFile &file);
void to_json(nlohmann::ordered_json &j, const CleanupResult &result);
