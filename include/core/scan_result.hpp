#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class ScanAction
{
    Written,
    Skipped,
    Failed
};

NLOHMANN_JSON_SERIALIZE_ENUM(ScanAction, {
                                             {ScanAction::Written, "written"},
                                             {ScanAction::Skipped, "skipped"},
                                             {ScanAction::Failed, "failed"},
                                         })

/**
 * @brief Outcome for one discovered file
 *
 * Which optional fields are set depends on the action:
 *   written            sidecar_path, hash, size_bytes
 *   skipped (dry run)  hash, size_bytes
 *   skipped (filter)   error carries the reason, nothing was read
 *   failed             error
 */
struct ScannedFile
{
    std::string path;
    ScanAction action = ScanAction::Skipped;
    std::optional<std::string> sidecar_path;
    std::optional<std::string> error;
    std::optional<std::string> hash;
    std::optional<uint64_t> size_bytes;

    static ScannedFile written(const std::string &path, const std::string &sidecar_path,
                               const std::string &hash, uint64_t size_bytes);
    static ScannedFile dryRun(const std::string &path, const std::string &hash, uint64_t size_bytes);
    static ScannedFile filtered(const std::string &path, const std::string &reason);
    static ScannedFile failed(const std::string &path, const std::string &error);
};

/**
 * @brief Aggregate outcome of one scan invocation
 *
 * total_files == successful + failed + skipped holds after every record() call.
 */
struct ScanResult
{
    std::vector<ScannedFile> scanned_files;
    size_t total_files = 0;
    size_t successful = 0;
    size_t failed = 0;
    size_t skipped = 0;

    void record(ScannedFile file);
    bool isConsistent() const { return total_files == successful + failed + skipped; }
};

void to_json(nlohmann::ordered_json &j, const ScannedFile &file);
void to_json(nlohmann::ordered_json &j, const ScanResult &result);
