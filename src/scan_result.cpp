#include "core/scan_result.hpp"

ScannedFile ScannedFile::written(const std::string &path, const std::string &sidecar_path,
                                 const std::string &hash, uint64_t size_bytes)
{
    ScannedFile file;
    file.path = path;
    file.action = ScanAction::Written;
    file.sidecar_path = sidecar_path;
    file.hash = hash;
    file.size_bytes = size_bytes;
    return file;
}

ScannedFile ScannedFile::dryRun(const std::string &path, const std::string &hash, uint64_t size_bytes)
{
    ScannedFile file;
    file.path = path;
    file.action = ScanAction::Skipped;
    file.hash = hash;
    file.size_bytes = size_bytes;
    return file;
}

ScannedFile ScannedFile::filtered(const std::string &path, const std::string &reason)
{
    ScannedFile file;
    file.path = path;
    file.action = ScanAction::Skipped;
    file.error = reason;
    return file;
}

ScannedFile ScannedFile::failed(const std::string &path, const std::string &error)
{
    ScannedFile file;
    file.path = path;
    file.action = ScanAction::Failed;
    file.error = error;
    return file;
}

void ScanResult::record(ScannedFile file)
{
    ++total_files;
    switch (file.action)
    {
    case ScanAction::Written:
        ++successful;
        break;
    case ScanAction::Skipped:
        ++skipped;
        break;
    case ScanAction::Failed:
        ++failed;
        break;
    }
    scanned_files.push_back(std::move(file));
}

void to_json(nlohmann::ordered_json &j, const ScannedFile &file)
{
    j = nlohmann::ordered_json{
        {"path", file.path},
        {"action", file.action}};
    if (file.sidecar_path)
        j["sidecar_path"] = *file.sidecar_path;
    if (file.error)
        j["error"] = *file.error;
    if (file.hash)
        j["hash"] = *file.hash;
    if (file.size_bytes)
        j["size_bytes"] = *file.size_bytes;
}

void to_json(nlohmann::ordered_json &j, const ScanResult &result)
{
    j = nlohmann::ordered_json{
        {"scanned_files", result.scanned_files},
        {"total_files", result.total_files},
        {"successful", result.successful},
        {"failed", result.failed},
        {"skipped", result.skipped}};
}
