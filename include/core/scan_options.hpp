#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Parameters of one scan invocation
 */
struct ScanOptions
{
    std::string path;
    bool recursive = false;
    std::optional<std::vector<std::string>> include; // unset: every file passes
    std::optional<std::vector<std::string>> exclude; // unset: nothing is excluded
    bool dry_run = false;
    size_t max_threads = 1; // upper bound on concurrently scanned files
    std::string hash_mode = "file";
};
