#pragma once

#include "core/scan_options.hpp"
#include <yaml-cpp/yaml.h>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Tool configuration loaded from YAML
 *
 * Example:
 *   log_level: "INFO"
 *   scan:
 *     max_threads: "auto"     # or a positive integer
 *     recursive: true
 *     include: ["*.jpg", "*.jpeg"]
 *     exclude: ["**\/.jozin/**"]
 *     hash_mode: "file"
 *
 * This is a plain value: load it once and pass it down.
 */
struct ScanConfig
{
    std::string log_level = "INFO";
    size_t max_threads = defaultMaxThreads();
    bool recursive = false;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::string hash_mode = "file";

    /// min(2 x hardware threads, 8), at least 1
    static size_t defaultMaxThreads();

    /**
     * @brief Load configuration from a YAML file
     * @return Defaults if the file does not exist
     * @throws ScanError (ErrorKind::User) on malformed YAML or invalid values
     */
    static ScanConfig loadFromFile(const std::string &file_path);

    /**
     * @throws ScanError (ErrorKind::User) on malformed YAML or invalid values
     */
    static ScanConfig fromYaml(const YAML::Node &root);

    /**
     * @brief Build scan options for a path, seeded from this configuration
     */
    ScanOptions scanOptionsFor(const std::string &path) const;
};
