#include "core/scan_config.hpp"
#include "core/scan_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>

namespace
{
    constexpr size_t kMaxDefaultThreads = 8;

    std::vector<std::string> readPatternList(const YAML::Node &node, const std::string &key)
    {
        if (!node.IsSequence())
        {
            throw ScanError::user("Configuration key scan." + key + " must be a list of glob patterns");
        }
        std::vector<std::string> patterns;
        for (const auto &item : node)
        {
            auto pattern = item.as<std::string>();
            if (pattern.empty())
            {
                throw ScanError::user("Configuration key scan." + key + " contains an empty pattern");
            }
            patterns.push_back(pattern);
        }
        return patterns;
    }
}

size_t ScanConfig::defaultMaxThreads()
{
    size_t hardware = std::thread::hardware_concurrency();
    if (hardware == 0)
    {
        hardware = 1;
    }
    return std::max<size_t>(1, std::min(hardware * 2, kMaxDefaultThreads));
}

ScanConfig ScanConfig::loadFromFile(const std::string &file_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec))
    {
        Logger::debug("Configuration file not found, using defaults: " + file_path);
        return ScanConfig();
    }

    YAML::Node root;
    try
    {
        root = YAML::LoadFile(file_path);
    }
    catch (const YAML::Exception &e)
    {
        throw ScanError::user("Error loading config " + file_path + ": " + e.what());
    }

    ScanConfig config = fromYaml(root);
    Logger::info("Configuration loaded from: " + file_path);
    return config;
}

ScanConfig ScanConfig::fromYaml(const YAML::Node &root)
{
    ScanConfig config;
    if (!root || root.IsNull())
    {
        return config;
    }
    if (!root.IsMap())
    {
        throw ScanError::user("Configuration root must be a mapping");
    }

    try
    {
        if (root["log_level"])
        {
            config.log_level = root["log_level"].as<std::string>();
            if (!Logger::isValidLevel(config.log_level))
            {
                throw ScanError::user("Invalid log_level: " + config.log_level);
            }
        }

        const YAML::Node scan = root["scan"];
        if (!scan)
        {
            return config;
        }

        if (scan["max_threads"])
        {
            auto raw = scan["max_threads"].as<std::string>();
            if (raw != "auto")
            {
                int value = scan["max_threads"].as<int>();
                if (value <= 0)
                {
                    throw ScanError::user("scan.max_threads must be greater than 0, got " + raw);
                }
                config.max_threads = static_cast<size_t>(value);
            }
        }
        if (scan["recursive"])
        {
            config.recursive = scan["recursive"].as<bool>();
        }
        if (scan["include"])
        {
            config.include = readPatternList(scan["include"], "include");
        }
        if (scan["exclude"])
        {
            config.exclude = readPatternList(scan["exclude"], "exclude");
        }
        if (scan["hash_mode"])
        {
            config.hash_mode = scan["hash_mode"].as<std::string>();
        }
    }
    catch (const YAML::Exception &e)
    {
        throw ScanError::user(std::string("Invalid configuration value: ") + e.what());
    }
    return config;
}

ScanOptions ScanConfig::scanOptionsFor(const std::string &path) const
{
    ScanOptions options;
    options.path = path;
    options.recursive = recursive;
    if (!include.empty())
    {
        options.include = include;
    }
    if (!exclude.empty())
    {
        options.exclude = exclude;
    }
    options.max_threads = max_threads;
    options.hash_mode = hash_mode;
    return options;
}
