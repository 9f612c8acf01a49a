#include "core/file_scanner.hpp"
#include "core/file_utils.hpp"
#include "core/json_text.hpp"
#include "core/scan_config.hpp"
#include "core/scan_error.hpp"
#include "core/sidecar_cleaner.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace
{
    using Clock = std::chrono::system_clock;

    void printUsage(const char *program)
    {
        std::cout << "Sidecar Scanner - hashes media files and writes JSON sidecars beside them" << std::endl;
        std::cout << "Usage: " << program << " <command> <path> [options]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  scan        Scan a file or directory and write sidecars" << std::endl;
        std::cout << "  cleanup     Remove generated sidecars, backups and temporary files" << std::endl;
        std::cout << "Scan options:" << std::endl;
        std::cout << "  --recursive, -r       Descend into subdirectories" << std::endl;
        std::cout << "  --include PATTERNS    Comma-separated globs a file must match (e.g. \"*.jpg,*.png\")" << std::endl;
        std::cout << "  --exclude PATTERNS    Comma-separated globs to skip (e.g. \"**/.jozin/**\")" << std::endl;
        std::cout << "  --dry-run             Compute everything but write nothing" << std::endl;
        std::cout << "  --max-threads N       Files scanned in parallel (default: min(2 x CPU, 8))" << std::endl;
        std::cout << "  --hash-mode MODE      Only \"file\" is supported" << std::endl;
        std::cout << "Cleanup options:" << std::endl;
        std::cout << "  --recursive, -r       Descend into subdirectories" << std::endl;
        std::cout << "  --dry-run             List files without removing them" << std::endl;
        std::cout << "  --only-sidecars       Remove sidecars only" << std::endl;
        std::cout << "  --only-backups        Remove backups only" << std::endl;
        std::cout << "Common options:" << std::endl;
        std::cout << "  --json                JSON output (default when stdout is not a terminal)" << std::endl;
        std::cout << "  --config FILE         YAML configuration file" << std::endl;
        std::cout << "  --log-level LEVEL     TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --version             Print version" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    std::vector<std::string> parsePatterns(const std::string &option, const std::string &value)
    {
        std::vector<std::string> patterns;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ','))
        {
            auto first = item.find_first_not_of(" \t");
            if (first == std::string::npos)
            {
                continue;
            }
            auto last = item.find_last_not_of(" \t");
            patterns.push_back(item.substr(first, last - first + 1));
        }
        if (patterns.empty())
        {
            throw ScanError::user(option + " patterns cannot be empty");
        }
        return patterns;
    }

    size_t parseThreads(const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            long threads = std::stol(value, &consumed);
            if (consumed == value.size() && threads > 0)
            {
                return static_cast<size_t>(threads);
            }
        }
        catch (const std::logic_error &)
        {
            // reported below
        }
        throw ScanError::user("--max-threads must be a positive integer, got '" + value + "'");
    }

    std::string displayPath(const std::string &base, const std::string &path)
    {
        std::string relative = fs::path(path).lexically_relative(base).string();
        if (relative.empty() || relative == "." || relative.rfind("..", 0) == 0)
        {
            return path;
        }
        return relative;
    }

    // Prints "<path> ... <done_label>" or "<path> ... FAILED <error>" per finished file
    CallbackProgressObserver::Callback printCompleted(const std::string &base, const std::string &done_label)
    {
        return [base, done_label](const ProgressEvent &event)
        {
            const auto *completed = std::get_if<FileCompleted>(&event);
            if (!completed)
            {
                return;
            }
            std::cout << displayPath(base, completed->path) << " ... ";
            if (completed->success)
            {
                std::cout << done_label << std::endl;
            }
            else
            {
                std::cout << "FAILED " << completed->error.value_or("unknown error") << std::endl;
            }
        };
    }

    // Wraps a result with started_at, finished_at and duration_ms
    template <typename T>
    nlohmann::ordered_json operationResponse(const T &data, Clock::time_point started, Clock::time_point finished)
    {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(finished - started).count();
        return nlohmann::ordered_json{
            {"started_at", FileUtils::toRfc3339(started)},
            {"finished_at", FileUtils::toRfc3339(finished)},
            {"duration_ms", duration < 0 ? 0 : duration},
            {"data", data}};
    }

    struct CommandLine
    {
        std::string command;
        std::string path;
        bool recursive = false;
        bool recursive_set = false;
        std::optional<std::vector<std::string>> include;
        std::optional<std::vector<std::string>> exclude;
        bool dry_run = false;
        std::optional<size_t> max_threads;
        std::optional<std::string> hash_mode;
        bool only_sidecars = false;
        bool only_backups = false;
        bool json = false;
        std::optional<std::string> config_path;
        std::optional<std::string> log_level;
    };

    CommandLine parseArguments(int argc, char *argv[])
    {
        CommandLine cli;
        auto requireValue = [&](int &i, const std::string &option) -> std::string
        {
            if (i + 1 >= argc)
            {
                throw ScanError::user(option + " requires a value");
            }
            return argv[++i];
        };

        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--recursive" || arg == "-r")
            {
                cli.recursive = true;
                cli.recursive_set = true;
            }
            else if (arg == "--include")
                cli.include = parsePatterns("include", requireValue(i, arg));
            else if (arg == "--exclude")
                cli.exclude = parsePatterns("exclude", requireValue(i, arg));
            else if (arg == "--dry-run")
                cli.dry_run = true;
            else if (arg == "--max-threads")
                cli.max_threads = parseThreads(requireValue(i, arg));
            else if (arg == "--hash-mode")
                cli.hash_mode = requireValue(i, arg);
            else if (arg == "--only-sidecars")
                cli.only_sidecars = true;
            else if (arg == "--only-backups")
                cli.only_backups = true;
            else if (arg == "--json")
                cli.json = true;
            else if (arg == "--config")
                cli.config_path = requireValue(i, arg);
            else if (arg == "--log-level")
                cli.log_level = requireValue(i, arg);
            else if (!arg.empty() && arg[0] == '-')
                throw ScanError::user("Unknown option: " + arg);
            else if (cli.command.empty())
                cli.command = arg;
            else if (cli.path.empty())
                cli.path = arg;
            else
                throw ScanError::user("Unexpected argument: " + arg);
        }

        if (cli.command != "scan" && cli.command != "cleanup")
        {
            throw ScanError::user(cli.command.empty() ? "Missing command" : "Unknown command: " + cli.command);
        }
        if (cli.path.empty())
        {
            throw ScanError::user("Missing path argument");
        }
        if (cli.only_sidecars && cli.only_backups)
        {
            throw ScanError::user("--only-sidecars and --only-backups are mutually exclusive");
        }
        return cli;
    }

    int runScan(const CommandLine &cli, const ScanConfig &config, bool json_output)
    {
        ScanOptions options = config.scanOptionsFor(cli.path);
        if (cli.recursive_set)
            options.recursive = cli.recursive;
        if (cli.include)
            options.include = cli.include;
        if (cli.exclude)
            options.exclude = cli.exclude;
        if (cli.max_threads)
            options.max_threads = *cli.max_threads;
        if (cli.hash_mode)
            options.hash_mode = *cli.hash_mode;
        options.dry_run = cli.dry_run;

        auto started = Clock::now();
        CallbackProgressObserver console(printCompleted(cli.path, "ok"));
        FileScanner scanner(json_output ? nullptr : &console);
        ScanResult result = scanner.scanPath(options);
        auto finished = Clock::now();

        if (json_output)
        {
            std::cout << toJsonText(operationResponse(result, started, finished)) << std::endl;
        }
        else
        {
            double seconds = std::chrono::duration<double>(finished - started).count();
            std::cout << std::endl
                      << "Processed " << result.total_files << " files in "
                      << std::fixed << std::setprecision(2) << seconds << "s" << std::endl;
            std::cout << "  Successful: " << result.successful << std::endl;
            std::cout << "  Failed: " << result.failed << std::endl;
            std::cout << "  Skipped: " << result.skipped << std::endl;
        }
        return 0;
    }

    int runCleanup(const CommandLine &cli, const ScanConfig &config, bool json_output)
    {
        CleanupOptions options = CleanupOptions::all();
        if (cli.only_sidecars)
            options = CleanupOptions::sidecarsOnly();
        else if (cli.only_backups)
            options = CleanupOptions::backupsOnly();

        bool recursive = cli.recursive_set ? cli.recursive : config.recursive;

        auto started = Clock::now();
        CallbackProgressObserver console(printCompleted(cli.path, cli.dry_run ? "would remove" : "removed"));
        CleanupResult result = SidecarCleaner::cleanupPath(cli.path, recursive, options, cli.dry_run,
                                                           json_output ? nullptr : &console);
        auto finished = Clock::now();

        if (json_output)
        {
            std::cout << toJsonText(operationResponse(result, started, finished)) << std::endl;
        }
        else
        {
            std::cout << std::endl
                      << (cli.dry_run ? "Would remove " : "Removed ") << result.deleted << " of "
                      << result.total_files << " files (" << result.total_bytes << " bytes)" << std::endl;
        }
        return result.failed == 0 ? 0 : 2;
    }
}

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--version")
        {
            std::cout << "sidecar_scanner " << SidecarSchema::kProducerVersion << std::endl;
            return 0;
        }
    }

    try
    {
        CommandLine cli = parseArguments(argc, argv);

        ScanConfig config;
        if (cli.config_path)
        {
            std::error_code ec;
            if (!fs::exists(*cli.config_path, ec))
            {
                throw ScanError::user("Configuration file not found: " + *cli.config_path);
            }
            config = ScanConfig::loadFromFile(*cli.config_path);
        }
        if (cli.log_level)
        {
            if (!Logger::isValidLevel(*cli.log_level))
            {
                throw ScanError::user("Invalid log level: " + *cli.log_level);
            }
            config.log_level = *cli.log_level;
        }
        Logger::init(config.log_level);

        bool json_output = cli.json || !::isatty(STDOUT_FILENO);
        if (cli.command == "scan")
        {
            return runScan(cli, config, json_output);
        }
        return runCleanup(cli, config, json_output);
    }
    catch (const ScanError &e)
    {
        std::cerr << toJsonText(e.toJson()) << std::endl;
        return e.exitCode();
    }
    catch (const std::exception &e)
    {
        ScanError internal = ScanError::internal(e.what());
        std::cerr << toJsonText(internal.toJson()) << std::endl;
        return internal.exitCode();
    }
}
