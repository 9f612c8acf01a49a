#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

/**
 * @brief Emitted immediately before a candidate file is scanned
 */
struct FileStarted
{
    std::string path;
};

/**
 * @brief Emitted immediately after a candidate file is scanned
 */
struct FileCompleted
{
    std::string path;
    bool success = false;
    std::optional<std::string> error;     // set when success is false
    std::optional<uint64_t> size_bytes;   // set when success is true
};

using ProgressEvent = std::variant<FileStarted, FileCompleted>;

/**
 * @brief Observer interface for per-file scan progress
 *
 * Calls are serialized by the scanner, so implementations need no locking of
 * their own. For any one file, FileStarted is delivered before FileCompleted.
 */
class ProgressObserver
{
public:
    virtual ~ProgressObserver() = default;
    virtual void onProgress(const ProgressEvent &event) = 0;
};

/**
 * @brief Adapts a plain callable to the observer interface
 */
class CallbackProgressObserver : public ProgressObserver
{
public:
    using Callback = std::function<void(const ProgressEvent &)>;

    explicit CallbackProgressObserver(Callback callback) : callback_(std::move(callback)) {}

    void onProgress(const ProgressEvent &event) override
    {
        if (callback_)
        {
            callback_(event);
        }
    }

private:
    Callback callback_;
};
