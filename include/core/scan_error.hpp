#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @brief Error categories surfaced by scan and cleanup operations
 *
 * Each kind maps to a process exit code used by the command line front end.
 */
enum class ErrorKind
{
    User,       // Invalid caller-supplied parameters (exit code 1)
    Io,         // Filesystem access failures (exit code 2)
    Validation, // Path or document unsuitable for the operation (exit code 3)
    Internal    // Bug in our own logic (exit code 4)
};

class ScanError : public std::runtime_error
{
public:
    ScanError(ErrorKind kind, const std::string &message);

    static ScanError user(const std::string &message) { return ScanError(ErrorKind::User, message); }
    static ScanError io(const std::string &message) { return ScanError(ErrorKind::Io, message); }
    static ScanError validation(const std::string &message) { return ScanError(ErrorKind::Validation, message); }
    static ScanError internal(const std::string &message) { return ScanError(ErrorKind::Internal, message); }

    ErrorKind kind() const { return kind_; }

    int exitCode() const;

    // {"kind": "io", "message": "...", "exit_code": 2}
    nlohmann::json toJson() const;

    static std::string kindToString(ErrorKind kind);

private:
    ErrorKind kind_;
    std::string message_;
};
