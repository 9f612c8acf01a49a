#include "core/scan_error.hpp"

namespace
{
    std::string prefixFor(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::User:
            return "User error: ";
        case ErrorKind::Io:
            return "I/O error: ";
        case ErrorKind::Validation:
            return "Validation error: ";
        case ErrorKind::Internal:
            return "Internal error: ";
        }
        return "Error: ";
    }
}

ScanError::ScanError(ErrorKind kind, const std::string &message)
    : std::runtime_error(prefixFor(kind) + message), kind_(kind), message_(message)
{
}

int ScanError::exitCode() const
{
    switch (kind_)
    {
    case ErrorKind::User:
        return 1;
    case ErrorKind::Io:
        return 2;
    case ErrorKind::Validation:
        return 3;
    case ErrorKind::Internal:
        return 4;
    }
    return 4;
}

nlohmann::json ScanError::toJson() const
{
    return nlohmann::json{
        {"kind", kindToString(kind_)},
        {"message", message_},
        {"exit_code", exitCode()}};
}

std::string ScanError::kindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::User:
        return "user";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Internal:
        return "internal";
    }
    return "internal";
}
