#include "core/sidecar_writer.hpp"
#include "core/file_utils.hpp"
#include "core/scan_error.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace
{
    std::string errnoMessage(const std::string &what, const std::string &path)
    {
        return what + " " + path + ": " + std::strerror(errno);
    }

    void removeQuietly(const std::string &path)
    {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec)
        {
            Logger::warn("Could not remove temporary file " + path + ": " + ec.message());
        }
    }
}

std::string SidecarWriter::sidecarPathFor(const std::string &original_path)
{
    return original_path + ".json";
}

std::string SidecarWriter::tempPathFor(const std::string &original_path)
{
    return sidecarPathFor(original_path) + ".tmp";
}

std::string SidecarWriter::backupPathFor(const std::string &original_path, int generation)
{
    return sidecarPathFor(original_path) + ".bak" + std::to_string(generation);
}

void SidecarWriter::write(const std::string &original_path, const Sidecar &sidecar)
{
    const std::string target = sidecarPathFor(original_path);
    const std::string tmp = tempPathFor(original_path);

    writeDurably(tmp, sidecar.toJsonString());

    try
    {
        rotateBackups(original_path);
        renameOrThrow(tmp, target);
    }
    catch (const ScanError &)
    {
        removeQuietly(tmp);
        throw;
    }

    syncDirectory(fs::path(target).parent_path().string());
    Logger::debug("Sidecar written: " + target);
}

Sidecar SidecarWriter::read(const std::string &sidecar_path)
{
    std::ifstream file(sidecar_path, std::ios::binary);
    if (!file.is_open())
    {
        throw ScanError::io(errnoMessage("Cannot open sidecar", sidecar_path));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad())
    {
        throw ScanError::io("Read error on sidecar: " + sidecar_path);
    }
    return Sidecar::fromJsonString(ss.str());
}

void SidecarWriter::rotateBackups(const std::string &original_path)
{
    const std::string current = sidecarPathFor(original_path);
    std::error_code ec;
    if (!fs::exists(current, ec))
    {
        return;
    }

    for (int generation = kBackupDepth - 1; generation >= 1; --generation)
    {
        const std::string from = backupPathFor(original_path, generation);
        if (fs::exists(from, ec))
        {
            // rename() replaces the older generation atomically
            renameOrThrow(from, backupPathFor(original_path, generation + 1));
        }
    }

    preserveAsBackup(current, backupPathFor(original_path, 1));
    Logger::trace("Rotated backups for " + current);
}

void SidecarWriter::writeDurably(const std::string &path, const std::string &content)
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        throw ScanError::io(errnoMessage("Cannot create", path));
    }

    const char *data = content.data();
    size_t remaining = content.size();
    while (remaining > 0)
    {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            std::string message = errnoMessage("Write failed on", path);
            ::close(fd);
            removeQuietly(path);
            throw ScanError::io(message);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0)
    {
        std::string message = errnoMessage("fsync failed on", path);
        ::close(fd);
        removeQuietly(path);
        throw ScanError::io(message);
    }
    if (::close(fd) != 0)
    {
        std::string message = errnoMessage("close failed on", path);
        removeQuietly(path);
        throw ScanError::io(message);
    }
}

void SidecarWriter::preserveAsBackup(const std::string &current_path, const std::string &backup_path)
{
    // bak1 was just moved to bak2, but a crashed earlier run may have left one
    std::error_code ec;
    fs::remove(backup_path, ec);

    if (::link(current_path.c_str(), backup_path.c_str()) == 0)
    {
        return;
    }
    if (errno != EPERM && errno != ENOTSUP && errno != EXDEV && errno != EMLINK && errno != ENOSYS)
    {
        throw ScanError::io(errnoMessage("Cannot link backup for", current_path));
    }

    // Filesystem without hard links: fall back to a copy
    fs::copy_file(current_path, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw ScanError::io("Cannot copy " + current_path + " to " + backup_path + ": " + ec.message());
    }
}

void SidecarWriter::renameOrThrow(const std::string &from, const std::string &to)
{
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec)
    {
        throw ScanError::io("Cannot rename " + from + " to " + to + ": " + ec.message());
    }
}

void SidecarWriter::syncDirectory(const std::string &dir_path)
{
    const std::string dir = dir_path.empty() ? "." : dir_path;
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
    {
        Logger::warn(errnoMessage("Cannot open directory for sync", dir));
        return;
    }
    if (::fsync(fd) != 0)
    {
        Logger::warn(errnoMessage("Directory fsync failed for", dir));
    }
    ::close(fd);
}
