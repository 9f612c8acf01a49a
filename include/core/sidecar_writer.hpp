#pragma once

#include "core/sidecar.hpp"
#include <string>

/**
 * @brief Crash-safe persistence of sidecars with bounded backup history
 *
 * Layout beside an original `photo.jpg`:
 *   photo.jpg.json       current sidecar
 *   photo.jpg.json.tmp   transient, only while a write is in flight
 *   photo.jpg.json.bak1  previous sidecar
 *   photo.jpg.json.bak2  the one before
 *   photo.jpg.json.bak3  oldest kept generation
 *
 * A reader of photo.jpg.json only ever sees a complete old or a complete new
 * document. The new content is fully written and fsync'ed to the .tmp file
 * before anything else is touched, then backups are rotated, then the .tmp is
 * renamed over the target. The current sidecar is hard-linked (or copied) to
 * .bak1 rather than moved, so the target path is never empty during rotation.
 */
class SidecarWriter
{
public:
    static constexpr int kBackupDepth = 3;

    static std::string sidecarPathFor(const std::string &original_path);
    static std::string tempPathFor(const std::string &original_path);

    /**
     * @param generation 1 (newest) to kBackupDepth (oldest)
     */
    static std::string backupPathFor(const std::string &original_path, int generation);

    /**
     * @brief Persist a sidecar beside its original file
     * @param original_path Path of the original media file
     * @param sidecar Record to write
     * @throws ScanError (ErrorKind::Io) on any write, sync or rename failure
     */
    static void write(const std::string &original_path, const Sidecar &sidecar);

    /**
     * @brief Load a sidecar document from disk
     * @param sidecar_path Path of the .json file (not the original)
     * @throws ScanError (ErrorKind::Io) if unreadable, (ErrorKind::Validation) if malformed
     */
    static Sidecar read(const std::string &sidecar_path);

    /**
     * @brief Shift bak2 -> bak3, bak1 -> bak2 and copy the current sidecar to bak1
     *
     * No-op when no current sidecar exists. The previous bak3 is discarded.
     * @throws ScanError (ErrorKind::Io) on failure; no rollback is attempted
     */
    static void rotateBackups(const std::string &original_path);

private:
    static void writeDurably(const std::string &path, const std::string &content);
    static void preserveAsBackup(const std::string &current_path, const std::string &backup_path);
    static void renameOrThrow(const std::string &from, const std::string &to);
    static void syncDirectory(const std::string &dir_path);
};
