#pragma once

#include "core/error_codes.h"

#include <filesystem>
#include <string>

namespace mp3sanitize {

// X.mp3 -> X.mp3.old
std::filesystem::path backupPathFor(const std::filesystem::path& original);

// X.mp3 -> X.mp3.tmp
std::filesystem::path scratchPathFor(const std::filesystem::path& original);

struct RotationResult {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const {
        return code == ErrorCode::OK;
    }
};

/**
 * @brief Replace `original` with the fully written `sanitized` file, keeping a backup.
 *
 * Two same-filesystem renames: original -> original.old, then sanitized -> original.
 * - First rename fails: `sanitized` is removed, nothing else changes (ROTATION_BACKUP_FAILED).
 * - Second rename fails: the backup is moved back (ROTATION_REPLACE_FAILED); if that fails
 *   too, `original` is missing and `original.old` holds the untouched input
 *   (ROTATION_PARTIAL).
 * A process killed between the two renames leaves the same ROTATION_PARTIAL state. The
 * existing backup then makes every later run skip the file until the operator moves
 * `original.old` back (or moves the sanitized `.tmp` into place).
 */
RotationResult rotateIntoPlace(const std::filesystem::path& original,
                               const std::filesystem::path& sanitized);

}  // namespace mp3sanitize
