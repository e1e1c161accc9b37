#include "sanitize/file_rotator.h"

#include "logging/logger.h"

#include <system_error>

namespace mp3sanitize {

namespace fs = std::filesystem;

fs::path backupPathFor(const fs::path& original) {
    fs::path backup = original;
    backup += ".old";
    return backup;
}

fs::path scratchPathFor(const fs::path& original) {
    fs::path scratch = original;
    scratch += ".tmp";
    return scratch;
}

RotationResult rotateIntoPlace(const fs::path& original, const fs::path& sanitized) {
    RotationResult result;
    const fs::path backup = backupPathFor(original);
    std::error_code ec;

    fs::rename(original, backup, ec);
    if (ec) {
        result.code = ErrorCode::ROTATION_BACKUP_FAILED;
        result.message = "cannot move " + original.string() + " to " + backup.string() + ": " +
                         ec.message();
        std::error_code removeEc;
        fs::remove(sanitized, removeEc);
        if (removeEc) {
            LOG_WARN("Cannot remove {}: {}", sanitized.string(), removeEc.message());
        }
        return result;
    }

    fs::rename(sanitized, original, ec);
    if (!ec) {
        LOG_DEBUG("Rotated {} (backup {})", original.string(), backup.string());
        return result;
    }

    const std::string replaceError = ec.message();
    std::error_code restoreEc;
    fs::rename(backup, original, restoreEc);
    if (!restoreEc) {
        result.code = ErrorCode::ROTATION_REPLACE_FAILED;
        result.message = "cannot move " + sanitized.string() + " to " + original.string() +
                         ": " + replaceError + " (original restored)";
        return result;
    }

    result.code = ErrorCode::ROTATION_PARTIAL;
    result.message = "cannot move " + sanitized.string() + " to " + original.string() + ": " +
                     replaceError + "; restoring backup also failed: " + restoreEc.message();
    LOG_CRITICAL("{} is missing. Input preserved as {}, sanitized copy at {}. Move one of them "
                 "to {} by hand.",
                 original.string(), backup.string(), sanitized.string(), original.string());
    return result;
}

}  // namespace mp3sanitize
