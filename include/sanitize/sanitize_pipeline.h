#pragma once

#include "core/error_codes.h"
#include "mpeg/frame_reader.h"
#include "sanitize/run_context.h"
#include "sanitize/sanitize_options.h"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

namespace mp3sanitize {

enum class SanitizeStatus {
    Completed,  // Output written (and rotated into place in replace mode)
    Skipped,    // Unsupported format or already processed; nothing touched
    Failed,     // I/O or rotation failure; no partial output left behind
    Cancelled,  // Interrupted between frames; partial output removed
};

const char* sanitizeStatusToString(SanitizeStatus status);

struct SanitizeStats {
    std::uint64_t framesRead = 0;
    std::uint64_t framesWritten = 0;
    std::uint64_t framesDropped = 0;
    std::uint64_t framesMutated = 0;
    std::uint64_t framesMangleSkipped = 0;  // Protected Layer I/II frames left as they were
    std::uint64_t invalidBytes = 0;         // Skipped plus passed-through unrecognized bytes
    std::uint64_t bytesWritten = 0;
};

struct SanitizeResult {
    SanitizeStatus status = SanitizeStatus::Completed;
    ErrorCode code = ErrorCode::OK;
    std::string message;
    SanitizeStats stats;

    bool completed() const {
        return status == SanitizeStatus::Completed;
    }
};

/**
 * @brief Apply the frame policy to every frame of `source`, writing survivors to `out`.
 *
 * Checks the cancellation flag after each frame write. Returns Completed, Cancelled
 * (RUN_CANCELLED_MID_FILE), or Failed (OUTPUT_WRITE_FAILED / INPUT_READ_FAILED). Does not
 * touch the filesystem.
 */
SanitizeResult writeFrames(mpeg::FrameSource& source, std::ostream& out,
                           const SanitizeOptions& options, RunContext& ctx);

/**
 * @brief Sanitize one file.
 *
 * @param input  Source file; must carry a case-insensitive ".mp3" extension
 * @param output Destination path. In replace mode this is the scratch file that gets
 *               rotated onto `input` (see rotateIntoPlace()).
 *
 * Skips without any I/O when the extension is wrong, when `output` exists, or in replace
 * mode when `input.old` exists. On every non-completed exit the output file is removed and
 * `input` is left untouched.
 */
SanitizeResult sanitizeFile(const std::filesystem::path& input,
                            const std::filesystem::path& output, const SanitizeOptions& options,
                            RunContext& ctx);

// Case-insensitive ".mp3" extension check
bool hasSupportedExtension(const std::filesystem::path& path);

}  // namespace mp3sanitize
