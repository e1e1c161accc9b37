#include "sanitize/sanitize_pipeline.h"

#include "logging/logger.h"
#include "sanitize/file_metadata.h"
#include "sanitize/file_rotator.h"
#include "sanitize/frame_policy.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace mp3sanitize {

namespace fs = std::filesystem;

namespace {

// Output file that is closed and deleted on scope exit unless commit() was called.
class ScopedOutputFile {
   public:
    explicit ScopedOutputFile(const fs::path& path) : path_(path) {
        stream_.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
        opened_ = stream_.is_open();
    }

    ~ScopedOutputFile() {
        if (stream_.is_open()) {
            stream_.close();
        }
        if (opened_ && !committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
            if (ec) {
                LOG_WARN("Cannot remove partial output {}: {}", path_.string(), ec.message());
            }
        }
    }

    ScopedOutputFile(const ScopedOutputFile&) = delete;
    ScopedOutputFile& operator=(const ScopedOutputFile&) = delete;

    bool isOpen() const {
        return opened_;
    }

    std::ofstream& stream() {
        return stream_;
    }

    // Flush and close; false if any buffered write failed.
    bool close() {
        stream_.close();
        return !stream_.fail();
    }

    void commit() {
        committed_ = true;
    }

   private:
    fs::path path_;
    std::ofstream stream_;
    bool opened_ = false;
    bool committed_ = false;
};

SanitizeResult makeResult(SanitizeStatus status, ErrorCode code, std::string message) {
    SanitizeResult result;
    result.status = status;
    result.code = code;
    result.message = std::move(message);
    return result;
}

}  // namespace

const char* sanitizeStatusToString(SanitizeStatus status) {
    switch (status) {
    case SanitizeStatus::Completed:
        return "completed";
    case SanitizeStatus::Skipped:
        return "skipped";
    case SanitizeStatus::Failed:
        return "failed";
    case SanitizeStatus::Cancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

bool hasSupportedExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".mp3";
}

// ========== Frame loop ==========

SanitizeResult writeFrames(mpeg::FrameSource& source, std::ostream& out,
                           const SanitizeOptions& options, RunContext& ctx) {
    SanitizeResult result;
    SanitizeStats& stats = result.stats;

    while (auto frame = source.next()) {
        ++stats.framesRead;
        if (frame->type == mpeg::FrameType::Invalid) {
            stats.invalidBytes += frame->size();
        }

        const FrameDecision decision = decideFrame(*frame, options);
        LOG_TRACE("{} frame at {} ({} bytes): {}", mpeg::frameTypeToString(frame->type),
                  frame->offset, frame->size(), frameDecisionToString(decision));
        if (decision == FrameDecision::Drop) {
            ++stats.framesDropped;
            continue;
        }

        if (decision == FrameDecision::KeepMutated) {
            if (frame->canCommitHeader()) {
                frame->header.privateBit = ctx.bits.nextBit();
                frame->header.original = ctx.bits.nextBit();
            }
            if (frame->commitHeader()) {
                ++stats.framesMutated;
            } else {
                ++stats.framesMangleSkipped;
            }
        }

        out.write(reinterpret_cast<const char*>(frame->data.data()),
                  static_cast<std::streamsize>(frame->size()));
        if (!out) {
            result.status = SanitizeStatus::Failed;
            result.code = ErrorCode::OUTPUT_WRITE_FAILED;
            result.message = "write failed at input offset " + std::to_string(frame->offset);
            return result;
        }
        ++stats.framesWritten;
        stats.bytesWritten += frame->size();

        if (ctx.onFrameWritten) {
            ctx.onFrameWritten(*frame, static_cast<std::size_t>(stats.framesWritten));
        }
        if (ctx.cancel.isRequested()) {
            result.status = SanitizeStatus::Cancelled;
            result.code = ErrorCode::RUN_CANCELLED_MID_FILE;
            result.message = "cancelled after " + std::to_string(stats.framesWritten) + " frames";
            return result;
        }
    }

    if (source.failed()) {
        result.status = SanitizeStatus::Failed;
        result.code = ErrorCode::INPUT_READ_FAILED;
        result.message = "read error after " + std::to_string(stats.framesRead) + " frames";
        return result;
    }

    out.flush();
    if (!out) {
        result.status = SanitizeStatus::Failed;
        result.code = ErrorCode::OUTPUT_WRITE_FAILED;
        result.message = "flush failed";
    }
    return result;
}

// ========== Per-file pipeline ==========

SanitizeResult sanitizeFile(const fs::path& input, const fs::path& output,
                            const SanitizeOptions& options, RunContext& ctx) {
    if (!hasSupportedExtension(input)) {
        LOG_WARN("Skipping {}: not an .mp3 file", input.string());
        return makeResult(SanitizeStatus::Skipped, ErrorCode::INPUT_UNSUPPORTED_FORMAT,
                          "unsupported file extension");
    }

    // Only the path relevant to the selected mode guards against re-processing
    const fs::path guardPath = options.replaceOriginal ? backupPathFor(input) : output;
    std::error_code ec;
    if (fs::exists(guardPath, ec)) {
        LOG_WARN("Skipping {}: {} already exists", input.string(), guardPath.string());
        return makeResult(SanitizeStatus::Skipped, ErrorCode::OUTPUT_ALREADY_PROCESSED,
                          guardPath.string() + " already exists");
    }

    std::ifstream in(input, std::ios::binary);
    if (!in.is_open()) {
        std::string reason = std::strerror(errno);
        LOG_WARN("Cannot open {}: {}", input.string(), reason);
        return makeResult(SanitizeStatus::Failed, ErrorCode::INPUT_OPEN_FAILED,
                          "cannot open " + input.string() + ": " + reason);
    }

    ScopedOutputFile out(output);
    if (!out.isOpen()) {
        std::string reason = std::strerror(errno);
        LOG_WARN("Cannot create {}: {}", output.string(), reason);
        return makeResult(SanitizeStatus::Failed, ErrorCode::OUTPUT_OPEN_FAILED,
                          "cannot create " + output.string() + ": " + reason);
    }

    LOG_DEBUG("Sanitizing {} -> {}", input.string(), output.string());

    mpeg::FrameReader reader(in, options.classifierOptions());
    SanitizeResult result = writeFrames(reader, out.stream(), options, ctx);
    result.stats.invalidBytes += reader.skippedBytes();

    if (result.status == SanitizeStatus::Cancelled) {
        LOG_WARN("Interrupted while writing {}; discarding partial output", output.string());
        return result;
    }
    if (result.status == SanitizeStatus::Failed) {
        LOG_ERROR("{}: {} ({})", input.string(), result.message, errorCodeToString(result.code));
        return result;
    }
    if (!out.close()) {
        result.status = SanitizeStatus::Failed;
        result.code = ErrorCode::OUTPUT_WRITE_FAILED;
        result.message = "cannot finish writing " + output.string();
        LOG_ERROR("{}: {}", input.string(), result.message);
        return result;
    }
    in.close();

    std::string metadataError;
    if (!copyFileMetadata(input, output, ctx.xattrs, metadataError)) {
        LOG_WARN("{} ({}): {}", output.string(),
                 errorCodeToString(ErrorCode::OUTPUT_METADATA_COPY_FAILED), metadataError);
    }

    if (!options.replaceOriginal) {
        out.commit();
        LOG_INFO("Wrote {} ({} frames, {} dropped, {} bytes)", output.string(),
                 result.stats.framesWritten, result.stats.framesDropped,
                 result.stats.bytesWritten);
        return result;
    }

    const RotationResult rotation = rotateIntoPlace(input, output);
    if (rotation.ok() || rotation.code == ErrorCode::ROTATION_PARTIAL) {
        // Moved into place, or the only surviving copy of the sanitized data
        out.commit();
    }
    if (!rotation.ok()) {
        result.status = SanitizeStatus::Failed;
        result.code = rotation.code;
        result.message = rotation.message;
        LOG_ERROR("{}: {} ({})", input.string(), rotation.message,
                  errorCodeToString(rotation.code));
        return result;
    }

    LOG_INFO("Replaced {} ({} frames, {} dropped, {} bytes)", input.string(),
             result.stats.framesWritten, result.stats.framesDropped, result.stats.bytesWritten);
    return result;
}

}  // namespace mp3sanitize
