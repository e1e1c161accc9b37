#include "batch/batch_driver.h"

#include "logging/logger.h"
#include "sanitize/file_rotator.h"

namespace mp3sanitize {

namespace fs = std::filesystem;

const char* outputModeToString(OutputMode mode) {
    switch (mode) {
    case OutputMode::Default:
        return "default";
    case OutputMode::File:
        return "file";
    case OutputMode::Directory:
        return "directory";
    case OutputMode::Replace:
        return "replace";
    default:
        return "unknown";
    }
}

fs::path deriveOutputPath(const fs::path& input, const OutputTarget& target) {
    switch (target.mode) {
    case OutputMode::File:
        return target.path;
    case OutputMode::Directory:
        return target.path / input.filename();
    case OutputMode::Replace:
        return scratchPathFor(input);
    case OutputMode::Default:
    default: {
        fs::path output = input;
        output.replace_filename(input.stem().string() + target.suffix +
                                input.extension().string());
        return output;
    }
    }
}

BatchDriver::BatchDriver(const SanitizeOptions& options, OutputTarget target, RunContext& ctx)
    : options_(options), target_(std::move(target)), ctx_(ctx) {}

BatchSummary BatchDriver::run(PathSource& paths) {
    BatchSummary summary;

    while (true) {
        if (ctx_.cancel.isRequested()) {
            summary.cancelled = true;
            break;
        }
        auto input = paths.next();
        if (!input) {
            break;
        }
        ++summary.found;

        const SanitizeResult result =
            sanitizeFile(*input, deriveOutputPath(*input, target_), options_, ctx_);
        if (result.code == ErrorCode::OK) {
            LOG_DEBUG("{}: {}", input->string(), sanitizeStatusToString(result.status));
        } else {
            LOG_DEBUG("{}: {} ({} error {} {})", input->string(),
                      sanitizeStatusToString(result.status), getErrorCategory(result.code),
                      errorCodeToHex(result.code), errorCodeToString(result.code));
        }
        switch (result.status) {
        case SanitizeStatus::Completed:
            ++summary.processed;
            break;
        case SanitizeStatus::Skipped:
            ++summary.skipped;
            break;
        case SanitizeStatus::Failed:
            ++summary.failed;
            break;
        case SanitizeStatus::Cancelled:
            summary.cancelled = true;
            break;
        }
        if (summary.cancelled) {
            break;
        }
    }

    summary.sourceError = paths.error();
    if (isFatalForBatch(summary.sourceError)) {
        LOG_ERROR("Input enumeration stopped ({}): {}", errorCodeToString(summary.sourceError),
                  paths.errorMessage());
    } else if (summary.sourceError != ErrorCode::OK) {
        LOG_WARN("Input enumeration incomplete ({}): {}", errorCodeToString(summary.sourceError),
                 paths.errorMessage());
    }
    if (summary.cancelled) {
        LOG_WARN("Interrupted; no further files started");
    }
    LOG_INFO("{} of {} files processed ({} skipped, {} failed)", summary.processed,
             summary.found, summary.skipped, summary.failed);
    return summary;
}

}  // namespace mp3sanitize
