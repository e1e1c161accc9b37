#pragma once

#include "batch/path_source.h"
#include "sanitize/run_context.h"
#include "sanitize/sanitize_options.h"
#include "sanitize/sanitize_pipeline.h"

#include <cstddef>
#include <filesystem>
#include <string>

namespace mp3sanitize {

enum class OutputMode {
    Default,    // X.mp3 -> X<suffix>.mp3 beside the input
    File,       // Single explicit output file
    Directory,  // dir/<input filename>
    Replace,    // X.mp3.tmp, rotated onto X.mp3
};

const char* outputModeToString(OutputMode mode);

struct OutputTarget {
    OutputMode mode = OutputMode::Default;
    std::filesystem::path path;  // File / Directory modes
    std::string suffix = ".new";
};

std::filesystem::path deriveOutputPath(const std::filesystem::path& input,
                                       const OutputTarget& target);

struct BatchSummary {
    std::size_t found = 0;
    std::size_t processed = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    bool cancelled = false;
    ErrorCode sourceError = ErrorCode::OK;

    // 0 when at least one file was processed, 1 otherwise
    int exitCode() const {
        return processed > 0 ? 0 : 1;
    }
};

/**
 * @brief Runs the sanitize pipeline over every path of a PathSource, in order.
 *
 * Per-file failures are counted and the batch continues. Once cancellation is requested no
 * further file is started. `options.replaceOriginal` must agree with OutputMode::Replace.
 */
class BatchDriver {
   public:
    BatchDriver(const SanitizeOptions& options, OutputTarget target, RunContext& ctx);

    BatchSummary run(PathSource& paths);

   private:
    const SanitizeOptions& options_;
    OutputTarget target_;
    RunContext& ctx_;
};

}  // namespace mp3sanitize
