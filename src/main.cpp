#include "batch/batch_driver.h"
#include "batch/path_source.h"
#include "cli/options.h"
#include "core/cancellation.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "library/itunes_library.h"
#include "logging/logger.h"
#include "sanitize/bit_source.h"
#include "sanitize/file_metadata.h"
#include "sanitize/sanitize_options.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitUsage = 2;

std::unique_ptr<mp3sanitize::PathSource> makePathSource(const mp3sanitize::Options& opt,
                                                        const mp3sanitize::AppConfig& config) {
    using mp3sanitize::InputSource;
    if (opt.inputSource == InputSource::Files) {
        std::vector<std::filesystem::path> paths(opt.files.begin(), opt.files.end());
        return std::make_unique<mp3sanitize::VectorPathSource>(std::move(paths));
    }

    std::filesystem::path library = opt.libraryPath;
    if (library.empty()) {
        library = config.libraryPath.empty() ? mp3sanitize::defaultLibraryPath()
                                             : std::filesystem::path(config.libraryPath);
    }
    LOG_INFO("Reading tracks from {}", library.string());
    return std::make_unique<mp3sanitize::ItunesLibraryReader>(library);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace mp3sanitize;

    const std::string_view programName =
        (argc > 0 && argv[0] != nullptr) ? std::string_view{argv[0]} : "mp3sanitize";

    auto parsed = parseOptions(argc, argv, programName);
    if (parsed.showHelp || parsed.showVersion) {
        return EXIT_SUCCESS;
    }
    if (parsed.hasError || !parsed.options) {
        std::cerr << programName << ": " << parsed.errorMessage << std::endl
                  << "Try '" << programName << " --help' for more information." << std::endl;
        return kExitUsage;
    }
    const Options opt = *parsed.options;

    // ========== Configuration ==========
    AppConfig config;
    if (!opt.configPath.empty() && !loadAppConfig(opt.configPath, config, true)) {
        std::cerr << programName << ": "
                  << errorCodeToString(ErrorCode::VALIDATION_INVALID_CONFIG) << ": "
                  << opt.configPath << std::endl;
        return kExitUsage;
    }
    if (opt.logLevel) {
        config.logging.level = *opt.logLevel;
    }
    if (!logging::initialize(config.logging)) {
        std::cerr << programName << ": cannot initialize logging" << std::endl;
    }

    const DropSet drop = opt.drop ? *opt.drop : config.drop;
    const SanitizeOptions options =
        makeSanitizeOptions(drop, opt.mangle.value_or(config.mangle),
                            opt.outputMode == OutputMode::Replace, config.skipInvalidData);

    OutputTarget target;
    target.mode = opt.outputMode;
    target.path = opt.outputPath;
    target.suffix = config.outputSuffix;

    LOG_DEBUG("drop={} mangle={} output={} skipInvalidData={}", dropSetToString(drop),
              options.mangle, outputModeToString(target.mode), options.skipInvalidData);

    // ========== Run ==========
    CancellationFlag cancel;
    if (!installInterruptHandler(cancel)) {
        LOG_WARN("Cannot install interrupt handler; Ctrl-C will abort without cleanup");
    }

    RandomBitSource bits;
    RunContext ctx(cancel, bits, detectXattrSupport());
    LOG_DEBUG("Extended attributes: {}", xattrSupportToString(ctx.xattrs));

    auto paths = makePathSource(opt, config);
    BatchDriver driver(options, target, ctx);
    const BatchSummary summary = driver.run(*paths);

    if (cancel.isRequested()) {
        LOG_WARN("Stopped by signal {}", lastInterruptSignal());
    }
    removeInterruptHandler();
    logging::shutdown();
    return summary.exitCode();
}
