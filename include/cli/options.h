#pragma once

#include "batch/batch_driver.h"
#include "logging/logger.h"
#include "sanitize/sanitize_options.h"

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mp3sanitize {

enum class InputSource {
    Files,    // FILE arguments (glob-expanded)
    Library,  // iTunes-style Library.xml
};

struct Options {
    InputSource inputSource{InputSource::Files};
    std::vector<std::string> files;
    std::string libraryPath;  // Empty with InputSource::Library = config/default library

    OutputMode outputMode{OutputMode::Default};
    std::string outputPath;  // File / Directory modes

    // Unset values fall back to the config file
    std::optional<DropSet> drop;
    std::optional<bool> mangle;
    std::string configPath;
    std::optional<logging::LogLevel> logLevel;
};

struct ParseOptionsResult {
    std::optional<Options> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

// glob(3) each pattern in order; a pattern without matches is kept as given
std::vector<std::string> expandFileArguments(const std::vector<std::string>& patterns);

ParseOptionsResult parseOptions(
    int argc, char** argv, std::string_view programName,
    const std::function<const char*(const char*)>& getenvFn = ::getenv);
void printHelp(std::string_view programName);
void printVersion(std::string_view programName);

}  // namespace mp3sanitize
