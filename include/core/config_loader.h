#ifndef MP3SANITIZE_CONFIG_LOADER_H
#define MP3SANITIZE_CONFIG_LOADER_H

#include "logging/logger.h"
#include "sanitize/sanitize_options.h"

#include <filesystem>
#include <string>

namespace mp3sanitize {

struct AppConfig {
    logging::LogConfig logging;

    // Metadata categories removed from every file (default: RIFF wrapper only)
    DropSet drop;
    bool mangle = false;
    bool skipInvalidData = true;

    // Inserted before the extension for the default output path (X.mp3 -> X.new.mp3)
    std::string outputSuffix = ".new";

    // Library used by --itunes; empty = defaultLibraryPath()
    std::string libraryPath;
};

/**
 * @brief Load the JSON configuration file.
 *
 * `outConfig` is reset to defaults first. Missing keys and wrong-typed values keep their
 * defaults; unknown drop category names are ignored.
 *
 * @return false if the file is missing or cannot be parsed (defaults are kept)
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

}  // namespace mp3sanitize

#endif  // MP3SANITIZE_CONFIG_LOADER_H
