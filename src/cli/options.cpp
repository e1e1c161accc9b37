#include "cli/options.h"

#include <glob.h>
#include <iostream>

#ifndef MP3SANITIZE_VERSION
#define MP3SANITIZE_VERSION "0.1.0"
#endif

namespace mp3sanitize {

namespace {

constexpr const char* kLogLevelNames = "trace|debug|info|warn|error|critical|off";

bool applyEnvOverrides(Options& opt, ParseOptionsResult& result,
                       const std::function<const char*(const char*)>& getenvFn) {
    if (const char* config = getenvFn("MP3SANITIZE_CONFIG")) {
        opt.configPath = config;
    }
    if (const char* logLevel = getenvFn("MP3SANITIZE_LOG_LEVEL")) {
        if (!logging::isValidLevelName(logLevel)) {
            result.hasError = true;
            result.errorMessage =
                std::string("Unsupported MP3SANITIZE_LOG_LEVEL. Use one of: ") + kLogLevelNames;
            return false;
        }
        opt.logLevel = logging::stringToLevel(logLevel);
    }
    return true;
}

bool takesValue(std::string_view arg) {
    return arg == "-L" || arg == "--library" || arg == "-o" || arg == "--output" ||
           arg == "-d" || arg == "--output-dir" || arg == "-D" || arg == "--drop" ||
           arg == "-c" || arg == "--config" || arg == "--log-level";
}

}  // namespace

std::vector<std::string> expandFileArguments(const std::vector<std::string>& patterns) {
    std::vector<std::string> files;
    for (const auto& pattern : patterns) {
        glob_t matches{};
        const int rc = glob(pattern.c_str(), GLOB_NOCHECK, nullptr, &matches);
        if (rc == 0) {
            for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
                files.emplace_back(matches.gl_pathv[i]);
            }
        } else {
            files.push_back(pattern);
        }
        globfree(&matches);
    }
    return files;
}

void printHelp(std::string_view programName) {
    std::cout << "Usage: " << programName << " [options] FILE..." << std::endl
              << "       " << programName << " [options] --library <path> | --itunes" << std::endl
              << std::endl
              << "Strip metadata from MP3 files without re-encoding." << std::endl
              << std::endl
              << "Input (choose one):" << std::endl
              << "  FILE...                  MP3 files or glob patterns" << std::endl
              << "  -L, --library <path>     Read tracks from an iTunes-style Library.xml"
              << std::endl
              << "  -I, --itunes             Read tracks from the default iTunes library"
              << std::endl
              << std::endl
              << "Output (choose at most one, default X.mp3 -> X.new.mp3):" << std::endl
              << "  -o, --output <file>      Output file (single input only)" << std::endl
              << "  -d, --output-dir <dir>   Output directory" << std::endl
              << "  -r, --replace            Replace originals (keeps X.mp3.old backup)"
              << std::endl
              << std::endl
              << "Processing:" << std::endl
              << "  -D, --drop <list>        Comma list of riff,id3,ape,meta or \"none\" "
                 "(default: riff)"
              << std::endl
              << "  -m, --mangle             Randomize private/original header bits" << std::endl
              << "      --no-mangle          Keep header bits even if the config enables mangling"
              << std::endl
              << std::endl
              << "General:" << std::endl
              << "  -c, --config <path>      JSON config file" << std::endl
              << "      --log-level <level>  " << kLogLevelNames << std::endl
              << "  -h, --help               Show this help and exit" << std::endl
              << "  -V, --version            Show version and exit" << std::endl
              << std::endl
              << "Environment overrides: MP3SANITIZE_CONFIG, MP3SANITIZE_LOG_LEVEL" << std::endl
              << std::endl
              << "Exit status: 0 if at least one file was processed, 1 if none, 2 on usage error."
              << std::endl;
}

void printVersion(std::string_view programName) {
    std::cout << programName << " version " << MP3SANITIZE_VERSION << std::endl;
}

ParseOptionsResult parseOptions(int argc, char** argv, std::string_view programName,
                                const std::function<const char*(const char*)>& getenvFn) {
    Options opt{};
    ParseOptionsResult result{};

    auto fail = [&result](const std::string& message) {
        result.hasError = true;
        result.errorMessage = message;
        return result;
    };

    if (!applyEnvOverrides(opt, result, getenvFn)) {
        return result;
    }

    std::vector<std::string> patterns;
    bool useLibrary = false;
    bool outputFile = false;
    bool outputDir = false;
    bool replace = false;
    bool endOfOptions = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (endOfOptions || arg.empty() || arg[0] != '-' || arg == "-") {
            patterns.emplace_back(arg);
            continue;
        }
        if (takesValue(arg) && i + 1 >= argc) {
            return fail("Missing value for " + std::string(arg));
        }

        if (arg == "--") {
            endOfOptions = true;
        } else if (arg == "-h" || arg == "--help") {
            printHelp(programName);
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            printVersion(programName);
            result.showVersion = true;
            return result;
        } else if (arg == "-L" || arg == "--library") {
            useLibrary = true;
            opt.libraryPath = argv[++i];
        } else if (arg == "-I" || arg == "--itunes") {
            useLibrary = true;
        } else if (arg == "-o" || arg == "--output") {
            outputFile = true;
            opt.outputPath = argv[++i];
        } else if (arg == "-d" || arg == "--output-dir") {
            outputDir = true;
            opt.outputPath = argv[++i];
        } else if (arg == "-r" || arg == "--replace") {
            replace = true;
        } else if (arg == "-D" || arg == "--drop") {
            const std::string list = argv[++i];
            auto drop = parseDropList(list);
            if (!drop) {
                return fail("Invalid drop list '" + list +
                            "'. Use a comma list of riff,id3,ape,meta or \"none\"");
            }
            opt.drop = *drop;
        } else if (arg == "-m" || arg == "--mangle") {
            opt.mangle = true;
        } else if (arg == "--no-mangle") {
            opt.mangle = false;
        } else if (arg == "-c" || arg == "--config") {
            opt.configPath = argv[++i];
        } else if (arg == "--log-level") {
            const std::string level = argv[++i];
            if (!logging::isValidLevelName(level)) {
                return fail(std::string("Unsupported log level. Use one of: ") + kLogLevelNames);
            }
            opt.logLevel = logging::stringToLevel(level);
        } else {
            return fail(std::string("Unknown argument: ") + std::string(arg));
        }
    }

    if (useLibrary && !patterns.empty()) {
        return fail("FILE arguments cannot be combined with --library/--itunes");
    }
    if (static_cast<int>(outputFile) + static_cast<int>(outputDir) + static_cast<int>(replace) >
        1) {
        return fail("--output, --output-dir and --replace are mutually exclusive");
    }
    if (!useLibrary && patterns.empty()) {
        return fail("No input files");
    }

    if (useLibrary) {
        opt.inputSource = InputSource::Library;
    } else {
        opt.inputSource = InputSource::Files;
        opt.files = expandFileArguments(patterns);
    }

    if (outputFile) {
        if (opt.inputSource != InputSource::Files || opt.files.size() != 1) {
            return fail("--output requires exactly one input file");
        }
        opt.outputMode = OutputMode::File;
    } else if (outputDir) {
        opt.outputMode = OutputMode::Directory;
    } else if (replace) {
        opt.outputMode = OutputMode::Replace;
    }

    result.options = opt;
    return result;
}

}  // namespace mp3sanitize
