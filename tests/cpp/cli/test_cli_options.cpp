#include "cli/options.h"
#include "mp3_fixtures.h"

#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <unordered_map>
#include <vector>

using namespace mp3sanitize;

namespace {

std::vector<char*> makeArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return argv;
}

using EnvMap = std::unordered_map<std::string, std::string>;

std::function<const char*(const char*)> makeGetEnv(const EnvMap& env) {
    return [&env](const char* name) -> const char* {
        auto it = env.find(name ? std::string{name} : std::string{});
        if (it == env.end()) {
            return nullptr;
        }
        return it->second.c_str();
    };
}

const EnvMap kNoEnv{};

ParseOptionsResult parse(const std::vector<std::string>& args, const EnvMap& env = kNoEnv) {
    auto argv = makeArgv(args);
    return parseOptions(static_cast<int>(argv.size()), argv.data(), "mp3sanitize",
                        makeGetEnv(env));
}

}  // namespace

TEST(ParseOptions, FileArgumentsWithDefaults) {
    auto parsed = parse({"mp3sanitize", "/music/a.mp3", "/music/b.mp3"});

    ASSERT_FALSE(parsed.hasError) << parsed.errorMessage;
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->inputSource, InputSource::Files);
    EXPECT_EQ(parsed.options->files,
              (std::vector<std::string>{"/music/a.mp3", "/music/b.mp3"}));
    EXPECT_EQ(parsed.options->outputMode, OutputMode::Default);
    EXPECT_FALSE(parsed.options->drop.has_value());
    EXPECT_FALSE(parsed.options->mangle.has_value());
    EXPECT_TRUE(parsed.options->configPath.empty());
    EXPECT_FALSE(parsed.options->logLevel.has_value());
}

TEST(ParseOptions, ParsesProvidedArguments) {
    auto parsed = parse({"mp3sanitize", "-D", "id3,ape", "--mangle", "-d", "/tmp/out", "-c",
                         "/etc/mp3sanitize.json", "--log-level", "debug", "x.mp3"});

    ASSERT_FALSE(parsed.hasError) << parsed.errorMessage;
    ASSERT_TRUE(parsed.options.has_value());
    ASSERT_TRUE(parsed.options->drop.has_value());
    EXPECT_TRUE(parsed.options->drop->id3);
    EXPECT_TRUE(parsed.options->drop->ape);
    EXPECT_FALSE(parsed.options->drop->riff);
    EXPECT_EQ(parsed.options->mangle, true);
    EXPECT_EQ(parsed.options->outputMode, OutputMode::Directory);
    EXPECT_EQ(parsed.options->outputPath, "/tmp/out");
    EXPECT_EQ(parsed.options->configPath, "/etc/mp3sanitize.json");
    EXPECT_EQ(parsed.options->logLevel, logging::LogLevel::Debug);
}

TEST(ParseOptions, NoMangleOverridesEarlierFlag) {
    auto parsed = parse({"mp3sanitize", "--mangle", "--no-mangle", "x.mp3"});
    ASSERT_TRUE(parsed.options.has_value()) << parsed.errorMessage;
    EXPECT_EQ(parsed.options->mangle, false);

    auto enabled = parse({"mp3sanitize", "--no-mangle", "-m", "x.mp3"});
    ASSERT_TRUE(enabled.options.has_value()) << enabled.errorMessage;
    EXPECT_EQ(enabled.options->mangle, true);
}

TEST(ParseOptions, LibraryInput) {
    auto explicitPath = parse({"mp3sanitize", "--library", "/x/Library.xml", "--replace"});
    ASSERT_TRUE(explicitPath.options.has_value()) << explicitPath.errorMessage;
    EXPECT_EQ(explicitPath.options->inputSource, InputSource::Library);
    EXPECT_EQ(explicitPath.options->libraryPath, "/x/Library.xml");
    EXPECT_EQ(explicitPath.options->outputMode, OutputMode::Replace);

    auto itunes = parse({"mp3sanitize", "-I"});
    ASSERT_TRUE(itunes.options.has_value()) << itunes.errorMessage;
    EXPECT_EQ(itunes.options->inputSource, InputSource::Library);
    EXPECT_TRUE(itunes.options->libraryPath.empty());
}

TEST(ParseOptions, SingleOutputFile) {
    auto parsed = parse({"mp3sanitize", "-o", "clean.mp3", "in.mp3"});
    ASSERT_TRUE(parsed.options.has_value()) << parsed.errorMessage;
    EXPECT_EQ(parsed.options->outputMode, OutputMode::File);
    EXPECT_EQ(parsed.options->outputPath, "clean.mp3");

    auto two = parse({"mp3sanitize", "-o", "clean.mp3", "a.mp3", "b.mp3"});
    EXPECT_TRUE(two.hasError);
    EXPECT_EQ(two.errorMessage, "--output requires exactly one input file");
}

TEST(ParseOptions, DoubleDashEndsOptions) {
    auto parsed = parse({"mp3sanitize", "--", "-weird.mp3"});
    ASSERT_TRUE(parsed.options.has_value()) << parsed.errorMessage;
    EXPECT_EQ(parsed.options->files, (std::vector<std::string>{"-weird.mp3"}));
}

TEST(ParseOptions, HelpAndVersion) {
    auto help = parse({"mp3sanitize", "--help"});
    EXPECT_TRUE(help.showHelp);
    EXPECT_FALSE(help.options.has_value());

    auto version = parse({"mp3sanitize", "-V"});
    EXPECT_TRUE(version.showVersion);
    EXPECT_FALSE(version.options.has_value());
}

TEST(ParseOptions, UsageErrors) {
    auto none = parse({"mp3sanitize"});
    EXPECT_TRUE(none.hasError);
    EXPECT_EQ(none.errorMessage, "No input files");

    auto unknown = parse({"mp3sanitize", "--frobnicate", "a.mp3"});
    EXPECT_TRUE(unknown.hasError);
    EXPECT_EQ(unknown.errorMessage, "Unknown argument: --frobnicate");

    auto missing = parse({"mp3sanitize", "a.mp3", "--drop"});
    EXPECT_TRUE(missing.hasError);
    EXPECT_EQ(missing.errorMessage, "Missing value for --drop");

    auto mixed = parse({"mp3sanitize", "-L", "lib.xml", "a.mp3"});
    EXPECT_TRUE(mixed.hasError);
    EXPECT_EQ(mixed.errorMessage, "FILE arguments cannot be combined with --library/--itunes");

    auto outputs = parse({"mp3sanitize", "-r", "-d", "/tmp", "a.mp3"});
    EXPECT_TRUE(outputs.hasError);
    EXPECT_EQ(outputs.errorMessage, "--output, --output-dir and --replace are mutually exclusive");
}

TEST(ParseOptions, RejectsInvalidValues) {
    auto drop = parse({"mp3sanitize", "-D", "riff,vorbis", "a.mp3"});
    EXPECT_TRUE(drop.hasError);
    EXPECT_NE(drop.errorMessage.find("Invalid drop list 'riff,vorbis'"), std::string::npos);

    auto level = parse({"mp3sanitize", "--log-level", "loud", "a.mp3"});
    EXPECT_TRUE(level.hasError);
    EXPECT_NE(level.errorMessage.find("Unsupported log level"), std::string::npos);
}

TEST(ParseOptions, EnvironmentOverridesApplyBeforeFlags) {
    EnvMap env{{"MP3SANITIZE_CONFIG", "/env/config.json"}, {"MP3SANITIZE_LOG_LEVEL", "warn"}};

    auto fromEnv = parse({"mp3sanitize", "a.mp3"}, env);
    ASSERT_TRUE(fromEnv.options.has_value()) << fromEnv.errorMessage;
    EXPECT_EQ(fromEnv.options->configPath, "/env/config.json");
    EXPECT_EQ(fromEnv.options->logLevel, logging::LogLevel::Warn);

    auto flagsWin = parse({"mp3sanitize", "-c", "/cli.json", "--log-level", "trace", "a.mp3"}, env);
    ASSERT_TRUE(flagsWin.options.has_value()) << flagsWin.errorMessage;
    EXPECT_EQ(flagsWin.options->configPath, "/cli.json");
    EXPECT_EQ(flagsWin.options->logLevel, logging::LogLevel::Trace);
}

TEST(ParseOptions, RejectsInvalidEnvironmentLogLevel) {
    EnvMap env{{"MP3SANITIZE_LOG_LEVEL", "chatty"}};
    auto parsed = parse({"mp3sanitize", "a.mp3"}, env);

    EXPECT_TRUE(parsed.hasError);
    EXPECT_NE(parsed.errorMessage.find("MP3SANITIZE_LOG_LEVEL"), std::string::npos);
}

TEST(ExpandFileArguments, GlobsInOrderAndKeepsUnmatchedPatterns) {
    const auto dir = mp3fixtures::makeTestTempDir();
    mp3fixtures::writeFile(dir / "b.mp3", {1});
    mp3fixtures::writeFile(dir / "a.mp3", {1});
    mp3fixtures::writeFile(dir / "c.txt", {1});

    const auto files =
        expandFileArguments({(dir / "*.mp3").string(), (dir / "none*.mp3").string()});

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], (dir / "a.mp3").string());
    EXPECT_EQ(files[1], (dir / "b.mp3").string());
    EXPECT_EQ(files[2], (dir / "none*.mp3").string());

    std::filesystem::remove_all(dir);
}
