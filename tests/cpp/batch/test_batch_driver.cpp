/**
 * @file test_batch_driver.cpp
 * @brief Tests for output path derivation and batch iteration
 */

#include "batch/batch_driver.h"
#include "mp3_fixtures.h"

#include <filesystem>
#include <gtest/gtest.h>
#include <vector>

namespace fs = std::filesystem;
using namespace mp3sanitize;
using mp3fixtures::Bytes;

// ============================================================
// deriveOutputPath
// ============================================================

TEST(DeriveOutputPath, DefaultInsertsSuffixBeforeExtension) {
    OutputTarget target;
    EXPECT_EQ(deriveOutputPath("/music/song.mp3", target), fs::path("/music/song.new.mp3"));

    target.suffix = "-clean";
    EXPECT_EQ(deriveOutputPath("/music/song.MP3", target), fs::path("/music/song-clean.MP3"));
}

TEST(DeriveOutputPath, ExplicitFile) {
    OutputTarget target;
    target.mode = OutputMode::File;
    target.path = "/tmp/out.mp3";
    EXPECT_EQ(deriveOutputPath("/music/song.mp3", target), fs::path("/tmp/out.mp3"));
}

TEST(DeriveOutputPath, DirectoryKeepsFilename) {
    OutputTarget target;
    target.mode = OutputMode::Directory;
    target.path = "/tmp/clean";
    EXPECT_EQ(deriveOutputPath("/music/a/song.mp3", target), fs::path("/tmp/clean/song.mp3"));
}

TEST(DeriveOutputPath, ReplaceUsesScratchFile) {
    OutputTarget target;
    target.mode = OutputMode::Replace;
    EXPECT_EQ(deriveOutputPath("/music/song.mp3", target), fs::path("/music/song.mp3.tmp"));
}

TEST(DeriveOutputPath, ModeNames) {
    EXPECT_STREQ(outputModeToString(OutputMode::Default), "default");
    EXPECT_STREQ(outputModeToString(OutputMode::File), "file");
    EXPECT_STREQ(outputModeToString(OutputMode::Directory), "directory");
    EXPECT_STREQ(outputModeToString(OutputMode::Replace), "replace");
}

// ============================================================
// BatchDriver
// ============================================================

class BatchDriverTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    Bytes content;
    CancellationFlag cancel;
    RandomBitSource bits{7};
    RunContext ctx{cancel, bits};
    SanitizeOptions options = makeSanitizeOptions(DropSet{}, false, false);

    void SetUp() override {
        tempDir = mp3fixtures::makeTestTempDir();
        content = mp3fixtures::concat({mp3fixtures::id3v2Tag(), mp3fixtures::audioFrames(3)});
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    fs::path makeInput(const std::string& name) {
        const fs::path path = tempDir / name;
        mp3fixtures::writeFile(path, content);
        return path;
    }
};

TEST_F(BatchDriverTest, ProcessesEveryFile) {
    VectorPathSource paths({makeInput("a.mp3"), makeInput("b.mp3")});
    BatchDriver driver(options, OutputTarget{}, ctx);

    const BatchSummary summary = driver.run(paths);

    EXPECT_EQ(summary.found, 2u);
    EXPECT_EQ(summary.processed, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_FALSE(summary.cancelled);
    EXPECT_EQ(summary.exitCode(), 0);
    EXPECT_EQ(mp3fixtures::readFile(tempDir / "a.new.mp3"), content);
    EXPECT_EQ(mp3fixtures::readFile(tempDir / "b.new.mp3"), content);
}

TEST_F(BatchDriverTest, FailedFileDoesNotStopBatch) {
    VectorPathSource paths({makeInput("a.mp3"), tempDir / "missing.mp3", makeInput("c.mp3")});
    BatchDriver driver(options, OutputTarget{}, ctx);

    const BatchSummary summary = driver.run(paths);

    EXPECT_EQ(summary.found, 3u);
    EXPECT_EQ(summary.processed, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.exitCode(), 0);
    EXPECT_TRUE(fs::exists(tempDir / "c.new.mp3"));
}

TEST_F(BatchDriverTest, NothingProcessedExitsWithOne) {
    VectorPathSource paths({tempDir / "x.mp3", tempDir / "notes.txt"});
    mp3fixtures::writeFile(tempDir / "notes.txt", {1, 2});
    BatchDriver driver(options, OutputTarget{}, ctx);

    const BatchSummary summary = driver.run(paths);

    EXPECT_EQ(summary.processed, 0u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.exitCode(), 1);
}

TEST_F(BatchDriverTest, EmptySourceExitsWithOne) {
    VectorPathSource paths({});
    BatchDriver driver(options, OutputTarget{}, ctx);

    const BatchSummary summary = driver.run(paths);

    EXPECT_EQ(summary.found, 0u);
    EXPECT_EQ(summary.exitCode(), 1);
}

TEST_F(BatchDriverTest, CancelledBeforeStartTouchesNothing) {
    VectorPathSource paths({makeInput("a.mp3")});
    cancel.request();
    BatchDriver driver(options, OutputTarget{}, ctx);

    const BatchSummary summary = driver.run(paths);

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.found, 0u);
    EXPECT_FALSE(fs::exists(tempDir / "a.new.mp3"));
}

TEST_F(BatchDriverTest, CancelMidFileStopsBatch) {
    VectorPathSource paths({makeInput("a.mp3"), makeInput("b.mp3")});
    ctx.onFrameWritten = [this](const mpeg::Frame&, std::size_t written) {
        if (written == 2) {
            cancel.request();
        }
    };
    BatchDriver driver(options, OutputTarget{}, ctx);

    const BatchSummary summary = driver.run(paths);

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.found, 1u);
    EXPECT_EQ(summary.processed, 0u);
    EXPECT_EQ(summary.exitCode(), 1);
    EXPECT_FALSE(fs::exists(tempDir / "a.new.mp3"));
    EXPECT_FALSE(fs::exists(tempDir / "b.new.mp3"));
}

TEST_F(BatchDriverTest, DirectoryModeWritesIntoTarget) {
    const fs::path outDir = tempDir / "clean";
    fs::create_directories(outDir);
    VectorPathSource paths({makeInput("a.mp3")});
    OutputTarget target;
    target.mode = OutputMode::Directory;
    target.path = outDir;
    BatchDriver driver(options, target, ctx);

    const BatchSummary summary = driver.run(paths);

    EXPECT_EQ(summary.processed, 1u);
    EXPECT_EQ(mp3fixtures::readFile(outDir / "a.mp3"), content);
}

TEST_F(BatchDriverTest, ReplaceModeSecondRunSkips) {
    const fs::path input = makeInput("a.mp3");
    const SanitizeOptions replace = makeSanitizeOptions(DropSet{}, false, true);
    OutputTarget target;
    target.mode = OutputMode::Replace;

    VectorPathSource first({input});
    EXPECT_EQ(BatchDriver(replace, target, ctx).run(first).processed, 1u);

    VectorPathSource second({input});
    const BatchSummary summary = BatchDriver(replace, target, ctx).run(second);
    EXPECT_EQ(summary.processed, 0u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_TRUE(fs::exists(tempDir / "a.mp3.old"));
}
