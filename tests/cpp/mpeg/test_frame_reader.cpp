/**
 * @file test_frame_reader.cpp
 * @brief Unit tests for MP3 stream classification
 */

#include "mp3_fixtures.h"
#include "mpeg/frame_reader.h"

#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace mp3sanitize::mpeg;
using mp3fixtures::Bytes;

namespace {

ClassifierOptions permissive() {
    ClassifierOptions options;
    options.skipInvalidData = false;
    return options;
}

struct Classified {
    std::vector<Frame> frames;
    std::uint64_t skippedBytes = 0;
    bool failed = false;
};

Classified classify(const Bytes& bytes, ClassifierOptions options = permissive()) {
    std::istringstream in(mp3fixtures::asString(bytes));
    FrameReader reader(in, options);
    Classified result;
    while (auto frame = reader.next()) {
        result.frames.push_back(std::move(*frame));
    }
    result.skippedBytes = reader.skippedBytes();
    result.failed = reader.failed();
    return result;
}

Bytes joined(const std::vector<Frame>& frames) {
    Bytes out;
    for (const auto& frame : frames) {
        out.insert(out.end(), frame.data.begin(), frame.data.end());
    }
    return out;
}

std::string layout(const std::vector<Frame>& frames) {
    std::string out;
    for (const auto& frame : frames) {
        if (!out.empty()) {
            out += ' ';
        }
        out += frame.isMetadata() ? metadataKindToString(frame.kind)
                                  : frameTypeToString(frame.type);
    }
    return out;
}

}  // namespace

// ============================================================
// Recognition
// ============================================================

TEST(FrameReader, EmptyStreamYieldsNothing) {
    auto result = classify({});
    EXPECT_TRUE(result.frames.empty());
    EXPECT_FALSE(result.failed);
}

TEST(FrameReader, PlainAudio) {
    const Bytes input = mp3fixtures::audioFrames(4);
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "audio audio audio audio");
    EXPECT_EQ(joined(result.frames), input);
    for (const auto& frame : result.frames) {
        EXPECT_EQ(frame.size(), mp3fixtures::kLayer3FrameSize);
        EXPECT_EQ(frame.header.layer, 3);
    }
    EXPECT_EQ(result.frames[2].offset, 2 * mp3fixtures::kLayer3FrameSize);
}

TEST(FrameReader, TagsAroundAudio) {
    const Bytes input = mp3fixtures::concat({mp3fixtures::id3v2Tag(100),
                                             mp3fixtures::audioFrames(3), mp3fixtures::apeTag(),
                                             mp3fixtures::id3v1Tag()});
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "id3 audio audio audio ape id3");
    EXPECT_EQ(joined(result.frames), input);
    EXPECT_EQ(result.frames[0].size(), 110u);
    EXPECT_EQ(result.frames[4].size(), mp3fixtures::apeTag().size());
    EXPECT_EQ(result.frames[5].size(), 128u);
}

TEST(FrameReader, Lyrics3AndEnhancedTagAtEnd) {
    const Bytes input =
        mp3fixtures::concat({mp3fixtures::audioFrames(2), mp3fixtures::lyrics3v2Block(),
                             mp3fixtures::id3v1EnhancedTag(), mp3fixtures::id3v1Tag()});
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "audio audio meta id3 id3");
    EXPECT_EQ(joined(result.frames), input);
}

TEST(FrameReader, AppendedId3v2WithFooter) {
    const Bytes input =
        mp3fixtures::concat({mp3fixtures::audioFrames(2), mp3fixtures::id3v2Tag(40, true)});
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "audio audio id3");
    EXPECT_EQ(result.frames[2].size(), 60u);
}

TEST(FrameReader, ApeTagAtStart) {
    const Bytes input = mp3fixtures::concat({mp3fixtures::apeTag(), mp3fixtures::audioFrames(2)});
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "ape audio audio");
    EXPECT_EQ(joined(result.frames), input);
}

TEST(FrameReader, RiffWrapperSplitsAroundAudio) {
    const Bytes audio = mp3fixtures::audioFrames(3);
    const Bytes input = mp3fixtures::riffWrap(audio);
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "riff audio audio audio riff");
    EXPECT_EQ(joined(result.frames), input);
    EXPECT_EQ(result.frames.front().size(), 44u);
    EXPECT_EQ(result.frames.back().size(), mp3fixtures::riffListChunk().size());
}

TEST(FrameReader, RiffWrapperWithoutTrailingChunks) {
    const Bytes input = mp3fixtures::riffWrap(mp3fixtures::audioFrames(2), false);
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "riff audio audio");
    EXPECT_EQ(joined(result.frames), input);
}

TEST(FrameReader, ProtectedFramesKeepCrcBytes) {
    const Bytes input = mp3fixtures::audioFrames(2, true);
    auto result = classify(input);

    ASSERT_EQ(result.frames.size(), 2u);
    EXPECT_TRUE(result.frames[0].header.hasCrc);
    EXPECT_EQ(joined(result.frames), input);
}

// ============================================================
// Unrecognized data
// ============================================================

TEST(FrameReader, GarbagePassedThroughAsInvalid) {
    const Bytes garbage(37, 0x00);
    const Bytes input = mp3fixtures::concat(
        {mp3fixtures::audioFrames(2), garbage, mp3fixtures::audioFrames(2)});
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "audio audio invalid audio audio");
    EXPECT_EQ(result.frames[2].data, garbage);
    EXPECT_EQ(result.frames[2].offset, 2 * mp3fixtures::kLayer3FrameSize);
    EXPECT_EQ(joined(result.frames), input);
    EXPECT_EQ(result.skippedBytes, 0u);
}

TEST(FrameReader, GarbageSkippedWhenConfigured) {
    const Bytes garbage(37, 0x00);
    const Bytes input = mp3fixtures::concat(
        {mp3fixtures::audioFrames(2), garbage, mp3fixtures::audioFrames(2)});
    ClassifierOptions options;
    options.skipInvalidData = true;
    auto result = classify(input, options);

    EXPECT_EQ(layout(result.frames), "audio audio audio audio");
    EXPECT_EQ(result.skippedBytes, 37u);
}

TEST(FrameReader, LoneSyncWordIsNotAudio) {
    // A single header not followed by another frame is not trusted
    Bytes input = mp3fixtures::audioFrame();
    input.resize(100);
    const Bytes tail(20, 0x00);
    input.insert(input.end(), tail.begin(), tail.end());
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "invalid");
    EXPECT_EQ(joined(result.frames), input);
}

TEST(FrameReader, LongInvalidRunsAreSplit) {
    const Bytes input(FrameReader::kMaxInvalidSpan + 10, 0x00);
    auto result = classify(input);

    ASSERT_EQ(result.frames.size(), 2u);
    EXPECT_EQ(result.frames[0].size(), FrameReader::kMaxInvalidSpan);
    EXPECT_EQ(result.frames[1].size(), 10u);
    EXPECT_EQ(result.frames[1].offset, FrameReader::kMaxInvalidSpan);
}

// ============================================================
// Truncated frames
// ============================================================

namespace {

Bytes truncatedFrame() {
    Bytes frame = mp3fixtures::audioFrame(9);
    frame.resize(200);
    return frame;
}

}  // namespace

TEST(FrameReader, TruncatedFrameDoesNotSwallowKeptTag) {
    const Bytes tag = mp3fixtures::id3v2Tag(300);
    const Bytes input =
        mp3fixtures::concat({mp3fixtures::audioFrames(3), truncatedFrame(), tag,
                             mp3fixtures::audioFrames(3), mp3fixtures::id3v1Tag()});
    auto result = classify(input);

    EXPECT_EQ(layout(result.frames), "audio audio audio invalid id3 audio audio audio id3");
    ASSERT_EQ(result.frames.size(), 9u);
    EXPECT_EQ(result.frames[3].data, truncatedFrame());
    EXPECT_EQ(result.frames[4].data, tag);
    EXPECT_EQ(joined(result.frames), input);
}

TEST(FrameReader, TruncatedFrameDoesNotLeakDroppedTag) {
    const Bytes input =
        mp3fixtures::concat({mp3fixtures::audioFrames(3), truncatedFrame(),
                             mp3fixtures::id3v2Tag(300), mp3fixtures::audioFrames(3),
                             mp3fixtures::id3v1Tag()});
    ClassifierOptions options;
    options.emitId3 = false;
    auto result = classify(input, options);

    EXPECT_EQ(layout(result.frames), "audio audio audio audio audio audio");
    EXPECT_EQ(joined(result.frames),
              mp3fixtures::concat({mp3fixtures::audioFrames(3), mp3fixtures::audioFrames(3)}));
    EXPECT_EQ(result.skippedBytes, 200u);
}

TEST(FrameReader, TruncatedFrameDoesNotSwallowRiffHeader) {
    const Bytes wrapped = mp3fixtures::audioFrames(2);
    const Bytes input = mp3fixtures::concat(
        {mp3fixtures::audioFrames(3), truncatedFrame(), mp3fixtures::riffWrap(wrapped)});
    ClassifierOptions options;
    options.emitRiff = false;
    auto result = classify(input, options);

    EXPECT_EQ(layout(result.frames), "audio audio audio audio audio");
    EXPECT_EQ(joined(result.frames), mp3fixtures::concat({mp3fixtures::audioFrames(3), wrapped}));
}

// ============================================================
// Category elision
// ============================================================

TEST(FrameReader, RestrictiveConfigurationElidesCategories) {
    const Bytes audio = mp3fixtures::audioFrames(2);
    const Bytes input = mp3fixtures::concat(
        {mp3fixtures::id3v2Tag(), mp3fixtures::riffWrap(audio), mp3fixtures::apeTag(),
         mp3fixtures::lyrics3v2Block(), mp3fixtures::id3v1Tag()});

    ClassifierOptions options = permissive();
    options.emitId3 = false;
    options.emitRiff = false;
    auto result = classify(input, options);

    EXPECT_EQ(layout(result.frames), "audio audio ape meta");

    options.emitApe = false;
    options.emitMeta = false;
    result = classify(input, options);
    EXPECT_EQ(layout(result.frames), "audio audio");
    EXPECT_EQ(joined(result.frames), audio);
}

TEST(FrameReader, OffsetsAreRelativeToStartPosition) {
    const Bytes input = mp3fixtures::audioFrames(2);
    std::string text = "prefix" + mp3fixtures::asString(input);
    std::istringstream in(text);
    in.seekg(6);

    FrameReader reader(in, permissive());
    auto first = reader.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->offset, 0u);
    EXPECT_EQ(reader.position(), mp3fixtures::kLayer3FrameSize);
}
