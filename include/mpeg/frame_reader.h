#pragma once

#include "mpeg/frame.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

namespace mp3sanitize {
namespace mpeg {

struct ClassifierOptions {
    bool skipInvalidData = true;  // Discard unrecognized bytes instead of emitting Invalid frames
    bool emitRiff = true;
    bool emitMeta = true;
    bool emitId3 = true;
    bool emitApe = true;
};

/**
 * @brief Finite, non-restartable producer of frames in stream order.
 */
class FrameSource {
   public:
    virtual ~FrameSource() = default;

    // Next frame, or std::nullopt once the stream is exhausted.
    virtual std::optional<Frame> next() = 0;

    // True if the underlying stream reported a read error.
    virtual bool failed() const = 0;
};

/**
 * @brief Classifies an MP3 byte stream into audio and metadata frames.
 *
 * Tags that live at the end of a file (APE, Lyrics3, ID3v1, appended ID3v2) are located by
 * probing the tail when the stream is seekable. With every emit flag set and
 * skipInvalidData off, the emitted frames concatenate back to the input byte for byte.
 */
class FrameReader : public FrameSource {
   public:
    FrameReader(std::istream& in, ClassifierOptions options = ClassifierOptions{});

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;

    std::optional<Frame> next() override;
    bool failed() const override;

    // Stream offset (relative to where reading started) of the next unconsumed byte.
    std::uint64_t position() const;

    // Unrecognized bytes discarded because of skipInvalidData.
    std::uint64_t skippedBytes() const {
        return skippedBytes_;
    }

    static constexpr std::size_t kMaxInvalidSpan = 64 * 1024;

   private:
    struct Span {
        std::uint64_t start = 0;
        std::uint64_t length = 0;
        MetadataKind kind = MetadataKind::Meta;
    };

    struct Candidate {
        FrameType type = FrameType::Invalid;
        MetadataKind kind = MetadataKind::Meta;
        std::size_t length = 0;
        std::uint64_t riffDataLength = 0;  // RIFF only
        std::uint64_t riffTotalLength = 0;
    };

    void scanTail();
    bool fill(std::size_t wanted);
    std::size_t available() const;
    const std::uint8_t* cursor() const;
    std::uint64_t regionLimit() const;

    std::optional<Candidate> recognize();
    std::optional<Candidate> recognizeRiff(std::uint64_t room);
    bool confirmAudio(const FrameHeader& header, std::size_t length, std::uint64_t room);

    Frame take(const Candidate& candidate);
    Frame takeSpan(MetadataKind kind, std::size_t length);
    void consumeInvalidByte();
    Frame flushInvalid();
    bool emits(MetadataKind kind) const;

    std::istream& in_;
    ClassifierOptions options_;

    std::vector<std::uint8_t> buffer_;
    std::size_t cursor_ = 0;
    std::uint64_t bufferOffset_ = 0;
    bool eof_ = false;
    bool failed_ = false;

    std::optional<std::uint64_t> streamEnd_;
    std::vector<Span> tailSpans_;
    std::size_t nextTailSpan_ = 0;

    std::optional<std::uint64_t> riffDataEnd_;
    std::optional<std::uint64_t> riffEnd_;

    bool lastWasAudio_ = false;
    std::vector<std::uint8_t> pendingInvalid_;
    std::uint64_t pendingInvalidOffset_ = 0;
    std::uint64_t skippedBytes_ = 0;
};

}  // namespace mpeg
}  // namespace mp3sanitize
