#pragma once

#include "mpeg/frame_header.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace mp3sanitize {
namespace mpeg {

enum class FrameType {
    Audio,     // MPEG audio frame
    Metadata,  // Non-audio container (see MetadataKind)
    Invalid,   // Bytes the classifier could not interpret
};

enum class MetadataKind {
    Riff,  // RIFF/WAVE wrapper around the audio
    Id3,   // ID3v2, ID3v1, Enhanced ID3v1
    Ape,   // APEv1/APEv2 tag
    Meta,  // Other metadata blocks (Lyrics3)
};

const char* frameTypeToString(FrameType type);
const char* metadataKindToString(MetadataKind kind);

// Accepts "riff", "id3", "ape", "meta" (case-insensitive)
std::optional<MetadataKind> parseMetadataKind(std::string_view name);

/**
 * @brief One contiguous span of the input stream.
 *
 * Frames arrive in stream order. For audio frames `header` may be changed and then
 * committed with commitHeader(), after which `data` reflects the new header.
 */
struct Frame {
    FrameType type = FrameType::Invalid;
    MetadataKind kind = MetadataKind::Meta;  // Metadata only
    std::uint64_t offset = 0;                // Position in the input stream
    FrameHeader header;                      // Audio only
    std::vector<std::uint8_t> data;

    bool isAudio() const {
        return type == FrameType::Audio;
    }
    bool isMetadata() const {
        return type == FrameType::Metadata;
    }
    std::size_t size() const {
        return data.size();
    }

    // Header mutation can be committed without breaking the frame (CRC can be kept valid).
    bool canCommitHeader() const;

    // Re-encode `header` into the raw bytes and refresh the Layer III CRC if present.
    // Returns false (bytes unchanged) when canCommitHeader() is false.
    bool commitHeader();
};

}  // namespace mpeg
}  // namespace mp3sanitize
