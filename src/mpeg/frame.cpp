#include "mpeg/frame.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace mp3sanitize {
namespace mpeg {

const char* frameTypeToString(FrameType type) {
    switch (type) {
    case FrameType::Audio:
        return "audio";
    case FrameType::Metadata:
        return "metadata";
    case FrameType::Invalid:
    default:
        return "invalid";
    }
}

const char* metadataKindToString(MetadataKind kind) {
    switch (kind) {
    case MetadataKind::Riff:
        return "riff";
    case MetadataKind::Id3:
        return "id3";
    case MetadataKind::Ape:
        return "ape";
    case MetadataKind::Meta:
    default:
        return "meta";
    }
}

std::optional<MetadataKind> parseMetadataKind(std::string_view name) {
    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "riff") {
        return MetadataKind::Riff;
    }
    if (lower == "id3") {
        return MetadataKind::Id3;
    }
    if (lower == "ape") {
        return MetadataKind::Ape;
    }
    if (lower == "meta") {
        return MetadataKind::Meta;
    }
    return std::nullopt;
}

bool Frame::canCommitHeader() const {
    if (type != FrameType::Audio || data.size() < kFrameHeaderSize) {
        return false;
    }
    if (!header.hasCrc) {
        return true;
    }
    // Layer I/II CRC coverage depends on allocation data that is not decoded here
    return header.layer == 3 &&
           data.size() >= kFrameHeaderSize + kCrcSize + header.sideInfoLength();
}

bool Frame::commitHeader() {
    if (!canCommitHeader()) {
        return false;
    }
    encodeFrameHeader(header, data.data());
    if (header.hasCrc) {
        auto crc = computeLayer3Crc(data.data(), data.size());
        if (!crc) {
            return false;
        }
        data[kFrameHeaderSize] = static_cast<std::uint8_t>(*crc >> 8);
        data[kFrameHeaderSize + 1] = static_cast<std::uint8_t>(*crc & 0xFF);
    }
    return true;
}

}  // namespace mpeg
}  // namespace mp3sanitize
