#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace mp3sanitize {
namespace mpeg {

constexpr std::size_t kFrameHeaderSize = 4;
constexpr std::size_t kCrcSize = 2;

enum class MpegVersion : std::uint8_t {
    Mpeg25 = 0,  // 00
    Mpeg2 = 2,   // 10
    Mpeg1 = 3,   // 11
};

enum class ChannelMode : std::uint8_t {
    Stereo = 0,
    JointStereo = 1,
    DualChannel = 2,
    Mono = 3,
};

/**
 * @brief Decoded MPEG audio frame header.
 *
 * Bit layout (AAAAAAAA AAABBCCD EEEEFFGH IIJJKLMM):
 *   A sync, B version, C layer, D protection (0 = CRC follows), E bitrate index,
 *   F sample rate index, G padding, H private, I channel mode, J mode extension,
 *   K copyright, L original, M emphasis.
 */
struct FrameHeader {
    MpegVersion version = MpegVersion::Mpeg1;
    int layer = 3;  // 1, 2 or 3
    bool hasCrc = false;
    std::uint8_t bitrateIndex = 0;
    std::uint8_t sampleRateIndex = 0;
    bool padding = false;
    bool privateBit = false;
    ChannelMode channelMode = ChannelMode::Stereo;
    std::uint8_t modeExtension = 0;
    bool copyright = false;
    bool original = false;
    std::uint8_t emphasis = 0;

    std::uint32_t bitrateKbps() const;
    std::uint32_t sampleRate() const;

    // Total frame length in bytes, header included.
    std::size_t frameLength() const;

    // Layer III side information length; 0 for Layers I and II.
    std::size_t sideInfoLength() const;

    // True when both headers describe the same stream (version, layer, sample rate).
    bool sameStreamAs(const FrameHeader& other) const;
};

/**
 * @brief Parse a frame header from at least four bytes.
 * @return std::nullopt on missing sync or any reserved/free/bad field value
 */
std::optional<FrameHeader> parseFrameHeader(const std::uint8_t* data, std::size_t size);

/**
 * @brief Encode a header back into its four wire bytes.
 */
void encodeFrameHeader(const FrameHeader& header, std::uint8_t* out);

/**
 * @brief MPEG audio CRC-16 (polynomial 0x8005, MSB first).
 */
std::uint16_t mpegCrc16(const std::uint8_t* data, std::size_t size, std::uint16_t crc = 0xFFFF);

/**
 * @brief Compute the CRC protecting a Layer III frame.
 *
 * Covers header bytes 2..3 and the side information that follows the CRC field.
 * @return std::nullopt if the frame is not a CRC-protected Layer III frame or is too short
 */
std::optional<std::uint16_t> computeLayer3Crc(const std::uint8_t* frame, std::size_t size);

}  // namespace mpeg
}  // namespace mp3sanitize
