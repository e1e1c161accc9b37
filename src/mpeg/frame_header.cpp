#include "mpeg/frame_header.h"

namespace mp3sanitize {
namespace mpeg {

namespace {

// Bitrates in kbps, index 0 = free format (unsupported), index 15 = bad
constexpr std::uint16_t kBitratesV1[3][16] = {
    {0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448, 0},  // Layer I
    {0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384, 0},     // Layer II
    {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 0},      // Layer III
};

constexpr std::uint16_t kBitratesV2[3][16] = {
    {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256, 0},  // Layer I
    {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0},       // Layer II
    {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0},       // Layer III
};

constexpr std::uint32_t kSampleRatesV1[3] = {44100, 48000, 32000};
constexpr std::uint32_t kSampleRatesV2[3] = {22050, 24000, 16000};
constexpr std::uint32_t kSampleRatesV25[3] = {11025, 12000, 8000};

constexpr std::uint16_t kCrcPolynomial = 0x8005;

}  // namespace

std::uint32_t FrameHeader::bitrateKbps() const {
    if (bitrateIndex == 0 || bitrateIndex >= 15 || layer < 1 || layer > 3) {
        return 0;
    }
    const auto& table = (version == MpegVersion::Mpeg1) ? kBitratesV1 : kBitratesV2;
    return table[layer - 1][bitrateIndex];
}

std::uint32_t FrameHeader::sampleRate() const {
    if (sampleRateIndex >= 3) {
        return 0;
    }
    switch (version) {
    case MpegVersion::Mpeg1:
        return kSampleRatesV1[sampleRateIndex];
    case MpegVersion::Mpeg2:
        return kSampleRatesV2[sampleRateIndex];
    case MpegVersion::Mpeg25:
        return kSampleRatesV25[sampleRateIndex];
    }
    return 0;
}

std::size_t FrameHeader::frameLength() const {
    const std::uint32_t bitrate = bitrateKbps() * 1000;
    const std::uint32_t rate = sampleRate();
    if (bitrate == 0 || rate == 0) {
        return 0;
    }
    const std::uint32_t pad = padding ? 1 : 0;
    if (layer == 1) {
        return static_cast<std::size_t>((12 * bitrate / rate + pad) * 4);
    }
    if (layer == 3 && version != MpegVersion::Mpeg1) {
        return static_cast<std::size_t>(72 * bitrate / rate + pad);
    }
    return static_cast<std::size_t>(144 * bitrate / rate + pad);
}

std::size_t FrameHeader::sideInfoLength() const {
    if (layer != 3) {
        return 0;
    }
    const bool mono = channelMode == ChannelMode::Mono;
    if (version == MpegVersion::Mpeg1) {
        return mono ? 17 : 32;
    }
    return mono ? 9 : 17;
}

bool FrameHeader::sameStreamAs(const FrameHeader& other) const {
    return version == other.version && layer == other.layer &&
           sampleRateIndex == other.sampleRateIndex;
}

std::optional<FrameHeader> parseFrameHeader(const std::uint8_t* data, std::size_t size) {
    if (data == nullptr || size < kFrameHeaderSize) {
        return std::nullopt;
    }
    if (data[0] != 0xFF || (data[1] & 0xE0) != 0xE0) {
        return std::nullopt;
    }

    const std::uint8_t versionBits = (data[1] >> 3) & 0x03;
    const std::uint8_t layerBits = (data[1] >> 1) & 0x03;
    const std::uint8_t bitrateIndex = (data[2] >> 4) & 0x0F;
    const std::uint8_t sampleRateIndex = (data[2] >> 2) & 0x03;
    const std::uint8_t emphasis = data[3] & 0x03;

    if (versionBits == 0x01 || layerBits == 0x00 || bitrateIndex == 0x00 ||
        bitrateIndex == 0x0F || sampleRateIndex == 0x03 || emphasis == 0x02) {
        return std::nullopt;
    }

    FrameHeader header;
    header.version = static_cast<MpegVersion>(versionBits);
    header.layer = 4 - layerBits;
    header.hasCrc = (data[1] & 0x01) == 0;
    header.bitrateIndex = bitrateIndex;
    header.sampleRateIndex = sampleRateIndex;
    header.padding = (data[2] & 0x02) != 0;
    header.privateBit = (data[2] & 0x01) != 0;
    header.channelMode = static_cast<ChannelMode>((data[3] >> 6) & 0x03);
    header.modeExtension = (data[3] >> 4) & 0x03;
    header.copyright = (data[3] & 0x08) != 0;
    header.original = (data[3] & 0x04) != 0;
    header.emphasis = emphasis;
    return header;
}

void encodeFrameHeader(const FrameHeader& header, std::uint8_t* out) {
    const auto versionBits = static_cast<std::uint8_t>(header.version);
    const auto layerBits = static_cast<std::uint8_t>(4 - header.layer);

    out[0] = 0xFF;
    out[1] = static_cast<std::uint8_t>(0xE0 | (versionBits << 3) | ((layerBits & 0x03) << 1) |
                                       (header.hasCrc ? 0x00 : 0x01));
    out[2] = static_cast<std::uint8_t>(((header.bitrateIndex & 0x0F) << 4) |
                                       ((header.sampleRateIndex & 0x03) << 2) |
                                       (header.padding ? 0x02 : 0x00) |
                                       (header.privateBit ? 0x01 : 0x00));
    out[3] = static_cast<std::uint8_t>((static_cast<std::uint8_t>(header.channelMode) << 6) |
                                       ((header.modeExtension & 0x03) << 4) |
                                       (header.copyright ? 0x08 : 0x00) |
                                       (header.original ? 0x04 : 0x00) | (header.emphasis & 0x03));
}

std::uint16_t mpegCrc16(const std::uint8_t* data, std::size_t size, std::uint16_t crc) {
    for (std::size_t i = 0; i < size; ++i) {
        for (int bit = 7; bit >= 0; --bit) {
            const bool feedback = (((crc >> 15) ^ (data[i] >> bit)) & 0x01) != 0;
            crc = static_cast<std::uint16_t>(crc << 1);
            if (feedback) {
                crc ^= kCrcPolynomial;
            }
        }
    }
    return crc;
}

std::optional<std::uint16_t> computeLayer3Crc(const std::uint8_t* frame, std::size_t size) {
    auto header = parseFrameHeader(frame, size);
    if (!header || !header->hasCrc || header->layer != 3) {
        return std::nullopt;
    }
    const std::size_t sideInfo = header->sideInfoLength();
    if (size < kFrameHeaderSize + kCrcSize + sideInfo) {
        return std::nullopt;
    }
    std::uint16_t crc = mpegCrc16(frame + 2, 2);
    crc = mpegCrc16(frame + kFrameHeaderSize + kCrcSize, sideInfo, crc);
    return crc;
}

}  // namespace mpeg
}  // namespace mp3sanitize
