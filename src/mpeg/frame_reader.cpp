#include "mpeg/frame_reader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cstring>
#include <limits>

namespace mp3sanitize {
namespace mpeg {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr std::size_t kCompactThreshold = 256 * 1024;

constexpr std::size_t kId3v2HeaderSize = 10;
constexpr std::size_t kId3v1Size = 128;
constexpr std::size_t kId3v1EnhancedSize = 227;
constexpr std::size_t kApeFooterSize = 32;
constexpr std::uint32_t kApeFlagHasHeader = 1u << 31;
constexpr std::uint32_t kApeFlagIsHeader = 1u << 29;
constexpr std::size_t kLyrics3v1MaxSize = 5100;
constexpr std::size_t kLyrics3v2TrailerSize = 15;  // 6-digit size + "LYRICS200"
constexpr std::size_t kRiffMaxHeaderScan = 1024 * 1024;
constexpr std::size_t kContainerPrefixSize = 12;  // Longest fixed container prefix checked

bool hasSignature(const std::uint8_t* p, std::size_t avail, const char* sig) {
    const std::size_t len = std::strlen(sig);
    return avail >= len && std::memcmp(p, sig, len) == 0;
}

std::uint32_t readLe32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

// Synchsafe integer: 4 bytes of 7 bits each
std::optional<std::uint32_t> readSynchsafe(const std::uint8_t* p) {
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        if (p[i] >= 0x80) {
            return std::nullopt;
        }
        value = (value << 7) | p[i];
    }
    return value;
}

// Total length of an ID3v2 tag from its 10-byte header (or footer) block
std::optional<std::size_t> id3v2Length(const std::uint8_t* p) {
    if (p[3] == 0xFF || p[4] == 0xFF) {
        return std::nullopt;
    }
    auto size = readSynchsafe(p + 6);
    if (!size) {
        return std::nullopt;
    }
    const bool hasFooter = (p[5] & 0x10) != 0;
    return kId3v2HeaderSize + *size + (hasFooter ? kId3v2HeaderSize : 0);
}

bool startsWithTagSignature(const std::uint8_t* p, std::size_t avail) {
    return hasSignature(p, avail, "ID3") || hasSignature(p, avail, "TAG") ||
           hasSignature(p, avail, "APETAGEX") || hasSignature(p, avail, "LYRICSBEGIN") ||
           hasSignature(p, avail, "RIFF");
}

// Container headers specific enough that they never occur by chance inside audio data
bool startsContainer(const std::uint8_t* p, std::size_t avail) {
    if (hasSignature(p, avail, "ID3")) {
        return avail >= kId3v2HeaderSize && id3v2Length(p).has_value();
    }
    if (hasSignature(p, avail, "RIFF")) {
        return avail >= 12 &&
               (std::memcmp(p + 8, "WAVE", 4) == 0 || std::memcmp(p + 8, "RMP3", 4) == 0);
    }
    return hasSignature(p, avail, "APETAGEX") || hasSignature(p, avail, "LYRICSBEGIN");
}

// True if a container header begins inside p[1..length)
bool containerInside(const std::uint8_t* p, std::size_t length, std::size_t avail) {
    for (std::size_t i = 1; i < length; ++i) {
        if ((p[i] == 'I' || p[i] == 'R' || p[i] == 'A' || p[i] == 'L') &&
            startsContainer(p + i, avail - i)) {
            return true;
        }
    }
    return false;
}

}  // namespace

FrameReader::FrameReader(std::istream& in, ClassifierOptions options)
    : in_(in), options_(options) {
    scanTail();
}

bool FrameReader::failed() const {
    return failed_;
}

std::uint64_t FrameReader::position() const {
    return bufferOffset_ + cursor_;
}

std::size_t FrameReader::available() const {
    return buffer_.size() - cursor_;
}

const std::uint8_t* FrameReader::cursor() const {
    return buffer_.data() + cursor_;
}

bool FrameReader::fill(std::size_t wanted) {
    while (available() < wanted && !eof_) {
        if (cursor_ >= kCompactThreshold) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_));
            bufferOffset_ += cursor_;
            cursor_ = 0;
        }
        const std::size_t request = std::max(kReadChunk, wanted - available());
        const std::size_t oldSize = buffer_.size();
        buffer_.resize(oldSize + request);
        in_.read(reinterpret_cast<char*>(buffer_.data() + oldSize),
                 static_cast<std::streamsize>(request));
        const auto got = static_cast<std::size_t>(in_.gcount());
        buffer_.resize(oldSize + got);
        if (got < request) {
            if (in_.bad()) {
                failed_ = true;
                LOG_ERROR("Read error at offset {}", bufferOffset_ + buffer_.size());
            }
            eof_ = true;
        }
    }
    return available() >= wanted;
}

void FrameReader::scanTail() {
    const std::streampos start = in_.tellg();
    if (start < 0) {
        in_.clear();
        return;
    }
    in_.seekg(0, std::ios::end);
    const std::streampos end = in_.tellg();
    if (!in_ || end < start) {
        in_.clear();
        in_.seekg(start);
        return;
    }
    const auto size = static_cast<std::uint64_t>(end - start);
    streamEnd_ = size;

    std::vector<std::uint8_t> buf;
    auto readAt = [&](std::uint64_t offset, std::size_t count) {
        if (offset + count > size) {
            return false;
        }
        buf.resize(count);
        in_.clear();
        in_.seekg(start + static_cast<std::streamoff>(offset));
        in_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(count));
        return static_cast<std::size_t>(in_.gcount()) == count;
    };

    std::vector<Span> spans;
    std::uint64_t tailEnd = size;

    // Tags are stacked from the end: [audio][APE|Lyrics3|ID3v2 ...][ID3v1]
    for (int guard = 0; guard < 16; ++guard) {
        if (tailEnd >= kId3v1Size && readAt(tailEnd - kId3v1Size, 3) &&
            std::memcmp(buf.data(), "TAG", 3) == 0) {
            spans.push_back({tailEnd - kId3v1Size, kId3v1Size, MetadataKind::Id3});
            tailEnd -= kId3v1Size;
            if (tailEnd >= kId3v1EnhancedSize && readAt(tailEnd - kId3v1EnhancedSize, 4) &&
                std::memcmp(buf.data(), "TAG+", 4) == 0) {
                spans.push_back({tailEnd - kId3v1EnhancedSize, kId3v1EnhancedSize,
                                 MetadataKind::Id3});
                tailEnd -= kId3v1EnhancedSize;
            }
            continue;
        }

        if (tailEnd >= kApeFooterSize && readAt(tailEnd - kApeFooterSize, kApeFooterSize) &&
            std::memcmp(buf.data(), "APETAGEX", 8) == 0) {
            const std::uint32_t tagSize = readLe32(buf.data() + 12);
            const std::uint32_t flags = readLe32(buf.data() + 20);
            if ((flags & kApeFlagIsHeader) == 0 && tagSize >= kApeFooterSize) {
                const std::uint64_t total =
                    static_cast<std::uint64_t>(tagSize) +
                    ((flags & kApeFlagHasHeader) != 0 ? kApeFooterSize : 0);
                if (total <= tailEnd) {
                    spans.push_back({tailEnd - total, total, MetadataKind::Ape});
                    tailEnd -= total;
                    continue;
                }
            }
            break;
        }

        if (tailEnd >= kLyrics3v2TrailerSize && readAt(tailEnd - kLyrics3v2TrailerSize,
                                                      kLyrics3v2TrailerSize) &&
            std::memcmp(buf.data() + 6, "LYRICS200", 9) == 0) {
            std::uint64_t lyricsSize = 0;
            bool digits = true;
            for (int i = 0; i < 6; ++i) {
                if (buf[i] < '0' || buf[i] > '9') {
                    digits = false;
                    break;
                }
                lyricsSize = lyricsSize * 10 + static_cast<std::uint64_t>(buf[i] - '0');
            }
            const std::uint64_t total = lyricsSize + kLyrics3v2TrailerSize;
            if (digits && total <= tailEnd && readAt(tailEnd - total, 11) &&
                std::memcmp(buf.data(), "LYRICSBEGIN", 11) == 0) {
                spans.push_back({tailEnd - total, total, MetadataKind::Meta});
                tailEnd -= total;
                continue;
            }
            break;
        }

        if (tailEnd >= 20 && readAt(tailEnd - 9, 9) &&
            std::memcmp(buf.data(), "LYRICSEND", 9) == 0) {
            const std::uint64_t window = std::min<std::uint64_t>(tailEnd, kLyrics3v1MaxSize + 20);
            if (!readAt(tailEnd - window, static_cast<std::size_t>(window))) {
                break;
            }
            static const char kBegin[] = "LYRICSBEGIN";
            auto it = std::search(buf.begin(), buf.end(), kBegin, kBegin + 11);
            if (it == buf.end()) {
                break;
            }
            const std::uint64_t total = window - static_cast<std::uint64_t>(it - buf.begin());
            spans.push_back({tailEnd - total, total, MetadataKind::Meta});
            tailEnd -= total;
            continue;
        }

        if (tailEnd >= 2 * kId3v2HeaderSize &&
            readAt(tailEnd - kId3v2HeaderSize, kId3v2HeaderSize) && std::memcmp(buf.data(), "3DI", 3) == 0) {
            auto total = id3v2Length(buf.data());
            if (total && *total <= tailEnd && readAt(tailEnd - *total, 3) &&
                std::memcmp(buf.data(), "ID3", 3) == 0) {
                spans.push_back({tailEnd - *total, *total, MetadataKind::Id3});
                tailEnd -= *total;
                continue;
            }
            break;
        }
        break;
    }

    in_.clear();
    in_.seekg(start);

    std::reverse(spans.begin(), spans.end());
    tailSpans_ = std::move(spans);
    for (const auto& span : tailSpans_) {
        LOG_TRACE("Trailing {} tag at {} ({} bytes)", metadataKindToString(span.kind), span.start,
                  span.length);
    }
}

std::uint64_t FrameReader::regionLimit() const {
    std::uint64_t limit =
        streamEnd_ ? *streamEnd_ : std::numeric_limits<std::uint64_t>::max();
    if (nextTailSpan_ < tailSpans_.size()) {
        limit = std::min(limit, tailSpans_[nextTailSpan_].start);
    }
    if (riffDataEnd_ && position() < *riffDataEnd_) {
        limit = std::min(limit, *riffDataEnd_);
    }
    return limit;
}

bool FrameReader::emits(MetadataKind kind) const {
    switch (kind) {
    case MetadataKind::Riff:
        return options_.emitRiff;
    case MetadataKind::Id3:
        return options_.emitId3;
    case MetadataKind::Ape:
        return options_.emitApe;
    case MetadataKind::Meta:
    default:
        return options_.emitMeta;
    }
}

std::optional<Frame> FrameReader::next() {
    while (true) {
        const std::uint64_t pos = position();

        if (nextTailSpan_ < tailSpans_.size() && pos >= tailSpans_[nextTailSpan_].start) {
            if (!pendingInvalid_.empty()) {
                return flushInvalid();
            }
            const Span span = tailSpans_[nextTailSpan_++];
            if (pos != span.start || !fill(static_cast<std::size_t>(span.length))) {
                // Stream changed under us; classify the bytes normally
                continue;
            }
            lastWasAudio_ = false;
            Frame frame = takeSpan(span.kind, static_cast<std::size_t>(span.length));
            if (emits(span.kind)) {
                return frame;
            }
            continue;
        }

        if (riffDataEnd_ && pos >= *riffDataEnd_) {
            if (!pendingInvalid_.empty()) {
                return flushInvalid();
            }
            riffDataEnd_.reset();
            const std::optional<std::uint64_t> riffEnd = riffEnd_;
            riffEnd_.reset();
            const std::uint64_t end = riffEnd ? std::min(*riffEnd, regionLimit()) : pos;
            if (end > pos) {
                fill(static_cast<std::size_t>(end - pos));
                const std::size_t length =
                    std::min<std::size_t>(static_cast<std::size_t>(end - pos), available());
                if (length > 0) {
                    lastWasAudio_ = false;
                    Frame frame = takeSpan(MetadataKind::Riff, length);
                    if (emits(MetadataKind::Riff)) {
                        return frame;
                    }
                }
            }
            continue;
        }

        if (!fill(1)) {
            if (!pendingInvalid_.empty()) {
                return flushInvalid();
            }
            return std::nullopt;
        }

        auto candidate = recognize();
        if (candidate) {
            if (!pendingInvalid_.empty()) {
                return flushInvalid();
            }
            lastWasAudio_ = candidate->type == FrameType::Audio;
            Frame frame = take(*candidate);
            if (frame.isAudio() || emits(frame.kind)) {
                return frame;
            }
            continue;
        }

        lastWasAudio_ = false;
        consumeInvalidByte();
        if (pendingInvalid_.size() >= kMaxInvalidSpan) {
            return flushInvalid();
        }
    }
}

std::optional<FrameReader::Candidate> FrameReader::recognize() {
    const std::uint64_t pos = position();
    const std::uint64_t limit = regionLimit();
    if (limit <= pos) {
        return std::nullopt;
    }
    const std::uint64_t room = limit - pos;
    auto fits = [&](std::uint64_t length) {
        return length <= room && fill(static_cast<std::size_t>(length));
    };

    fill(kApeFooterSize);
    const std::size_t avail = available();

    if (hasSignature(cursor(), avail, "ID3") && avail >= kId3v2HeaderSize) {
        auto length = id3v2Length(cursor());
        if (length && fits(*length)) {
            return Candidate{FrameType::Metadata, MetadataKind::Id3, *length};
        }
    }

    if (hasSignature(cursor(), avail, "TAG+") && fits(kId3v1EnhancedSize)) {
        return Candidate{FrameType::Metadata, MetadataKind::Id3, kId3v1EnhancedSize};
    }

    // A seekable stream had its ID3v1 found by the tail scan; only accept one at the very end
    if (hasSignature(cursor(), avail, "TAG") && (!streamEnd_ || pos + kId3v1Size == limit) &&
        fits(kId3v1Size)) {
        return Candidate{FrameType::Metadata, MetadataKind::Id3, kId3v1Size};
    }

    if (hasSignature(cursor(), avail, "APETAGEX") && avail >= kApeFooterSize) {
        const std::uint32_t tagSize = readLe32(cursor() + 12);
        const std::uint32_t flags = readLe32(cursor() + 20);
        const std::uint64_t length = (flags & kApeFlagIsHeader) != 0
                                         ? kApeFooterSize + static_cast<std::uint64_t>(tagSize)
                                         : kApeFooterSize;
        if (tagSize >= kApeFooterSize && fits(length)) {
            return Candidate{FrameType::Metadata, MetadataKind::Ape,
                             static_cast<std::size_t>(length)};
        }
    }

    if (hasSignature(cursor(), avail, "RIFF")) {
        if (auto riff = recognizeRiff(room)) {
            return riff;
        }
    }

    if (avail >= kFrameHeaderSize && cursor()[0] == 0xFF) {
        auto header = parseFrameHeader(cursor(), avail);
        if (header) {
            const std::size_t length = header->frameLength();
            const std::size_t minimum =
                kFrameHeaderSize + (header->hasCrc ? kCrcSize : 0) + header->sideInfoLength();
            // A truncated frame must not swallow the container that follows it
            auto swallowsContainer = [&]() {
                fill(length + kContainerPrefixSize);
                return containerInside(cursor(), length, available());
            };
            if (length >= minimum && fits(length) && !swallowsContainer() &&
                (lastWasAudio_ || confirmAudio(*header, length, room))) {
                return Candidate{FrameType::Audio, MetadataKind::Meta, length};
            }
        }
    }

    return std::nullopt;
}

std::optional<FrameReader::Candidate> FrameReader::recognizeRiff(std::uint64_t room) {
    if (!fill(12)) {
        return std::nullopt;
    }
    if (std::memcmp(cursor() + 8, "WAVE", 4) != 0 && std::memcmp(cursor() + 8, "RMP3", 4) != 0) {
        return std::nullopt;
    }
    const std::uint64_t riffTotal = 8 + static_cast<std::uint64_t>(readLe32(cursor() + 4));

    std::size_t offset = 12;
    while (offset + 8 <= kRiffMaxHeaderScan && offset + 8 <= room) {
        if (!fill(offset + 8)) {
            return std::nullopt;
        }
        const std::uint8_t* chunk = cursor() + offset;
        const std::uint32_t chunkSize = readLe32(chunk + 4);
        if (std::memcmp(chunk, "data", 4) == 0) {
            Candidate candidate{FrameType::Metadata, MetadataKind::Riff, offset + 8};
            candidate.riffDataLength = chunkSize;
            candidate.riffTotalLength = riffTotal;
            return candidate;
        }
        offset += 8 + static_cast<std::size_t>(chunkSize) + (chunkSize & 1);
    }
    return std::nullopt;
}

bool FrameReader::confirmAudio(const FrameHeader& header, std::size_t length, std::uint64_t room) {
    if (length == room) {
        return true;
    }
    fill(length + kFrameHeaderSize);
    const std::size_t after = available() - length;
    if (after == 0) {
        return eof_;
    }
    const std::uint8_t* nextBytes = cursor() + length;
    if (startsWithTagSignature(nextBytes, after)) {
        return true;
    }
    auto nextHeader = parseFrameHeader(nextBytes, after);
    return nextHeader && nextHeader->sameStreamAs(header);
}

Frame FrameReader::takeSpan(MetadataKind kind, std::size_t length) {
    Frame frame;
    frame.type = FrameType::Metadata;
    frame.kind = kind;
    frame.offset = position();
    frame.data.assign(cursor(), cursor() + length);
    cursor_ += length;
    return frame;
}

Frame FrameReader::take(const Candidate& candidate) {
    if (candidate.type != FrameType::Audio) {
        Frame frame = takeSpan(candidate.kind, candidate.length);
        if (candidate.kind == MetadataKind::Riff) {
            const std::uint64_t dataEnd = position() + candidate.riffDataLength;
            if (candidate.riffDataLength > 0 && (!streamEnd_ || dataEnd <= *streamEnd_)) {
                riffDataEnd_ = dataEnd;
                riffEnd_ = frame.offset + candidate.riffTotalLength;
            }
            LOG_TRACE("RIFF wrapper at {}: {} header bytes, data ends at {}", frame.offset,
                      frame.size(), riffDataEnd_ ? *riffDataEnd_ : 0);
        }
        return frame;
    }

    Frame frame;
    frame.type = FrameType::Audio;
    frame.offset = position();
    frame.data.assign(cursor(), cursor() + candidate.length);
    if (auto header = parseFrameHeader(frame.data.data(), frame.data.size())) {
        frame.header = *header;
    }
    cursor_ += candidate.length;
    return frame;
}

void FrameReader::consumeInvalidByte() {
    if (options_.skipInvalidData) {
        ++cursor_;
        ++skippedBytes_;
        return;
    }
    if (pendingInvalid_.empty()) {
        pendingInvalidOffset_ = position();
    }
    pendingInvalid_.push_back(*cursor());
    ++cursor_;
}

Frame FrameReader::flushInvalid() {
    Frame frame;
    frame.type = FrameType::Invalid;
    frame.offset = pendingInvalidOffset_;
    frame.data.swap(pendingInvalid_);
    pendingInvalid_.clear();
    return frame;
}

}  // namespace mpeg
}  // namespace mp3sanitize
