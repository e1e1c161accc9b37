#pragma once

#include "mpeg/frame.h"
#include "mpeg/frame_reader.h"

#include <optional>
#include <string>
#include <string_view>

namespace mp3sanitize {

// Metadata categories to remove. Defaults to dropping only the RIFF wrapper.
struct DropSet {
    bool riff = true;
    bool id3 = false;
    bool ape = false;
    bool meta = false;

    static DropSet none() {
        return DropSet{false, false, false, false};
    }

    bool drops(mpeg::MetadataKind kind) const;
    void add(mpeg::MetadataKind kind);

    bool operator==(const DropSet& other) const {
        return riff == other.riff && id3 == other.id3 && ape == other.ape && meta == other.meta;
    }
    bool operator!=(const DropSet& other) const {
        return !(*this == other);
    }
};

// Parses "riff,id3", "ape", "none"... Returns std::nullopt on an unknown name.
std::optional<DropSet> parseDropList(std::string_view list);

// Inverse of parseDropList ("none" when empty).
std::string dropSetToString(const DropSet& drop);

/**
 * @brief Per-run configuration, built once and shared read-only by every file of a batch.
 */
struct SanitizeOptions {
    bool keepRiff = false;
    bool keepMeta = true;
    bool keepId3 = true;
    bool keepApe = true;
    bool mangle = false;
    bool replaceOriginal = false;
    bool skipInvalidData = true;

    bool keeps(mpeg::MetadataKind kind) const;

    // Classifier configuration eliding every category this run drops
    mpeg::ClassifierOptions classifierOptions() const;
};

SanitizeOptions makeSanitizeOptions(const DropSet& drop, bool mangle, bool replaceOriginal,
                                    bool skipInvalidData = true);

}  // namespace mp3sanitize
