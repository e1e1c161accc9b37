#include "sanitize/sanitize_options.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mp3sanitize {

namespace {

std::string trim(std::string_view s) {
    const auto begin = s.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t");
    return std::string{s.substr(begin, end - begin + 1)};
}

}  // namespace

bool DropSet::drops(mpeg::MetadataKind kind) const {
    switch (kind) {
    case mpeg::MetadataKind::Riff:
        return riff;
    case mpeg::MetadataKind::Id3:
        return id3;
    case mpeg::MetadataKind::Ape:
        return ape;
    case mpeg::MetadataKind::Meta:
    default:
        return meta;
    }
}

void DropSet::add(mpeg::MetadataKind kind) {
    switch (kind) {
    case mpeg::MetadataKind::Riff:
        riff = true;
        break;
    case mpeg::MetadataKind::Id3:
        id3 = true;
        break;
    case mpeg::MetadataKind::Ape:
        ape = true;
        break;
    case mpeg::MetadataKind::Meta:
        meta = true;
        break;
    }
}

std::optional<DropSet> parseDropList(std::string_view list) {
    DropSet drop = DropSet::none();
    std::string item;
    std::istringstream stream{std::string{list}};
    bool sawNone = false;
    bool sawKind = false;
    while (std::getline(stream, item, ',')) {
        std::string name = trim(item);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name.empty()) {
            continue;
        }
        if (name == "none") {
            sawNone = true;
            continue;
        }
        auto kind = mpeg::parseMetadataKind(name);
        if (!kind) {
            return std::nullopt;
        }
        drop.add(*kind);
        sawKind = true;
    }
    if (sawNone && sawKind) {
        return std::nullopt;
    }
    return drop;
}

std::string dropSetToString(const DropSet& drop) {
    std::string out;
    auto append = [&out](const char* name) {
        if (!out.empty()) {
            out += ',';
        }
        out += name;
    };
    if (drop.riff) {
        append("riff");
    }
    if (drop.id3) {
        append("id3");
    }
    if (drop.ape) {
        append("ape");
    }
    if (drop.meta) {
        append("meta");
    }
    return out.empty() ? "none" : out;
}

bool SanitizeOptions::keeps(mpeg::MetadataKind kind) const {
    switch (kind) {
    case mpeg::MetadataKind::Riff:
        return keepRiff;
    case mpeg::MetadataKind::Id3:
        return keepId3;
    case mpeg::MetadataKind::Ape:
        return keepApe;
    case mpeg::MetadataKind::Meta:
    default:
        return keepMeta;
    }
}

mpeg::ClassifierOptions SanitizeOptions::classifierOptions() const {
    mpeg::ClassifierOptions options;
    options.skipInvalidData = skipInvalidData;
    options.emitRiff = keepRiff;
    options.emitMeta = keepMeta;
    options.emitId3 = keepId3;
    options.emitApe = keepApe;
    return options;
}

SanitizeOptions makeSanitizeOptions(const DropSet& drop, bool mangle, bool replaceOriginal,
                                    bool skipInvalidData) {
    SanitizeOptions options;
    options.keepRiff = !drop.riff;
    options.keepId3 = !drop.id3;
    options.keepApe = !drop.ape;
    options.keepMeta = !drop.meta;
    options.mangle = mangle;
    options.replaceOriginal = replaceOriginal;
    options.skipInvalidData = skipInvalidData;
    return options;
}

}  // namespace mp3sanitize
