#include "library/itunes_library.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlreader.h>

namespace mp3sanitize {

namespace fs = std::filesystem;

// Document shape: plist(0) > dict(1) > key "Tracks"(2) + dict(2) > key(3) + dict(3) > ...(4)
namespace {

constexpr int kTopLevelDepth = 2;
constexpr int kTrackDepth = 3;
constexpr int kTrackFieldDepth = 4;

std::string nodeName(xmlTextReaderPtr reader) {
    const xmlChar* name = xmlTextReaderConstName(reader);
    return name ? reinterpret_cast<const char*>(name) : std::string{};
}

std::string readText(xmlTextReaderPtr reader) {
    xmlChar* text = xmlTextReaderReadString(reader);
    if (!text) {
        return {};
    }
    std::string result = reinterpret_cast<const char*>(text);
    xmlFree(text);
    return result;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

struct ItunesLibraryReader::Impl {
    xmlTextReaderPtr reader = nullptr;
    bool awaitingTracksDict = false;
    bool inTracks = false;
    bool tracksDone = false;
    bool inTrack = false;
    std::string lastKey;
    std::optional<std::string> location;

    ~Impl() {
        if (reader) {
            xmlFreeTextReader(reader);
        }
    }
};

ItunesLibraryReader::ItunesLibraryReader(const fs::path& libraryPath)
    : impl_(std::make_unique<Impl>()), libraryPath_(libraryPath) {
    xmlInitParser();
    // NONET: the plist DOCTYPE points at a remote DTD that must never be fetched
    impl_->reader = xmlReaderForFile(libraryPath.c_str(), nullptr,
                                     XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (!impl_->reader) {
        fail("cannot open " + libraryPath.string());
    }
}

ItunesLibraryReader::~ItunesLibraryReader() = default;

void ItunesLibraryReader::fail(const std::string& message) {
    error_ = ErrorCode::VALIDATION_LIBRARY_UNREADABLE;
    errorMessage_ = message;
    if (impl_->reader) {
        xmlFreeTextReader(impl_->reader);
        impl_->reader = nullptr;
    }
}

std::optional<fs::path> ItunesLibraryReader::next() {
    if (!impl_->reader || impl_->tracksDone) {
        return std::nullopt;
    }
    xmlTextReaderPtr reader = impl_->reader;

    int ret = 0;
    while ((ret = xmlTextReaderRead(reader)) == 1) {
        const int type = xmlTextReaderNodeType(reader);
        const int depth = xmlTextReaderDepth(reader);

        if (type == XML_READER_TYPE_ELEMENT) {
            const std::string name = nodeName(reader);
            const bool empty = xmlTextReaderIsEmptyElement(reader) == 1;

            if (!impl_->inTracks) {
                if (depth != kTopLevelDepth) {
                    continue;
                }
                if (name == "key") {
                    impl_->awaitingTracksDict = readText(reader) == "Tracks";
                } else if (impl_->awaitingTracksDict) {
                    impl_->awaitingTracksDict = false;
                    if (name != "dict" || empty) {
                        impl_->tracksDone = true;
                        return std::nullopt;
                    }
                    impl_->inTracks = true;
                }
                continue;
            }

            if (depth == kTrackDepth && name == "dict") {
                if (empty) {
                    ++skippedTracks_;
                    continue;
                }
                impl_->inTrack = true;
                impl_->lastKey.clear();
                impl_->location.reset();
            } else if (impl_->inTrack && depth == kTrackFieldDepth) {
                if (name == "key") {
                    impl_->lastKey = readText(reader);
                } else {
                    if (impl_->lastKey == "Location" && name == "string") {
                        impl_->location = readText(reader);
                    }
                    impl_->lastKey.clear();
                }
            }
        } else if (type == XML_READER_TYPE_END_ELEMENT && impl_->inTracks) {
            if (depth == kTrackDepth && impl_->inTrack) {
                impl_->inTrack = false;
                if (impl_->location) {
                    if (auto path = fileUrlToPath(*impl_->location)) {
                        return path;
                    }
                    LOG_DEBUG("Skipping non-local track location {}", *impl_->location);
                }
                ++skippedTracks_;
            } else if (depth == kTopLevelDepth) {
                impl_->tracksDone = true;
                return std::nullopt;
            }
        }
    }

    if (ret < 0) {
        std::string detail = "parse error";
        const xmlError* err = xmlGetLastError();
        if (err && err->message) {
            detail = err->message;
            while (!detail.empty() && std::isspace(static_cast<unsigned char>(detail.back()))) {
                detail.pop_back();
            }
        }
        fail(libraryPath_.string() + ": " + detail);
    } else if (!impl_->inTracks) {
        LOG_DEBUG("{} has no Tracks dictionary", libraryPath_.string());
    }
    impl_->tracksDone = true;
    return std::nullopt;
}

std::string percentDecode(std::string_view text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::optional<fs::path> fileUrlToPath(std::string_view url) {
    constexpr std::string_view kScheme = "file://";
    constexpr std::string_view kLocalhost = "localhost";
    if (url.size() < kScheme.size()) {
        return std::nullopt;
    }
    std::string scheme{url.substr(0, kScheme.size())};
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != kScheme) {
        return std::nullopt;
    }

    std::string_view rest = url.substr(kScheme.size());
    if (rest.substr(0, kLocalhost.size()) == kLocalhost) {
        rest.remove_prefix(kLocalhost.size());
    }
    if (rest.empty() || rest.front() != '/') {
        return std::nullopt;
    }
    return fs::path(percentDecode(rest));
}

fs::path defaultLibraryPath(const std::string& home) {
    return fs::path(home) / "Music" / "iTunes" / "iTunes Music Library.xml";
}

fs::path defaultLibraryPath() {
    const char* home = std::getenv("HOME");
    return defaultLibraryPath(home ? home : "");
}

}  // namespace mp3sanitize
