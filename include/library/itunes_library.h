#pragma once

#include "batch/path_source.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mp3sanitize {

/**
 * @brief Streams track file paths out of an iTunes-style "Library.xml" property list.
 *
 * Only the dictionaries under the top-level "Tracks" key are visited. A track yields its
 * "Location" when the locator is a local file:// URL; tracks without a location or with any
 * other scheme are skipped. Enumeration order is document order.
 */
class ItunesLibraryReader : public PathSource {
   public:
    explicit ItunesLibraryReader(const std::filesystem::path& libraryPath);
    ~ItunesLibraryReader() override;

    ItunesLibraryReader(const ItunesLibraryReader&) = delete;
    ItunesLibraryReader& operator=(const ItunesLibraryReader&) = delete;

    std::optional<std::filesystem::path> next() override;

    ErrorCode error() const override {
        return error_;
    }
    std::string errorMessage() const override {
        return errorMessage_;
    }

    // Tracks seen so far that had no usable location
    std::size_t skippedTracks() const {
        return skippedTracks_;
    }

   private:
    struct Impl;

    void fail(const std::string& message);

    std::unique_ptr<Impl> impl_;
    std::filesystem::path libraryPath_;
    ErrorCode error_ = ErrorCode::OK;
    std::string errorMessage_;
    std::size_t skippedTracks_ = 0;
};

/**
 * @brief Convert "file:///a/b%20c.mp3" or "file://localhost/a/b.mp3" to a local path.
 * @return std::nullopt for other schemes or remote hosts
 */
std::optional<std::filesystem::path> fileUrlToPath(std::string_view url);

// %XX sequences decoded; malformed sequences kept verbatim
std::string percentDecode(std::string_view text);

// $HOME/Music/iTunes/iTunes Music Library.xml
std::filesystem::path defaultLibraryPath();
std::filesystem::path defaultLibraryPath(const std::string& home);

}  // namespace mp3sanitize
