#pragma once

#include "core/error_codes.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mp3sanitize {

/**
 * @brief Finite producer of input paths for a batch.
 */
class PathSource {
   public:
    virtual ~PathSource() = default;

    // Next path, or std::nullopt when exhausted (or enumeration failed).
    virtual std::optional<std::filesystem::path> next() = 0;

    // Enumeration failure, if any. Paths produced before a failure remain valid.
    virtual ErrorCode error() const {
        return ErrorCode::OK;
    }
    virtual std::string errorMessage() const {
        return {};
    }
};

// Explicit list of files, yielded in the order given.
class VectorPathSource : public PathSource {
   public:
    explicit VectorPathSource(std::vector<std::filesystem::path> paths);

    std::optional<std::filesystem::path> next() override;

    std::size_t size() const {
        return paths_.size();
    }

   private:
    std::vector<std::filesystem::path> paths_;
    std::size_t index_ = 0;
};

}  // namespace mp3sanitize
