#include "batch/path_source.h"

namespace mp3sanitize {

VectorPathSource::VectorPathSource(std::vector<std::filesystem::path> paths)
    : paths_(std::move(paths)) {}

std::optional<std::filesystem::path> VectorPathSource::next() {
    if (index_ >= paths_.size()) {
        return std::nullopt;
    }
    return paths_[index_++];
}

}  // namespace mp3sanitize
