#include "sanitize/bit_source.h"

namespace mp3sanitize {

RandomBitSource::RandomBitSource() : engine_(std::random_device{}()) {}

RandomBitSource::RandomBitSource(std::mt19937::result_type seed) : engine_(seed) {}

bool RandomBitSource::nextBit() {
    return distribution_(engine_) != 0;
}

}  // namespace mp3sanitize
