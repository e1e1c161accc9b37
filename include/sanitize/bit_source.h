#pragma once

#include <random>

namespace mp3sanitize {

class BitSource {
   public:
    virtual ~BitSource() = default;

    // Next independent bit
    virtual bool nextBit() = 0;
};

// Uniform random bits from a std::mt19937 seeded by std::random_device.
class RandomBitSource : public BitSource {
   public:
    RandomBitSource();
    explicit RandomBitSource(std::mt19937::result_type seed);

    bool nextBit() override;

   private:
    std::mt19937 engine_;
    std::uniform_int_distribution<int> distribution_{0, 1};
};

}  // namespace mp3sanitize
