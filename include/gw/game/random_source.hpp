#pragma once

/// @file random_source.hpp
/// @brief Randomness capability for map generation.
///
/// The generator draws every random number through IRandomSource, so a
/// test can substitute a scripted source and a seeded source reproduces a
/// map exactly (for a given standard library).

#include <cstdint>
#include <random>

namespace gw::game {

/// Source of uniform and normally distributed samples.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform sample in [lo, hi).  Returns @p lo when the range is empty.
    virtual float Uniform(float lo, float hi) = 0;

    /// Normal sample.  Returns @p mean when @p stddev <= 0.
    virtual float Normal(float mean, float stddev) = 0;
};

/// IRandomSource over a 64-bit Mersenne Twister with an explicit seed.
class SeededRandomSource final : public IRandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : engine_(seed), seed_(seed) {}

    float Uniform(float lo, float hi) override {
        if (!(hi > lo)) {
            return lo;
        }
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(engine_);
    }

    float Normal(float mean, float stddev) override {
        if (!(stddev > 0.0f)) {
            return mean;
        }
        std::normal_distribution<float> dist(mean, stddev);
        return dist(engine_);
    }

    [[nodiscard]] uint64_t Seed() const noexcept { return seed_; }

private:
    std::mt19937_64 engine_;
    uint64_t seed_;
};

} // namespace gw::game
