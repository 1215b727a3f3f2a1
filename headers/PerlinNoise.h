#pragma once
#include <array>
#include <cstdint>

// position in one kinder's noise stream, the stream itself is the PerlinNoise instance
struct NoiseState
{
    float phase = 0.0f;
};

struct NoiseSample
{
    float value;
    NoiseState next;
};

/**
 * 1D gradient (perlin) noise stream, one per kinder
 * the permutation table is fixed by the seed so sample() is a pure function of
 * the phase for a given instance; octaves scales the input coordinate like a frequency multiplier
 */
class PerlinNoise
{
public:
    PerlinNoise(std::uint32_t seed, float octaves);

    // raw noise at coordinate t, nominally in [-1, 1]
    float noise(float t) const;

    // advances the phase by step and samples at the new phase
    NoiseSample sample(const NoiseState &state, float step) const;

    std::uint32_t getSeed() const { return seed_; }
    float getOctaves() const { return octaves_; }

private:
    std::uint32_t seed_;
    float octaves_;
    std::array<std::uint8_t, 512> perm_;

    float gradient(int lattice) const;
};
