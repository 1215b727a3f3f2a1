#include "PerlinNoise.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

static inline float fade(float t) { return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f); }
static inline float lerp(float a, float b, float t) { return a + t * (b - a); }

PerlinNoise::PerlinNoise(std::uint32_t seed, float octaves)
    : seed_(seed), octaves_(octaves)
{
    std::array<std::uint8_t, 256> base;
    std::iota(base.begin(), base.end(), static_cast<std::uint8_t>(0));

    // fisher yates with the stream seed so the table is stable per kinder
    std::mt19937 gen(seed);
    for (int i = 255; i > 0; --i)
    {
        std::uniform_int_distribution<int> pick(0, i);
        std::swap(base[i], base[pick(gen)]);
    }
    for (int i = 0; i < 512; ++i)
        perm_[i] = base[i & 255];
}

float PerlinNoise::gradient(int lattice) const
{
    // slope in [-1, 1] at each integer lattice point
    return static_cast<float>(perm_[lattice & 255]) / 127.5f - 1.0f;
}

float PerlinNoise::noise(float t) const
{
    float x = t * octaves_;
    float cell = std::floor(x);
    int i = static_cast<int>(cell);
    float f = x - cell;

    float n0 = gradient(i) * f;
    float n1 = gradient(i + 1) * (f - 1.0f);

    // plain 1D gradient noise peaks at 0.5, doubled to span [-1, 1]
    return std::clamp(2.0f * lerp(n0, n1, fade(f)), -1.0f, 1.0f);
}

NoiseSample PerlinNoise::sample(const NoiseState &state, float step) const
{
    NoiseState next{state.phase + step};
    return {noise(next.phase), next};
}
