#pragma once
#include <cstdint>
#include <random>

// single source of randomness for a simulation run
// everything probabilistic in the core draws from one of these so a fixed seed
// (or a scripted source in tests) reproduces a run exactly
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    // uniform in [0, 1)
    virtual float uniform() = 0;
    // uniform integer in [lo, hi] inclusive
    virtual int uniformInt(int lo, int hi) = 0;

    float uniformRange(float a, float b) { return a + (b - a) * uniform(); }
};

class SeededRandom : public RandomSource
{
public:
    explicit SeededRandom(std::uint64_t seed = 12345ULL);

    float uniform() override;
    int uniformInt(int lo, int hi) override;

    void reseed(std::uint64_t seed);
    std::uint64_t getSeed() const { return seed_; }

private:
    std::uint64_t seed_;
    std::mt19937 gen_;
};
