#include "RandomSource.h"
#include <algorithm>

SeededRandom::SeededRandom(std::uint64_t seed)
    : seed_(seed), gen_(static_cast<std::mt19937::result_type>(seed))
{
}

float SeededRandom::uniform()
{
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    float value = dist(gen_);
    // some standard libraries can round up to exactly 1.0f for floats
    return value < 1.0f ? value : 0.0f;
}

int SeededRandom::uniformInt(int lo, int hi)
{
    if (hi < lo)
        std::swap(lo, hi);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(gen_);
}

void SeededRandom::reseed(std::uint64_t seed)
{
    seed_ = seed;
    gen_.seed(static_cast<std::mt19937::result_type>(seed));
}
