#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "Bed.h"
#include "Block.h"
#include "Kinder.h"

class SimulationSettings;
class RandomSource;

enum class Mode
{
    Surplus,    // blocks on the field, kinder collect them
    Saturation, // every block is held, kinder contest each other
    NapTime     // kinder look for a bed and sleep
};

const char *modeName(Mode mode);

// event counts, reset at the start of every tick
struct AuditCounters
{
    std::uint64_t blocksCollected = 0;
    std::uint64_t contestsStarted = 0;
    std::uint64_t snatches = 0;
    std::uint64_t blocksTransferred = 0;
    std::uint64_t bedsClaimed = 0;

    void reset() { *this = AuditCounters(); }
    AuditCounters &operator+=(const AuditCounters &other);
};

// all the state one simulation instance shares between its kinder
// passed by reference into every per tick call instead of living in globals
struct SimulationContext
{
    SimulationContext(const SimulationSettings &s, RandomSource &r)
        : settings(s), rng(r) {}

    const SimulationSettings &settings;
    RandomSource &rng;

    Mode mode = Mode::Surplus;
    int totalBlocks = 0;
    int remainingBlocks = 0; // blocks on the field

    std::vector<Kinder> kinder; // index == kinder id
    std::vector<Block> blocks;  // index == block id
    std::vector<Bed> beds;      // index == bed id, only populated during nap time
    std::vector<size_t> availableBeds;

    AuditCounters audit;
};
