#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include <vector>
#include "Bed.h"
#include "Block.h"

class Kinder;
class RandomSource;
class SimulationSettings;
struct SimulationContext;

// block economy and global mode transitions
// Surplus -> Saturation happens on its own once the field is empty and is never undone here;
// nap time is only entered and left through toggleNapTime()
class EconomyController
{
public:
    // setup
    static std::vector<Block> spawnBlocks(const SimulationSettings &settings, RandomSource &rng);
    // bed slots spread evenly around the grid perimeter, clockwise from the top left cell
    static std::vector<Bed> layoutBeds(const SimulationSettings &settings, int count);

    // start of tick mode checks
    static void beginTick(SimulationContext &ctx);

    // surplus pickup: claims every on-field block the kinder overlaps, returns how many
    static int collectBlocks(SimulationContext &ctx, Kinder &kinder);
    static void claimBlock(SimulationContext &ctx, Kinder &kinder, size_t blockIndex);

    // nap time
    static void toggleNapTime(SimulationContext &ctx);
    static void enterNapTime(SimulationContext &ctx);
    static void exitNapTime(SimulationContext &ctx);
    static int nearestAvailableBed(const SimulationContext &ctx, const sf::Vector2f &position);
    static bool tryClaimBed(SimulationContext &ctx, Kinder &kinder);

    // random point within one cell width of center, kept inside the arena margin
    static sf::Vector2f dropPoint(const SimulationContext &ctx, const sf::Vector2f &center);

private:
    static void enterSaturation(SimulationContext &ctx);
    static void dropHeldBlocks(SimulationContext &ctx, Kinder &kinder);
};
