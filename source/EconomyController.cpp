#include "EconomyController.h"
#include "Kinder.h"
#include "RandomSource.h"
#include "SimulationContext.h"
#include "SimulationSettings.h"
#include "Steering.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

static constexpr float TWO_PI_F = 6.28318530717958647692f;

std::vector<Block> EconomyController::spawnBlocks(const SimulationSettings &settings, RandomSource &rng)
{
    std::vector<Block> blocks;
    blocks.reserve(static_cast<size_t>(settings.numBlocks));

    float size = 2.0f * settings.blockHalfExtent;
    for (int i = 0; i < settings.numBlocks; ++i)
    {
        float left = settings.margin + (settings.width - 2.0f * settings.margin - size - 1.0f) * rng.uniform();
        float top = settings.margin + (settings.height - 2.0f * settings.margin - size - 1.0f) * rng.uniform();
        blocks.emplace_back(i, left + settings.blockHalfExtent, top + settings.blockHalfExtent);
    }
    return blocks;
}

std::vector<Bed> EconomyController::layoutBeds(const SimulationSettings &settings, int count)
{
    const int rows = settings.gridRows;
    const int cols = settings.gridColumns;

    // perimeter cells in clockwise order
    std::vector<std::pair<int, int>> slots;
    for (int c = 0; c < cols; ++c)
        slots.emplace_back(0, c);
    for (int r = 1; r < rows; ++r)
        slots.emplace_back(r, cols - 1);
    if (rows > 1)
    {
        for (int c = cols - 2; c >= 0; --c)
            slots.emplace_back(rows - 1, c);
    }
    if (cols > 1)
    {
        for (int r = rows - 2; r >= 1; --r)
            slots.emplace_back(r, 0);
    }

    std::vector<Bed> beds;
    if (count <= 0 || slots.empty())
        return beds;

    count = std::min(count, static_cast<int>(slots.size()));
    beds.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i)
    {
        const auto &slot = slots[static_cast<size_t>(i) * slots.size() / static_cast<size_t>(count)];
        beds.emplace_back(i, slot.first, slot.second,
                          static_cast<float>(settings.cellWidth()),
                          static_cast<float>(settings.cellHeight()));
    }
    return beds;
}

void EconomyController::beginTick(SimulationContext &ctx)
{
    if (ctx.mode == Mode::Surplus && ctx.remainingBlocks <= 0)
        enterSaturation(ctx);
}

int EconomyController::collectBlocks(SimulationContext &ctx, Kinder &kinder)
{
    if (ctx.mode != Mode::Surplus)
        return 0;

    const sf::FloatRect box = kinder.getBounds(ctx.settings.kinderHalfExtent);
    int collected = 0;
    for (size_t i = 0; i < ctx.blocks.size(); ++i)
    {
        const Block &block = ctx.blocks[i];
        if (!block.isOnField())
            continue;
        if (steering::overlaps(box, steering::boxAround(block.position, ctx.settings.blockHalfExtent)))
        {
            claimBlock(ctx, kinder, i);
            ++collected;
        }
    }
    return collected;
}

void EconomyController::claimBlock(SimulationContext &ctx, Kinder &kinder, size_t blockIndex)
{
    Block &block = ctx.blocks[blockIndex];
    block.owner = kinder.getId();
    block.position = {Block::OFF_FIELD, Block::OFF_FIELD};
    kinder.receiveBlock(blockIndex);

    --ctx.remainingBlocks;
    ++ctx.audit.blocksCollected;

    if (ctx.remainingBlocks == 0 && ctx.mode == Mode::Surplus)
        enterSaturation(ctx);
}

void EconomyController::enterSaturation(SimulationContext &ctx)
{
    ctx.mode = Mode::Saturation;
    std::cout << "All " << ctx.totalBlocks << " blocks collected, entering block saturation" << std::endl;
}

void EconomyController::toggleNapTime(SimulationContext &ctx)
{
    if (ctx.mode == Mode::NapTime)
        exitNapTime(ctx);
    else
        enterNapTime(ctx);
}

void EconomyController::enterNapTime(SimulationContext &ctx)
{
    if (ctx.mode == Mode::NapTime)
        return;

    for (auto &kinder : ctx.kinder)
    {
        kinder.abandonContest();
        dropHeldBlocks(ctx, kinder);
    }

    ctx.beds = layoutBeds(ctx.settings, ctx.settings.bedCapacity());
    ctx.availableBeds.clear();
    for (size_t i = 0; i < ctx.beds.size(); ++i)
        ctx.availableBeds.push_back(i);

    ctx.mode = Mode::NapTime;
    std::cout << "Nap time: " << ctx.beds.size() << " beds for " << ctx.kinder.size()
              << " kinder, " << ctx.remainingBlocks << " blocks back on the field" << std::endl;
}

void EconomyController::exitNapTime(SimulationContext &ctx)
{
    if (ctx.mode != Mode::NapTime)
        return;

    for (auto &kinder : ctx.kinder)
        kinder.wake();

    ctx.beds.clear();
    ctx.availableBeds.clear();
    ctx.mode = Mode::Surplus;
    std::cout << "Nap time over, back to block surplus" << std::endl;
}

void EconomyController::dropHeldBlocks(SimulationContext &ctx, Kinder &kinder)
{
    std::vector<size_t> released = kinder.releaseAllBlocks();
    for (size_t blockIndex : released)
    {
        Block &block = ctx.blocks[blockIndex];
        block.owner = -1;
        block.position = dropPoint(ctx, kinder.getPosition());
        ++ctx.remainingBlocks;
    }
}

sf::Vector2f EconomyController::dropPoint(const SimulationContext &ctx, const sf::Vector2f &center)
{
    const SimulationSettings &settings = ctx.settings;
    float angle = ctx.rng.uniform() * TWO_PI_F;
    float distance = ctx.rng.uniform() * static_cast<float>(settings.cellWidth());

    sf::Vector2f point(center.x + std::cos(angle) * distance, center.y + std::sin(angle) * distance);

    const float inset = settings.margin + settings.blockHalfExtent;
    point.x = std::clamp(point.x, inset, settings.width - inset);
    point.y = std::clamp(point.y, inset, settings.height - inset);
    return point;
}

int EconomyController::nearestAvailableBed(const SimulationContext &ctx, const sf::Vector2f &position)
{
    int nearest = -1;
    float bestDistance = std::numeric_limits<float>::max();
    for (size_t bedIndex : ctx.availableBeds)
    {
        sf::Vector2f d = ctx.beds[bedIndex].position - position;
        float distance = std::sqrt(d.x * d.x + d.y * d.y);
        if (distance < bestDistance)
        {
            bestDistance = distance;
            nearest = static_cast<int>(bedIndex);
        }
    }
    return nearest;
}

bool EconomyController::tryClaimBed(SimulationContext &ctx, Kinder &kinder)
{
    if (ctx.mode != Mode::NapTime || kinder.isAsleep())
        return false;

    const sf::FloatRect box = kinder.getBounds(ctx.settings.kinderHalfExtent);
    for (auto it = ctx.availableBeds.begin(); it != ctx.availableBeds.end(); ++it)
    {
        size_t bedIndex = *it;
        Bed &bed = ctx.beds[bedIndex];
        if (!steering::overlaps(box, steering::boxAround(bed.position, ctx.settings.bedHalfExtent)))
            continue;

        ctx.availableBeds.erase(it);
        bed.occupied = true;
        bed.occupant = kinder.getId();
        kinder.sleepIn(bed, bedIndex);
        ++ctx.audit.bedsClaimed;

        if (ctx.availableBeds.empty())
            std::cout << "Every bed is taken" << std::endl;
        return true;
    }
    return false;
}
