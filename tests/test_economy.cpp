#include <gtest/gtest.h>
#include <cmath>
#include <set>
#include "KinderdromeSimulation.h"
#include "TestSupport.h"

TEST(EconomyTest, LastBlockPickupSwitchesToSaturationSameTick)
{
    SimulationSettings settings = smallArenaSettings();
    settings.numKinder = 2;
    settings.numBlocks = 1;
    KinderdromeSimulation sim(settings);
    SimulationContext &ctx = sim.getContext();

    // put the only block right under kinder 0
    ctx.blocks[0].position = ctx.kinder[0].getPosition();
    ASSERT_EQ(sim.getRemainingBlocks(), 1);
    ASSERT_EQ(sim.getMode(), Mode::Surplus);

    sim.step();

    EXPECT_EQ(sim.getRemainingBlocks(), 0);
    EXPECT_EQ(sim.getMode(), Mode::Saturation);
    EXPECT_EQ(sim.getKinder()[0].getScore(), 1);
    EXPECT_EQ(sim.getBlocks()[0].owner, 0);
    EXPECT_EQ(sim.getLastTickAudit().blocksCollected, 1u);
}

TEST(EconomyTest, ClaimParksBlockAndPushesOnStack)
{
    WorldFixture world;
    world.addKinder({100.0f, 100.0f});
    size_t first = world.addBlock({105.0f, 100.0f});
    size_t second = world.addBlock({95.0f, 110.0f});
    world.addBlock({300.0f, 250.0f});

    int collected = EconomyController::collectBlocks(world.ctx, world.ctx.kinder[0]);

    EXPECT_EQ(collected, 2);
    EXPECT_EQ(world.ctx.remainingBlocks, 1);
    EXPECT_EQ(world.ctx.mode, Mode::Surplus);
    const Kinder &k = world.ctx.kinder[0];
    EXPECT_EQ(k.getScore(), 2);
    ASSERT_EQ(k.getHeldCount(), 2u);
    EXPECT_EQ(k.getHeldBlocks()[0], first);
    EXPECT_EQ(k.getHeldBlocks()[1], second);
    EXPECT_FALSE(world.ctx.blocks[first].isOnField());
    EXPECT_FLOAT_EQ(world.ctx.blocks[first].position.x, Block::OFF_FIELD);
    EXPECT_TRUE(world.ctx.blocks[2].isOnField());
}

TEST(EconomyTest, HeldBlocksCannotBeCollectedAgain)
{
    WorldFixture world;
    world.addKinder({100.0f, 100.0f});
    world.addKinder({100.0f, 100.0f});
    world.addBlock({100.0f, 100.0f});
    world.addBlock({350.0f, 250.0f});

    EXPECT_EQ(EconomyController::collectBlocks(world.ctx, world.ctx.kinder[0]), 1);
    EXPECT_EQ(EconomyController::collectBlocks(world.ctx, world.ctx.kinder[1]), 0);
    EXPECT_EQ(world.ctx.kinder[1].getScore(), 0);
}

TEST(EconomyTest, NoPickupOutsideSurplus)
{
    WorldFixture world;
    world.addKinder({100.0f, 100.0f});
    world.addBlock({100.0f, 100.0f});
    world.ctx.mode = Mode::Saturation;

    EXPECT_EQ(EconomyController::collectBlocks(world.ctx, world.ctx.kinder[0]), 0);
    EXPECT_EQ(world.ctx.remainingBlocks, 1);
}

TEST(EconomyTest, SaturationIsNeverUndoneByTickChecks)
{
    WorldFixture world;
    world.addKinder({100.0f, 100.0f});
    world.ctx.mode = Mode::Surplus;
    world.ctx.remainingBlocks = 0;

    EconomyController::beginTick(world.ctx);
    EXPECT_EQ(world.ctx.mode, Mode::Saturation);

    world.ctx.remainingBlocks = 3;
    EconomyController::beginTick(world.ctx);
    EXPECT_EQ(world.ctx.mode, Mode::Saturation);
}

TEST(EconomyTest, SpawnedBlocksFitInsideMargin)
{
    SimulationSettings settings = smallArenaSettings();
    settings.numBlocks = 500;
    SeededRandom rng(3);

    std::vector<Block> blocks = EconomyController::spawnBlocks(settings, rng);

    ASSERT_EQ(blocks.size(), 500u);
    for (const auto &b : blocks)
    {
        EXPECT_TRUE(b.isOnField());
        EXPECT_GE(b.position.x, settings.margin + settings.blockHalfExtent);
        EXPECT_LE(b.position.x, settings.width - settings.margin - settings.blockHalfExtent);
        EXPECT_GE(b.position.y, settings.margin + settings.blockHalfExtent);
        EXPECT_LE(b.position.y, settings.height - settings.margin - settings.blockHalfExtent);
    }
}

TEST(EconomyTest, FullBedLayoutCoversWholePerimeter)
{
    SimulationSettings settings = smallArenaSettings();
    std::vector<Bed> beds = EconomyController::layoutBeds(settings, settings.perimeterSlots());

    ASSERT_EQ(beds.size(), 24u);
    std::set<std::pair<int, int>> cells;
    for (const auto &bed : beds)
    {
        EXPECT_TRUE(bed.row == 0 || bed.row == 5 || bed.column == 0 || bed.column == 7);
        EXPECT_FLOAT_EQ(bed.position.x, (bed.column + 0.5f) * 50.0f);
        EXPECT_FLOAT_EQ(bed.position.y, (bed.row + 0.5f) * 50.0f);
        EXPECT_FALSE(bed.occupied);
        cells.insert({bed.row, bed.column});
    }
    EXPECT_EQ(cells.size(), 24u);
    EXPECT_EQ(beds.front().row, 0);
    EXPECT_EQ(beds.front().column, 0);
}

TEST(EconomyTest, PartialBedLayoutIsSpreadAndDistinct)
{
    SimulationSettings settings = smallArenaSettings();
    std::vector<Bed> beds = EconomyController::layoutBeds(settings, 5);

    ASSERT_EQ(beds.size(), 5u);
    std::set<std::pair<int, int>> cells;
    for (size_t i = 0; i < beds.size(); ++i)
    {
        EXPECT_EQ(beds[i].id, static_cast<int>(i));
        cells.insert({beds[i].row, beds[i].column});
    }
    EXPECT_EQ(cells.size(), 5u);
    EXPECT_TRUE(EconomyController::layoutBeds(settings, 0).empty());
}

TEST(EconomyTest, DropPointStaysNearAndInsideArena)
{
    WorldFixture world(smallArenaSettings(), std::make_unique<SeededRandom>(11));
    const sf::Vector2f centre(200.0f, 150.0f);
    const sf::Vector2f corner(26.0f, 26.0f);
    const float inset = world.settings.margin + world.settings.blockHalfExtent;

    for (int i = 0; i < 500; ++i)
    {
        sf::Vector2f p = EconomyController::dropPoint(world.ctx, centre);
        float dx = p.x - centre.x;
        float dy = p.y - centre.y;
        EXPECT_LE(std::sqrt(dx * dx + dy * dy), 50.0f + 1e-3f);

        sf::Vector2f q = EconomyController::dropPoint(world.ctx, corner);
        EXPECT_GE(q.x, inset);
        EXPECT_GE(q.y, inset);
    }
}
