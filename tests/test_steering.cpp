#include <gtest/gtest.h>
#include <cmath>
#include "Steering.h"
#include "TestSupport.h"

TEST(SteeringTest, HeadingConventions)
{
    EXPECT_NEAR(steering::headingOf({1.0f, 0.0f}), 0.0f, 1e-4f);
    EXPECT_NEAR(steering::headingOf({1.0f, 1.0f}), 45.0f, 1e-4f);
    EXPECT_NEAR(steering::headingOf({-1.0f, 0.0f}), 180.0f, 1e-4f);
    EXPECT_NEAR(steering::headingOf({-1.0f, -1.0f}), 225.0f, 1e-4f);
    EXPECT_FLOAT_EQ(steering::headingOf({0.0f, 3.0f}), 90.0f);
    EXPECT_FLOAT_EQ(steering::headingOf({0.0f, -3.0f}), 270.0f);
}

TEST(SteeringTest, DirectionOfIsUnitLength)
{
    for (float h = 0.0f; h < 360.0f; h += 17.0f)
    {
        sf::Vector2f d = steering::directionOf(h);
        EXPECT_NEAR(d.x * d.x + d.y * d.y, 1.0f, 1e-5f);
    }
    sf::Vector2f up = steering::directionOf(90.0f);
    EXPECT_NEAR(up.x, 0.0f, 1e-5f);
    EXPECT_NEAR(up.y, 1.0f, 1e-5f);
}

TEST(SteeringTest, NormalizedOrZeroLeavesZeroAlone)
{
    sf::Vector2f z = steering::normalizedOrZero({0.0f, 0.0f});
    EXPECT_EQ(z, sf::Vector2f(0.0f, 0.0f));
    sf::Vector2f n = steering::normalizedOrZero({3.0f, 4.0f});
    EXPECT_FLOAT_EQ(n.x, 0.6f);
    EXPECT_FLOAT_EQ(n.y, 0.8f);
}

TEST(SteeringTest, BounceClampsAndReflectsCrossedAxisOnly)
{
    SimulationSettings settings = smallArenaSettings();
    sf::Vector2f position(10.0f, 150.0f);
    sf::Vector2f velocity(-2.0f, 1.0f);
    sf::Vector2f trajectory(-0.8f, 0.6f);

    steering::BounceResult r = steering::bounceOffMargins(position, velocity, trajectory, 24.0f, settings);

    EXPECT_TRUE(r.x);
    EXPECT_FALSE(r.y);
    EXPECT_FLOAT_EQ(position.x, 26.0f);
    EXPECT_FLOAT_EQ(position.y, 150.0f);
    EXPECT_FLOAT_EQ(velocity.x, 2.0f);
    EXPECT_FLOAT_EQ(velocity.y, 1.0f);
    EXPECT_FLOAT_EQ(trajectory.x, 0.8f);
    EXPECT_FLOAT_EQ(trajectory.y, 0.6f);
}

TEST(SteeringTest, BounceOnFarCorner)
{
    SimulationSettings settings = smallArenaSettings();
    sf::Vector2f position(399.0f, 299.0f);
    sf::Vector2f velocity(1.0f, 1.0f);
    sf::Vector2f trajectory(1.0f, 0.0f);

    steering::BounceResult r = steering::bounceOffMargins(position, velocity, trajectory, 24.0f, settings);

    EXPECT_TRUE(r.x);
    EXPECT_TRUE(r.y);
    EXPECT_FLOAT_EQ(position.x, 374.0f);
    EXPECT_FLOAT_EQ(position.y, 274.0f);
    EXPECT_FLOAT_EQ(velocity.x, -1.0f);
    EXPECT_FLOAT_EQ(velocity.y, -1.0f);
    EXPECT_FLOAT_EQ(trajectory.x, -1.0f);
}

TEST(SteeringTest, NoBounceInsideMargins)
{
    SimulationSettings settings = smallArenaSettings();
    sf::Vector2f position(200.0f, 150.0f);
    sf::Vector2f velocity(1.0f, -1.0f);
    sf::Vector2f trajectory(1.0f, 0.0f);

    EXPECT_FALSE(steering::bounceOffMargins(position, velocity, trajectory, 24.0f, settings).any());
    EXPECT_EQ(velocity, sf::Vector2f(1.0f, -1.0f));
}

TEST(KinderSteeringTest, FreeRoamMovesAtConstantSpeedAlongNoisyHeading)
{
    WorldFixture world;
    Kinder &k = world.addKinder({200.0f, 150.0f});

    k.update(world.ctx);

    // 0.5 * 120 never triggers a recentre
    PerlinNoise reference(7, 1.0f);
    float heading = 0.0f + reference.noise(0.01f) * 360.0f;
    sf::Vector2f expected = steering::directionOf(heading) * 2.0f;

    EXPECT_FLOAT_EQ(k.getNoiseState().phase, 0.01f);
    EXPECT_NEAR(k.getVelocity().x, expected.x, 1e-4f);
    EXPECT_NEAR(k.getVelocity().y, expected.y, 1e-4f);
    EXPECT_NEAR(k.getPosition().x, 200.0f + expected.x, 1e-4f);
    EXPECT_NEAR(k.getPosition().y, 150.0f + expected.y, 1e-4f);
    // trajectory is the unperturbed baseline
    EXPECT_EQ(k.getTrajectory(), sf::Vector2f(1.0f, 0.0f));
}

TEST(KinderSteeringTest, RecentreAdoptsVelocityAndResetsPhase)
{
    WorldFixture world;
    world.scripted().floats = {0.0f};
    world.scripted().ints = {7};
    Kinder &k = world.addKinder({200.0f, 150.0f});

    k.update(world.ctx);

    sf::Vector2f unit = steering::normalizedOrZero(k.getVelocity());
    EXPECT_NEAR(k.getTrajectory().x, unit.x, 1e-5f);
    EXPECT_NEAR(k.getTrajectory().y, unit.y, 1e-5f);
    EXPECT_FLOAT_EQ(k.getNoiseState().phase, 7.0f);
}

TEST(KinderSteeringTest, WallTurnsTrajectoryAround)
{
    WorldFixture world;
    Kinder &k = world.addKinder({10.0f, 150.0f}, {-1.0f, 0.0f});

    k.update(world.ctx);

    EXPECT_GT(k.getTrajectory().x, 0.0f);
    EXPECT_GE(k.getPosition().x, 26.0f - 2.0f);
}

TEST(KinderSteeringTest, RunTimerFreezesSteeringAfterBounce)
{
    SimulationSettings settings = smallArenaSettings();
    settings.boundaryRunFrames = 3;
    WorldFixture world(settings);
    Kinder &k = world.addKinder({10.0f, 150.0f}, {-1.0f, 0.0f});

    k.update(world.ctx);

    EXPECT_EQ(k.getRunTimer(), 2);
    EXPECT_FLOAT_EQ(k.getNoiseState().phase, 0.0f);
    // bounced velocity, straight back into the room
    EXPECT_FLOAT_EQ(k.getVelocity().x, 2.0f);
    EXPECT_FLOAT_EQ(k.getPosition().x, 28.0f);
}
