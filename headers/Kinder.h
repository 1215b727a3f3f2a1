#pragma once
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "Contest.h"
#include "PerlinNoise.h"

class SimulationSettings;
class RandomSource;
struct SimulationContext;
struct Bed;

// a kindergartner: roams the arena, collects blocks, contests other kinder
// for their blocks and looks for a bed at nap time
class Kinder
{
public:
    Kinder(int id, sf::Vector2f position, sf::Vector2f direction, float speed, std::uint32_t noiseSeed);

    // one tick of behavior for the current mode; does not touch the grid
    void update(SimulationContext &ctx);

    // contest lifecycle
    // both face each other, stop, start the timer and learn who snatches
    static void beginContest(Kinder &a, Kinder &b, RandomSource &rng, const SimulationSettings &settings);
    // drops out of any contest without recording a last opponent (nap time)
    void abandonContest();

    // held block stack, top = most recently acquired
    void receiveBlock(size_t blockIndex);
    size_t surrenderBlock();
    std::vector<size_t> releaseAllBlocks();

    // nap time
    void sleepIn(const Bed &bed, size_t bedIndex);
    void wake();

    // snapshot accessors
    int getId() const { return id_; }
    const sf::Vector2f &getPosition() const { return position_; }
    const sf::Vector2f &getVelocity() const { return velocity_; }
    const sf::Vector2f &getTrajectory() const { return trajectory_; }
    float getHeading() const { return heading_; }
    float getSpeed() const { return speed_; }
    int getScore() const { return score_; }
    size_t getHeldCount() const { return heldBlocks_.size(); }
    const std::vector<size_t> &getHeldBlocks() const { return heldBlocks_; }
    bool isAsleep() const { return asleep_; }
    int getBedIndex() const { return bedIndex_; }
    bool inContest() const { return contest_.engaged; }
    const ContestState &getContest() const { return contest_; }
    const NoiseState &getNoiseState() const { return noiseState_; }
    const PerlinNoise &getNoise() const { return noise_; }
    int getRunTimer() const { return runTimer_; }
    sf::FloatRect getBounds(float halfExtent) const;

    // placement (spawning, drop tests, scripted scenarios)
    void setPosition(const sf::Vector2f &position) { position_ = position; }
    void setTrajectory(const sf::Vector2f &trajectory);

private:
    int id_;

    // motion
    sf::Vector2f position_;
    sf::Vector2f velocity_;
    sf::Vector2f trajectory_; // baseline direction the noise perturbs
    float heading_;
    float speed_;
    int runTimer_ = 0;

    // steering noise
    PerlinNoise noise_;
    NoiseState noiseState_;

    // economy
    int score_ = 0;
    std::vector<size_t> heldBlocks_;

    ContestState contest_;

    bool asleep_ = false;
    int bedIndex_ = -1;

    // per mode behaviors
    void handleBoundary(const SimulationSettings &settings);
    void steerFreely(SimulationContext &ctx);
    void advanceContest(SimulationContext &ctx);
    void seekBed(SimulationContext &ctx);
    void move();

    void setVelocity(const sf::Vector2f &velocity);
};

// spawns the starting population
class KinderFactory
{
public:
    static std::vector<Kinder> createKinder(const SimulationSettings &settings, RandomSource &rng);

private:
    static sf::Vector2f getSpawnPosition(const SimulationSettings &settings, RandomSource &rng);
};
