#pragma once
#include <SFML/System/Clock.hpp>
#include "SimulationSettings.h"
#include "SimulationContext.h"
#include "SpatialGrid.h"
#include "RandomSource.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

class KinderdromeSimulation
{
public:
    // throws std::invalid_argument for an unusable configuration
    explicit KinderdromeSimulation(const SimulationSettings &settings);
    // scripted randomness for tests
    KinderdromeSimulation(const SimulationSettings &settings, std::unique_ptr<RandomSource> rng);
    ~KinderdromeSimulation() = default;

    KinderdromeSimulation(const KinderdromeSimulation &) = delete;
    KinderdromeSimulation &operator=(const KinderdromeSimulation &) = delete;

    // core simulation methods
    // runs stepsPerFrame ticks; deltaTime is only informational, movement is per tick
    void tick(float deltaTime);
    // one full pass: mode checks, grid clear, kinder updates, grid rebuild, contests
    void step();
    void reset();

    // external commands, applied between ticks
    void toggleNapTime();
    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    void togglePause() { paused_ = !paused_; }
    bool isPaused() const { return paused_; }
    void setStepsPerFrame(int steps);

    // settings management
    const SimulationSettings &getSettings() const { return settings_; }

    // read only snapshot
    Mode getMode() const { return context_.mode; }
    int getRemainingBlocks() const { return context_.remainingBlocks; }
    int getTotalBlocks() const { return context_.totalBlocks; }
    const std::vector<Kinder> &getKinder() const { return context_.kinder; }
    const std::vector<Block> &getBlocks() const { return context_.blocks; }
    const std::vector<Bed> &getBeds() const { return context_.beds; }
    size_t getAvailableBedCount() const { return context_.availableBeds.size(); }
    const SpatialGrid &getGrid() const { return grid_; }
    std::uint64_t getTickCount() const { return tickCount_; }

    // audit counters: last tick and since construction/reset
    const AuditCounters &getLastTickAudit() const { return context_.audit; }
    const AuditCounters &getCumulativeAudit() const { return cumulativeAudit_; }

    // performance tracking
    float getLastUpdateTime() const { return lastUpdateTime_; }

    // direct state access for scripted scenarios
    SimulationContext &getContext() { return context_; }

private:
    SimulationSettings settings_;
    std::unique_ptr<RandomSource> rng_;
    SimulationContext context_;
    SpatialGrid grid_;

    bool paused_ = false;
    std::uint64_t tickCount_ = 0;
    AuditCounters cumulativeAudit_;

    // performance tracking
    float lastUpdateTime_ = 0.0f;
    sf::Clock updateTimer_;

    void populate();
    static const SimulationSettings &validated(const SimulationSettings &settings);
};
