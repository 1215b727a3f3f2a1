#include "KinderdromeSimulation.h"
#include "EconomyController.h"
#include "Kinder.h"
#include <algorithm>
#include <iostream>

KinderdromeSimulation::KinderdromeSimulation(const SimulationSettings &settings)
    : KinderdromeSimulation(settings, std::make_unique<SeededRandom>(settings.seed))
{
}

KinderdromeSimulation::KinderdromeSimulation(const SimulationSettings &settings, std::unique_ptr<RandomSource> rng)
    : settings_(validated(settings)),
      rng_(std::move(rng)),
      context_(settings_, *rng_),
      grid_(settings_.gridRows, settings_.gridColumns, settings_.cellWidth(), settings_.cellHeight())
{
    populate();

    std::cout << "KinderdromeSimulation initialized:" << std::endl;
    std::cout << "  Arena: " << settings_.width << "x" << settings_.height << std::endl;
    std::cout << "  Grid: " << settings_.gridRows << "x" << settings_.gridColumns
              << " (cell " << settings_.cellWidth() << "x" << settings_.cellHeight() << ")" << std::endl;
    std::cout << "  Kinder: " << context_.kinder.size() << std::endl;
    std::cout << "  Blocks: " << context_.totalBlocks << std::endl;
    std::cout << "  Bed capacity: " << settings_.bedCapacity() << std::endl;
}

const SimulationSettings &KinderdromeSimulation::validated(const SimulationSettings &settings)
{
    settings.validate();
    return settings;
}

void KinderdromeSimulation::populate()
{
    context_.mode = Mode::Surplus;
    context_.kinder = KinderFactory::createKinder(settings_, *rng_);
    context_.blocks = EconomyController::spawnBlocks(settings_, *rng_);
    context_.totalBlocks = static_cast<int>(context_.blocks.size());
    context_.remainingBlocks = context_.totalBlocks;
    context_.beds.clear();
    context_.availableBeds.clear();
    context_.audit.reset();
}

void KinderdromeSimulation::tick(float deltaTime)
{
    (void)deltaTime; // movement is frame count based

    if (paused_)
        return;

    updateTimer_.restart();

    for (int s = 0; s < settings_.stepsPerFrame; ++s)
    {
        step();
    }

    lastUpdateTime_ = static_cast<float>(updateTimer_.getElapsedTime().asMicroseconds()) / 1000.0f;
}

void KinderdromeSimulation::step()
{
    context_.audit.reset();

    EconomyController::beginTick(context_);

    grid_.clear();

    // spawn order, every kinder sees the moves of the ones before it
    for (auto &kinder : context_.kinder)
    {
        kinder.update(context_);
    }

    for (const auto &kinder : context_.kinder)
    {
        grid_.insert(kinder);
    }

    context_.audit.contestsStarted += static_cast<std::uint64_t>(grid_.resolveContests(context_));

    cumulativeAudit_ += context_.audit;
    ++tickCount_;
}

void KinderdromeSimulation::reset()
{
    if (auto *seeded = dynamic_cast<SeededRandom *>(rng_.get()))
    {
        seeded->reseed(settings_.seed);
    }

    populate();
    grid_.clear();
    tickCount_ = 0;
    cumulativeAudit_.reset();

    std::cout << "Simulation reset (seed " << settings_.seed << ")" << std::endl;
}

void KinderdromeSimulation::toggleNapTime()
{
    EconomyController::toggleNapTime(context_);
}

void KinderdromeSimulation::setStepsPerFrame(int steps)
{
    settings_.stepsPerFrame = std::clamp(steps, 1, 64);
}
