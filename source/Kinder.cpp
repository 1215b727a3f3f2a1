#include "Kinder.h"
#include "Bed.h"
#include "EconomyController.h"
#include "RandomSource.h"
#include "SimulationContext.h"
#include "SimulationSettings.h"
#include "Steering.h"
#include <cmath>

Kinder::Kinder(int id, sf::Vector2f position, sf::Vector2f direction, float speed, std::uint32_t noiseSeed)
    : id_(id), position_(position), velocity_(direction * speed), trajectory_(direction),
      heading_(steering::headingOf(direction)), speed_(speed),
      noise_(noiseSeed, speed / 2.0f), noiseState_{0.0f}
{
}

void Kinder::update(SimulationContext &ctx)
{
    // asleep kinder stay put until nap time ends
    if (asleep_)
        return;

    handleBoundary(ctx.settings);

    switch (ctx.mode)
    {
    case Mode::Surplus:
        steerFreely(ctx);
        move();
        EconomyController::collectBlocks(ctx, *this);
        break;
    case Mode::Saturation:
        if (contest_.engaged)
            advanceContest(ctx);
        else
            steerFreely(ctx);
        move();
        break;
    case Mode::NapTime:
        seekBed(ctx);
        move();
        EconomyController::tryClaimBed(ctx, *this);
        break;
    }
}

void Kinder::handleBoundary(const SimulationSettings &settings)
{
    steering::BounceResult bounce = steering::bounceOffMargins(
        position_, velocity_, trajectory_, settings.kinderHalfExtent, settings);
    if (!bounce.any())
        return;

    setVelocity(velocity_);
    // standing kinder (contest, bed) have nothing to run with
    if (settings.boundaryRunFrames > 0 && !contest_.engaged)
        runTimer_ = settings.boundaryRunFrames;
}

void Kinder::steerFreely(SimulationContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;

    // keep running away from the wall, noise phase frozen meanwhile
    if (runTimer_ > 0)
    {
        --runTimer_;
        return;
    }

    NoiseSample sample = noise_.sample(noiseState_, speed_ / settings.noiseStepDivisor);
    noiseState_ = sample.next;

    float heading = steering::headingOf(trajectory_) + sample.value * settings.noiseHeadingScale;
    setVelocity(steering::directionOf(heading) * speed_);

    // occasionally recentre on the actual direction of travel
    if (ctx.rng.uniform() * static_cast<float>(settings.recenterPeriod) < 1.0f)
    {
        trajectory_ = steering::normalizedOrZero(velocity_);
        noiseState_.phase = static_cast<float>(ctx.rng.uniformInt(0, 9));
    }
}

void Kinder::beginContest(Kinder &a, Kinder &b, RandomSource &rng, const SimulationSettings &settings)
{
    sf::Vector2f towardB = steering::normalizedOrZero(b.position_ - a.position_);
    if (towardB == sf::Vector2f(0.0f, 0.0f))
        towardB = steering::directionOf(a.heading_);

    a.trajectory_ = towardB;
    a.heading_ = steering::headingOf(towardB);
    b.trajectory_ = -towardB;
    b.heading_ = steering::headingOf(-towardB);

    a.velocity_ = {0.0f, 0.0f};
    b.velocity_ = {0.0f, 0.0f};
    a.runTimer_ = 0;
    b.runTimer_ = 0;

    bool aSnatches = rollSnatcher(a.score_, b.score_, rng);

    a.contest_.engaged = true;
    a.contest_.timer = settings.contestDuration;
    a.contest_.opponent = b.id_;
    a.contest_.snatcher = aSnatches;

    b.contest_.engaged = true;
    b.contest_.timer = settings.contestDuration;
    b.contest_.opponent = a.id_;
    b.contest_.snatcher = !aSnatches;
}

void Kinder::advanceContest(SimulationContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    --contest_.timer;

    if (contest_.timer == settings.snatchTick)
    {
        if (contest_.snatcher && contest_.opponent >= 0)
        {
            Kinder &victim = ctx.kinder[static_cast<size_t>(contest_.opponent)];
            int moved = snatchBlocks(*this, victim, ctx.blocks);
            ++ctx.audit.snatches;
            ctx.audit.blocksTransferred += static_cast<std::uint64_t>(moved);
        }

        // turn around and walk off for the rest of the contest
        trajectory_ = -trajectory_;
        setVelocity(steering::normalizedOrZero(trajectory_) * speed_);
    }

    if (contest_.timer <= 0)
    {
        contest_.engaged = false;
        contest_.lastOpponent = contest_.opponent;
        contest_.opponent = -1;
        contest_.snatcher = false;
        contest_.timer = 0;
    }
}

void Kinder::abandonContest()
{
    contest_.engaged = false;
    contest_.opponent = -1;
    contest_.snatcher = false;
    contest_.timer = 0;
}

void Kinder::seekBed(SimulationContext &ctx)
{
    int bed = EconomyController::nearestAvailableBed(ctx, position_);
    if (bed < 0)
    {
        // more kinder than beds, the rest keep wandering
        steerFreely(ctx);
        return;
    }

    sf::Vector2f toBed = ctx.beds[static_cast<size_t>(bed)].position - position_;
    float distance = std::sqrt(toBed.x * toBed.x + toBed.y * toBed.y);
    if (distance <= speed_)
        setVelocity(toBed);
    else
        setVelocity(toBed / distance * speed_);
}

void Kinder::move()
{
    position_ += velocity_;
}

void Kinder::setVelocity(const sf::Vector2f &velocity)
{
    velocity_ = velocity;
    if (velocity_ != sf::Vector2f(0.0f, 0.0f))
        heading_ = steering::headingOf(velocity_);
}

void Kinder::setTrajectory(const sf::Vector2f &trajectory)
{
    trajectory_ = steering::normalizedOrZero(trajectory);
}

void Kinder::receiveBlock(size_t blockIndex)
{
    heldBlocks_.push_back(blockIndex);
    ++score_;
}

size_t Kinder::surrenderBlock()
{
    size_t top = heldBlocks_.back();
    heldBlocks_.pop_back();
    --score_;
    return top;
}

std::vector<size_t> Kinder::releaseAllBlocks()
{
    std::vector<size_t> released;
    released.swap(heldBlocks_);
    score_ = 0;
    return released;
}

void Kinder::sleepIn(const Bed &bed, size_t bedIndex)
{
    velocity_ = {0.0f, 0.0f};
    position_ = bed.position;
    runTimer_ = 0;
    asleep_ = true;
    bedIndex_ = static_cast<int>(bedIndex);
}

void Kinder::wake()
{
    asleep_ = false;
    bedIndex_ = -1;
}

sf::FloatRect Kinder::getBounds(float halfExtent) const
{
    return steering::boxAround(position_, halfExtent);
}

std::vector<Kinder> KinderFactory::createKinder(const SimulationSettings &settings, RandomSource &rng)
{
    std::vector<Kinder> kinder;
    kinder.reserve(static_cast<size_t>(settings.numKinder));

    for (int i = 0; i < settings.numKinder; ++i)
    {
        sf::Vector2f position = getSpawnPosition(settings, rng);
        float heading = rng.uniformRange(0.0f, 360.0f);
        auto noiseSeed = static_cast<std::uint32_t>(rng.uniformInt(1, 1000));
        kinder.emplace_back(i, position, steering::directionOf(heading), settings.kinderSpeed, noiseSeed);
    }

    return kinder;
}

sf::Vector2f KinderFactory::getSpawnPosition(const SimulationSettings &settings, RandomSource &rng)
{
    // whole hit box inside the margin
    float size = 2.0f * settings.kinderHalfExtent;
    float left = settings.margin + (settings.width - 2.0f * settings.margin - size - 1.0f) * rng.uniform();
    float top = settings.margin + (settings.height - 2.0f * settings.margin - size - 1.0f) * rng.uniform();
    return {left + settings.kinderHalfExtent, top + settings.kinderHalfExtent};
}
