#include "SpatialGrid.h"
#include "Kinder.h"
#include "RandomSource.h"
#include "SimulationContext.h"
#include <algorithm>
#include <cmath>
#include <sstream>

GridInvariantError::GridInvariantError(int kinderId, int score, sf::Vector2f position, int row, int column)
    : std::logic_error(describe(kinderId, score, position, row, column)), kinderId_(kinderId)
{
}

std::string GridInvariantError::describe(int kinderId, int score, sf::Vector2f position, int row, int column)
{
    std::ostringstream oss;
    oss << "kinder " << kinderId << " (score " << score << ") at (" << position.x << ", " << position.y
        << ") maps to grid cell (" << row << ", " << column << ") outside the arena";
    return oss.str();
}

SpatialGrid::SpatialGrid(int rows, int columns, int cellWidth, int cellHeight)
    : rows_(rows), columns_(columns), cellWidth_(cellWidth), cellHeight_(cellHeight),
      cells_(static_cast<size_t>(rows) * static_cast<size_t>(columns))
{
}

void SpatialGrid::clear()
{
    for (auto &cell : cells_)
    {
        cell.clear();
    }
}

std::pair<int, int> SpatialGrid::cellOf(const sf::Vector2f &position) const
{
    return {
        static_cast<int>(std::floor(position.y / static_cast<float>(cellHeight_))),
        static_cast<int>(std::floor(position.x / static_cast<float>(cellWidth_)))};
}

void SpatialGrid::insert(const Kinder &kinder)
{
    auto [row, column] = cellOf(kinder.getPosition());
    if (row < 0 || row >= rows_ || column < 0 || column >= columns_)
    {
        throw GridInvariantError(kinder.getId(), kinder.getScore(), kinder.getPosition(), row, column);
    }

    cells_[index(row, column)].addKinder(static_cast<size_t>(kinder.getId()));
}

int SpatialGrid::resolveContests(SimulationContext &ctx)
{
    if (ctx.mode != Mode::Saturation)
        return 0;

    int started = 0;
    std::vector<size_t> eligible;
    std::vector<size_t> candidates;

    for (const auto &cell : cells_)
    {
        // free kinder with something to stake
        eligible.clear();
        for (size_t idx : cell.kinderIndices)
        {
            const Kinder &k = ctx.kinder[idx];
            if (!k.inContest() && !k.isAsleep() && k.getScore() > 0)
                eligible.push_back(idx);
        }
        if (eligible.size() < 2)
            continue;

        size_t pick = static_cast<size_t>(ctx.rng.uniformInt(0, static_cast<int>(eligible.size()) - 1));
        size_t challengerIdx = eligible[pick];
        eligible.erase(eligible.begin() + static_cast<std::ptrdiff_t>(pick));
        const Kinder &challenger = ctx.kinder[challengerIdx];

        // no immediate rematch, and a single block only goes up against a bigger pile
        candidates.clear();
        for (size_t idx : eligible)
        {
            const Kinder &other = ctx.kinder[idx];
            if (other.getId() == challenger.getContest().lastOpponent)
                continue;
            if (challenger.getScore() == 1 && other.getScore() <= 1)
                continue;
            candidates.push_back(idx);
        }
        if (candidates.empty())
            continue;

        size_t opponentIdx = candidates[static_cast<size_t>(
            ctx.rng.uniformInt(0, static_cast<int>(candidates.size()) - 1))];

        Kinder::beginContest(ctx.kinder[challengerIdx], ctx.kinder[opponentIdx], ctx.rng, ctx.settings);
        ++started;
    }

    return started;
}

size_t SpatialGrid::getOccupiedCellCount() const
{
    return static_cast<size_t>(std::count_if(cells_.begin(), cells_.end(),
                                             [](const Cell &cell)
                                             { return !cell.kinderIndices.empty(); }));
}

size_t SpatialGrid::getTotalKinderEntries() const
{
    size_t total = 0;
    for (const auto &cell : cells_)
    {
        total += cell.kinderIndices.size();
    }
    return total;
}

size_t SpatialGrid::getBusiestCellCount() const
{
    size_t busiest = 0;
    for (const auto &cell : cells_)
    {
        busiest = std::max(busiest, cell.kinderIndices.size());
    }
    return busiest;
}

void SpatialGrid::printStatistics(std::ostream &out) const
{
    size_t occupied = getOccupiedCellCount();

    out << "=== Grid ===" << std::endl;
    out << rows_ << "x" << columns_ << " cells of " << cellWidth_ << "x" << cellHeight_ << " px" << std::endl;
    out << "Cells with kinder: " << occupied << " / " << cells_.size() << std::endl;
    out << "Most kinder in one cell: " << getBusiestCellCount() << std::endl;
}
