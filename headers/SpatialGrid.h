#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class Kinder;
struct SimulationContext;

// a kinder mapped outside the grid: boundary handling has failed, the run cannot go on
class GridInvariantError : public std::logic_error
{
public:
    GridInvariantError(int kinderId, int score, sf::Vector2f position, int row, int column);

    int getKinderId() const { return kinderId_; }

private:
    int kinderId_;
    static std::string describe(int kinderId, int score, sf::Vector2f position, int row, int column);
};

/**
 * fixed rows x columns bucket grid over the arena
 * rebuilt from scratch every tick, replaces O(n^2) pairwise checks with a
 * per cell scan when looking for contest pairs
 */
class SpatialGrid
{
public:
    static constexpr size_t ESTIMATED_KINDER_PER_CELL = 4;

    struct Cell
    {
        std::vector<size_t> kinderIndices;

        Cell()
        {
            kinderIndices.reserve(ESTIMATED_KINDER_PER_CELL);
        }

        void clear()
        {
            kinderIndices.clear();
        }

        void addKinder(size_t kinderIndex)
        {
            kinderIndices.push_back(kinderIndex);
        }
    };

    SpatialGrid(int rows, int columns, int cellWidth, int cellHeight);
    ~SpatialGrid() = default;

    // core operations
    void clear();
    // throws GridInvariantError when the kinder maps outside the grid
    void insert(const Kinder &kinder);

    // (row, column) for a world position, unchecked
    std::pair<int, int> cellOf(const sf::Vector2f &position) const;

    // starts at most one contest per cell, only during block saturation
    // returns the number of contests started
    int resolveContests(SimulationContext &ctx);

    const Cell &cellAt(int row, int column) const { return cells_[index(row, column)]; }
    int getRows() const { return rows_; }
    int getColumns() const { return columns_; }
    int getCellWidth() const { return cellWidth_; }
    int getCellHeight() const { return cellHeight_; }

    // crowding report for the headless summary
    size_t getOccupiedCellCount() const;
    size_t getTotalKinderEntries() const;
    size_t getBusiestCellCount() const;
    void printStatistics(std::ostream &out = std::cout) const;

private:
    int rows_;
    int columns_;
    int cellWidth_;
    int cellHeight_;
    std::vector<Cell> cells_; // row major

    size_t index(int row, int column) const
    {
        return static_cast<size_t>(row) * static_cast<size_t>(columns_) + static_cast<size_t>(column);
    }
};
