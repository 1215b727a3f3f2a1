#pragma once
#include <cstdint>
#include <string>

class SimulationSettings
{
public:
    // arena settings
    int width = 1280;
    int height = 720;
    int margin = 2;

    // population settings
    int numKinder = 25;
    int numBlocks = 50;

    // spatial grid (cell size = arena / cells, integer division)
    int gridRows = 12;
    int gridColumns = 20;

    // hit boxes (half side length of the square box)
    float kinderHalfExtent = 24.0f;
    float blockHalfExtent = 8.0f;
    float bedHalfExtent = 24.0f;

    // movement settings
    float kinderSpeed = 2.0f;        // pixels per tick, constant per kinder
    int recenterPeriod = 120;        // 1 in N chance per tick to recentre the trajectory
    float noiseStepDivisor = 200.0f; // phase advance = speed / divisor
    float noiseHeadingScale = 360.0f;
    int boundaryRunFrames = 0;       // frames to keep running after a bounce (0 = steer right away)

    // contest settings
    int contestDuration = 90;
    int snatchTick = 30; // timer value at which the snatcher takes blocks

    // nap time (0 = automatic, min(perimeter slots, kinder count))
    int numBeds = 0;

    // run settings
    std::uint64_t seed = 12345;
    int stepsPerFrame = 1;
    int targetFps = 60;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();

    // throws std::invalid_argument when the arena/grid/bed layout cannot work
    void validate() const;

    int cellWidth() const { return width / gridColumns; }
    int cellHeight() const { return height / gridRows; }

    // grid cells touching the arena border, each one a possible bed slot
    int perimeterSlots() const;
    int bedCapacity() const;
};
