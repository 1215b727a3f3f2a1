#include "SimulationSettings.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

bool SimulationSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Kinderdrome Settings\n";
    file << "width=" << width << "\n";
    file << "height=" << height << "\n";
    file << "margin=" << margin << "\n";
    file << "numKinder=" << numKinder << "\n";
    file << "numBlocks=" << numBlocks << "\n";
    file << "gridRows=" << gridRows << "\n";
    file << "gridColumns=" << gridColumns << "\n";
    file << "kinderHalfExtent=" << kinderHalfExtent << "\n";
    file << "blockHalfExtent=" << blockHalfExtent << "\n";
    file << "bedHalfExtent=" << bedHalfExtent << "\n";
    file << "kinderSpeed=" << kinderSpeed << "\n";
    file << "recenterPeriod=" << recenterPeriod << "\n";
    file << "noiseStepDivisor=" << noiseStepDivisor << "\n";
    file << "noiseHeadingScale=" << noiseHeadingScale << "\n";
    file << "boundaryRunFrames=" << boundaryRunFrames << "\n";
    file << "contestDuration=" << contestDuration << "\n";
    file << "snatchTick=" << snatchTick << "\n";
    file << "numBeds=" << numBeds << "\n";
    file << "seed=" << seed << "\n";
    file << "stepsPerFrame=" << stepsPerFrame << "\n";
    file << "targetFps=" << targetFps << "\n";

    return true;
}

bool SimulationSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        try
        {
            if (key == "width")
                width = std::stoi(value);
            else if (key == "height")
                height = std::stoi(value);
            else if (key == "margin")
                margin = std::stoi(value);
            else if (key == "numKinder")
                numKinder = std::stoi(value);
            else if (key == "numBlocks")
                numBlocks = std::stoi(value);
            else if (key == "gridRows")
                gridRows = std::stoi(value);
            else if (key == "gridColumns")
                gridColumns = std::stoi(value);
            else if (key == "kinderHalfExtent")
                kinderHalfExtent = std::stof(value);
            else if (key == "blockHalfExtent")
                blockHalfExtent = std::stof(value);
            else if (key == "bedHalfExtent")
                bedHalfExtent = std::stof(value);
            else if (key == "kinderSpeed")
                kinderSpeed = std::stof(value);
            else if (key == "recenterPeriod")
                recenterPeriod = std::stoi(value);
            else if (key == "noiseStepDivisor")
                noiseStepDivisor = std::stof(value);
            else if (key == "noiseHeadingScale")
                noiseHeadingScale = std::stof(value);
            else if (key == "boundaryRunFrames")
                boundaryRunFrames = std::stoi(value);
            else if (key == "contestDuration")
                contestDuration = std::stoi(value);
            else if (key == "snatchTick")
                snatchTick = std::stoi(value);
            else if (key == "numBeds")
                numBeds = std::stoi(value);
            else if (key == "seed")
                seed = std::stoull(value);
            else if (key == "stepsPerFrame")
                stepsPerFrame = std::stoi(value);
            else if (key == "targetFps")
                targetFps = std::stoi(value);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: Bad value for '" << key << "' on line " << lineNumber
                      << " of " << filename << ": " << e.what() << std::endl;
            return false;
        }
    }

    validateAndClamp();
    return true;
}

void SimulationSettings::validateAndClamp()
{
    margin = std::max(0, margin);
    numKinder = std::clamp(numKinder, 0, 10000);
    numBlocks = std::clamp(numBlocks, 0, 100000);
    kinderHalfExtent = std::max(1.0f, kinderHalfExtent);
    blockHalfExtent = std::max(1.0f, blockHalfExtent);
    bedHalfExtent = std::max(1.0f, bedHalfExtent);
    kinderSpeed = std::clamp(kinderSpeed, 0.1f, 50.0f);
    recenterPeriod = std::max(1, recenterPeriod);
    noiseStepDivisor = std::max(1.0f, noiseStepDivisor);
    boundaryRunFrames = std::max(0, boundaryRunFrames);
    contestDuration = std::max(1, contestDuration);
    snatchTick = std::clamp(snatchTick, 0, contestDuration - 1);
    numBeds = std::max(0, numBeds);
    stepsPerFrame = std::max(1, stepsPerFrame);
    targetFps = std::clamp(targetFps, 1, 240);
}

void SimulationSettings::validate() const
{
    if (gridRows <= 0 || gridColumns <= 0)
    {
        std::ostringstream oss;
        oss << "grid must have at least one row and one column (got "
            << gridRows << "x" << gridColumns << ")";
        throw std::invalid_argument(oss.str());
    }
    if (width <= 0 || height <= 0)
    {
        std::ostringstream oss;
        oss << "arena size must be positive (got " << width << "x" << height << ")";
        throw std::invalid_argument(oss.str());
    }
    if (width % gridColumns != 0 || height % gridRows != 0)
    {
        std::ostringstream oss;
        oss << "arena " << width << "x" << height << " does not divide into a "
            << gridRows << "x" << gridColumns << " grid";
        throw std::invalid_argument(oss.str());
    }

    // a kinder (and a block) has to fit between the margins on both axes
    float inner = 2.0f * (margin + std::max(kinderHalfExtent, blockHalfExtent)) + 1.0f;
    if (width < inner || height < inner)
    {
        std::ostringstream oss;
        oss << "arena " << width << "x" << height << " is too small for a kinder of size "
            << 2.0f * kinderHalfExtent << " with margin " << margin;
        throw std::invalid_argument(oss.str());
    }

    // one tick of movement after a bounce must not carry the centre off the arena
    if (kinderSpeed <= 0.0f || kinderSpeed >= margin + kinderHalfExtent)
    {
        std::ostringstream oss;
        oss << "kinder speed " << kinderSpeed << " must be positive and below margin + half extent ("
            << margin + kinderHalfExtent << ")";
        throw std::invalid_argument(oss.str());
    }

    if (numBeds > perimeterSlots())
    {
        std::ostringstream oss;
        oss << "cannot place " << numBeds << " beds, the grid perimeter only has "
            << perimeterSlots() << " slots";
        throw std::invalid_argument(oss.str());
    }
}

int SimulationSettings::perimeterSlots() const
{
    if (gridRows <= 0 || gridColumns <= 0)
        return 0;
    if (gridRows == 1)
        return gridColumns;
    if (gridColumns == 1)
        return gridRows;
    return 2 * gridColumns + 2 * (gridRows - 2);
}

int SimulationSettings::bedCapacity() const
{
    int wanted = numBeds > 0 ? numBeds : perimeterSlots();
    return std::min(wanted, numKinder);
}
