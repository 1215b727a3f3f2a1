#pragma once
#include <SFML/System/Vector2.hpp>

// nap time resting slot, placed at the centre of a perimeter grid cell
struct Bed
{
    int id;
    int row;
    int column;
    sf::Vector2f position;
    bool occupied = false;
    int occupant = -1; // kinder id while occupied

    Bed(int bedId, int r, int c, float cellWidth, float cellHeight)
        : id(bedId), row(r), column(c),
          position((c + 0.5f) * cellWidth, (r + 0.5f) * cellHeight) {}
};
