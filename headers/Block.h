#pragma once
#include <SFML/System/Vector2.hpp>

// a collectible block: on the field (owner == -1) or held by exactly one kinder
struct Block
{
    int id;
    sf::Vector2f position;
    int owner; // kinder id, -1 = on the field

    // where held blocks are parked, outside every grid cell and hit box test
    static constexpr float OFF_FIELD = -1000.0f;

    Block(int blockId, float x, float y)
        : id(blockId), position(x, y), owner(-1) {}

    bool isOnField() const { return owner < 0; }
};
