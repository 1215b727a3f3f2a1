#pragma once
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>

class SimulationSettings;

// heading helpers (degrees, counter clockwise from +x)
namespace steering
{
    // angle of a rectangular vector, 90 for straight +y and 270 for straight -y
    float headingOf(const sf::Vector2f &v);
    // unit vector pointing along heading
    sf::Vector2f directionOf(float headingDegrees);
    // unit vector, or zero when v is zero
    sf::Vector2f normalizedOrZero(const sf::Vector2f &v);

    // square hit box centred on position
    sf::FloatRect boxAround(const sf::Vector2f &position, float halfExtent);
    bool overlaps(const sf::FloatRect &a, const sf::FloatRect &b);

    struct BounceResult
    {
        bool x = false;
        bool y = false;
        bool any() const { return x || y; }
    };

    // keeps the hit box inside the arena margin
    // on each axis that crossed, the centre is clamped just inside and that
    // component of both velocity and trajectory is negated
    BounceResult bounceOffMargins(sf::Vector2f &position, sf::Vector2f &velocity,
                                  sf::Vector2f &trajectory, float halfExtent,
                                  const SimulationSettings &settings);
}
