#include "Steering.h"
#include "SimulationSettings.h"
#include <cmath>

static constexpr float PI_F = 3.14159265358979323846f;

namespace steering
{
    float headingOf(const sf::Vector2f &v)
    {
        if (v.x != 0.0f)
        {
            float arg = std::atan(v.y / v.x) * 180.0f / PI_F;
            if (v.x < 0.0f)
                arg += 180.0f;
            return arg;
        }
        return v.y >= 0.0f ? 90.0f : 270.0f;
    }

    sf::Vector2f directionOf(float headingDegrees)
    {
        float rad = headingDegrees * PI_F / 180.0f;
        return {std::cos(rad), std::sin(rad)};
    }

    sf::Vector2f normalizedOrZero(const sf::Vector2f &v)
    {
        float len = std::sqrt(v.x * v.x + v.y * v.y);
        if (len <= 0.0f)
            return {0.0f, 0.0f};
        return {v.x / len, v.y / len};
    }

    sf::FloatRect boxAround(const sf::Vector2f &position, float halfExtent)
    {
        return sf::FloatRect({position.x - halfExtent, position.y - halfExtent},
                             {2.0f * halfExtent, 2.0f * halfExtent});
    }

    bool overlaps(const sf::FloatRect &a, const sf::FloatRect &b)
    {
        return a.findIntersection(b).has_value();
    }

    BounceResult bounceOffMargins(sf::Vector2f &position, sf::Vector2f &velocity,
                                  sf::Vector2f &trajectory, float halfExtent,
                                  const SimulationSettings &settings)
    {
        BounceResult result;
        const float lowX = settings.margin + halfExtent;
        const float highX = settings.width - settings.margin - halfExtent;
        const float lowY = settings.margin + halfExtent;
        const float highY = settings.height - settings.margin - halfExtent;

        if (position.x < lowX || position.x > highX)
        {
            position.x = position.x < lowX ? lowX : highX;
            velocity.x = -velocity.x;
            trajectory.x = -trajectory.x;
            result.x = true;
        }
        if (position.y < lowY || position.y > highY)
        {
            position.y = position.y < lowY ? lowY : highY;
            velocity.y = -velocity.y;
            trajectory.y = -trajectory.y;
            result.y = true;
        }
        return result;
    }
}
