#include "RepulsionField.h"

#include <cmath>

RepulsionField::RepulsionField()
    : m_Point(NoPointer())
    , m_Radius(0.0f)
    , m_Enabled(false)
{
}

RepulsionField::RepulsionField(glm::vec2 point, float radius, bool enabled)
    : m_Point(point)
    , m_Radius(radius)
    , m_Enabled(enabled)
{
}

float RepulsionField::Strength(float distance) const
{
    if (!IsActive() || distance >= m_Radius)
        return 0.0f;

    return (m_Radius - distance) / m_Radius;
}

glm::vec2 RepulsionField::Displacement(glm::vec2 position, float depth) const
{
    if (!IsActive())
        return glm::vec2(0.0f);

    float distX = position.x - m_Point.x;
    float distY = position.y - m_Point.y;
    float dist = std::sqrt(distX * distX + distY * distY);

    if (dist >= m_Radius)
        return glm::vec2(0.0f);

    float force = (m_Radius - dist) / m_Radius;
    float angle = std::atan2(distY, distX);
    return glm::vec2(std::cos(angle), std::sin(angle)) * (force * MAX_PUSH * depth);
}
