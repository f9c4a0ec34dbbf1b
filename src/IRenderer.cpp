#include "IRenderer.h"

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

int IRenderer::CircleSegments(float radius)
{
    // Aim for ~2px rim edges
    float circumference = 2.0f * static_cast<float>(M_PI) * std::max(radius, 0.0f);
    int segments = static_cast<int>(std::ceil(circumference / 2.0f));
    return std::clamp(segments, MIN_CIRCLE_SEGMENTS, MAX_CIRCLE_SEGMENTS);
}

void IRenderer::TessellateCircle(glm::vec2 center, float radius, int segments, std::vector<glm::vec2> &rim)
{
    rim.clear();
    if (segments <= 0)
        return;

    rim.reserve(static_cast<size_t>(segments) + 1);
    float step = 2.0f * static_cast<float>(M_PI) / static_cast<float>(segments);
    for (int i = 0; i < segments; i++)
    {
        float angle = step * static_cast<float>(i);
        rim.push_back(glm::vec2(center.x + std::cos(angle) * radius,
                                center.y + std::sin(angle) * radius));
    }

    // Close the fan exactly on the first point to avoid a hairline gap
    rim.push_back(rim.front());
}
