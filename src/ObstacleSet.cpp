#include "ObstacleSet.h"

#include <utility>

ObstacleSet ObstacleSet::FromRects(const std::vector<ElementRect> &rects, float viewHeight)
{
    std::vector<Obstacle> obstacles;
    obstacles.reserve(rects.size());

    for (const ElementRect &rect : rects)
    {
        // Skip elements scrolled fully out of view
        if (rect.Bottom() < 0.0f || rect.top > viewHeight)
            continue;

        obstacles.push_back({rect.left, rect.Right(), rect.top, rect.width});
    }

    return ObstacleSet(std::move(obstacles));
}
