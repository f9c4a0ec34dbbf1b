#pragma once

#include <cstddef>
#include <utility>
#include <vector>

/**
 * @struct ElementRect
 * @brief Viewport-space rectangle of one on-screen element.
 * @ingroup Simulation
 *
 * Produced by an IGeometryProvider. `elementId` identifies the element
 * across selectors so an element matched twice yields one obstacle.
 */
struct ElementRect
{
    int elementId = -1;    ///< Stable id of the source element.
    float left = 0.0f;     ///< Left edge (px).
    float top = 0.0f;      ///< Top edge (px).
    float width = 0.0f;    ///< Width (px).
    float height = 0.0f;   ///< Height (px).

    float Right() const { return left + width; }
    float Bottom() const { return top + height; }
};

/**
 * @struct Obstacle
 * @brief Horizontal surface flakes can settle on.
 * @ingroup Simulation
 *
 * Only the top edge matters for landing; the rest of the rectangle is
 * dropped when the obstacle is built.
 */
struct Obstacle
{
    float left;    ///< Left edge (px).
    float right;   ///< Right edge (px).
    float top;     ///< Top edge, the landing surface (px).
    float width;   ///< right - left (px).

    /// @brief True when @p x lies strictly inside (left, right).
    bool SpansX(float x) const { return x > left && x < right; }
};

/**
 * @class ObstacleSet
 * @brief Immutable list of obstacles for one geometry snapshot.
 * @ingroup Simulation
 *
 * An ObstacleSet is built once per geometry refresh and never modified.
 * SnowSystem swaps in a new set wholesale on resize, scroll or explicit
 * refresh, so a frame always sees one consistent snapshot.
 *
 * @par Visibility Filter
 * Rectangles entirely above the viewport (`bottom < 0`) or entirely below
 * it (`top > viewHeight`) are dropped. Partially visible rectangles are kept.
 *
 * @par Ordering
 * Obstacles keep the order of the input rectangles. Collision checks walk
 * them in that order and the first qualifying obstacle wins.
 */
class ObstacleSet
{
public:
    using const_iterator = std::vector<Obstacle>::const_iterator;

    /// @brief Empty set (no collisions).
    ObstacleSet() = default;

    /**
     * @brief Build a set from element rectangles.
     * @param rects      Viewport-space element rectangles.
     * @param viewHeight Visible vertical extent (px).
     */
    static ObstacleSet FromRects(const std::vector<ElementRect> &rects, float viewHeight);

    const std::vector<Obstacle> &GetObstacles() const { return m_Obstacles; }
    bool Empty() const { return m_Obstacles.empty(); }
    std::size_t Size() const { return m_Obstacles.size(); }

    const_iterator begin() const { return m_Obstacles.begin(); }
    const_iterator end() const { return m_Obstacles.end(); }

private:
    explicit ObstacleSet(std::vector<Obstacle> obstacles) : m_Obstacles(std::move(obstacles)) {}

    std::vector<Obstacle> m_Obstacles;
};
