#pragma once

#include <glm/glm.hpp>

/**
 * @class RepulsionField
 * @brief Radial push away from a tracked point (the pointer).
 * @ingroup Simulation
 *
 * The field is described by a point @f$ P @f$ and a radius @f$ R @f$.
 * A flake at distance @f$ d < R @f$ from @f$ P @f$ receives a per-frame
 * displacement directed away from the point:
 *
 * @f[
 * force = \frac{R - d}{R}, \qquad
 * \vec{\Delta} = (\cos\theta, \sin\theta) \cdot force \cdot 5 \cdot z
 * @f]
 *
 * where @f$ \theta = atan2(y - P_y, x - P_x) @f$ and @f$ z @f$ is the flake
 * depth, so near flakes are pushed harder than far ones.
 *
 * | Distance        | force |
 * |-----------------|-------|
 * | @f$ d = 0 @f$   | 1.0   |
 * | @f$ d = R/2 @f$ | 0.5   |
 * | @f$ d \ge R @f$ | 0.0   |
 *
 * @par Disabled Field
 * When disabled, or when @f$ R \le 0 @f$, no force is computed at all.
 *
 * @par No Pointer
 * Without pointer input the point sits at NoPointer(), far outside any
 * reachable viewport position, so no flake is ever inside the radius.
 */
class RepulsionField
{
public:
    /// @brief Displacement scale at full force and depth 1.
    static constexpr float MAX_PUSH = 5.0f;

    RepulsionField();
    RepulsionField(glm::vec2 point, float radius, bool enabled);

    /// @brief Sentinel location meaning "no pointer".
    static glm::vec2 NoPointer() { return glm::vec2(-1.0e9f, -1.0e9f); }

    /// @brief True when the field can push anything at all.
    bool IsActive() const { return m_Enabled && m_Radius > 0.0f; }

    /**
     * @brief Linear falloff for a given distance.
     * @param distance Distance from the repulsion point (px).
     * @return 1 at the center, 0 at or beyond the radius; 0 if inactive.
     */
    float Strength(float distance) const;

    /**
     * @brief Per-frame displacement for a flake.
     * @param position Flake position (px).
     * @param depth    Flake depth z.
     * @return Displacement to add this frame; zero outside the radius.
     */
    glm::vec2 Displacement(glm::vec2 position, float depth) const;

    glm::vec2 GetPoint() const { return m_Point; }
    float GetRadius() const { return m_Radius; }

private:
    glm::vec2 m_Point;  ///< Repulsion center (px).
    float m_Radius;     ///< Radius of influence (px).
    bool m_Enabled;     ///< Whether pointer interaction is on.
};
