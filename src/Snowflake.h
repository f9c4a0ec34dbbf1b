#pragma once

#include "ObstacleSet.h"
#include "RandomSource.h"
#include "RepulsionField.h"
#include "SnowConfig.h"

#include <glm/glm.hpp>

/**
 * @enum FlakeState
 * @brief Lifecycle phase of a snowflake.
 */
enum class FlakeState
{
    Falling,  ///< Moving under wind, drift and repulsion
    Landed    ///< Resting on an obstacle and melting
};

/**
 * @enum SpawnMode
 * @brief Where a (re)spawned flake starts vertically.
 */
enum class SpawnMode
{
    New,      ///< Just above the top edge (y = -20)
    MidField  ///< Anywhere in the visible height; initial population only
};

/**
 * @struct FlakeContext
 * @brief Everything a flake reads during one update.
 * @ingroup Simulation
 *
 * Built once per frame by SnowSystem and shared by all flakes, so every
 * flake sees the same obstacles, pointer and time.
 */
struct FlakeContext
{
    const SnowConfig &config;        ///< Active configuration.
    glm::vec2 viewSize;              ///< Visible width and height (px).
    const RepulsionField &repulsion; ///< Pointer repulsion for this frame.
    const ObstacleSet &obstacles;    ///< Obstacle snapshot for this frame.
    double timeMs;                   ///< Monotonic time for the drift wave (ms).
    IRandomSource &rng;              ///< Random source for respawns and landing rolls.
};

/**
 * @class Snowflake
 * @brief A single falling, landing and melting particle.
 * @ingroup Simulation
 *
 * Flakes live in a fixed pool owned by SnowSystem and are never destroyed;
 * leaving the screen or finishing a melt reinitializes the same object in
 * place through Spawn().
 *
 * @section flake_states State Machine
 * @htmlonly
 * <pre class="mermaid">
 * stateDiagram-v2
 *     classDef falling fill:#1e3a5f,stroke:#3b82f6,color:#e2e8f0
 *     classDef landed fill:#4a3520,stroke:#f59e0b,color:#e2e8f0
 *
 *     [*] --> Falling: Spawn
 *     Falling --> Falling: integrate / wrap
 *     Falling --> Falling: y > height (respawn)
 *     Falling --> Landed: in landing window, roll < stickiness
 *     Landed --> Landed: meltOpacity -= meltSpeed
 *     Landed --> Falling: meltOpacity <= 0 (respawn)
 *
 *     class Falling falling
 *     class Landed landed
 * </pre>
 * @endhtmlonly
 *
 * @section flake_motion Falling Motion
 * Each frame the displacement is
 * @f[
 * \Delta x = v_x + wind \cdot z + \sin(0.01\,y + 0.002\,t) \cdot 0.5 \cdot z, \qquad
 * \Delta y = v_y
 * @f]
 * plus the RepulsionField displacement. @f$ v_y @f$ is fixed at spawn.
 *
 * @section flake_landing Landing
 * Only flakes with @f$ z > 0.4 @f$ collide. For an obstacle spanning
 * @f$ left < x < right @f$ the landing height is
 * @f[
 * landY = top - 0.5 \cdot size + stackOffset
 * @f]
 * and a flake with @f$ landY \le y \le landY + 10 @f$ lands if a random roll
 * is below the stickiness. The first obstacle that lands the flake wins.
 *
 * @section flake_spawn Spawn Draws
 * Random values are drawn in a fixed order, which tests rely on:
 * 1. depth @f$ z = 0.1 + 0.9r @f$
 * 2. @f$ x = r \cdot width @f$
 * 3. @f$ y = r \cdot height @f$ (MidField only)
 * 4. @f$ v_y = gravity \cdot z + 0.5r @f$
 * 5. @f$ v_x = (r - 0.5) \cdot 0.5 @f$
 * 6. @f$ stackOffset = 4r @f$
 */
class Snowflake
{
public:
    /// @name Tuning Constants
    /// @{
    static constexpr float SPAWN_Y = -20.0f;             ///< Start height for New spawns.
    static constexpr float MIN_DEPTH = 0.1f;             ///< Farthest depth.
    static constexpr float DEPTH_RANGE = 0.9f;           ///< Depth spread above MIN_DEPTH.
    static constexpr float FALL_JITTER = 0.5f;           ///< Extra random fall speed.
    static constexpr float SIDE_JITTER = 0.5f;           ///< Spread of initial vx.
    static constexpr float MAX_STACK_OFFSET = 4.0f;      ///< Landing height irregularity.
    static constexpr float WRAP_MARGIN = 5.0f;           ///< Off-screen slack before wrapping.
    static constexpr float COLLISION_MIN_DEPTH = 0.4f;   ///< Flakes at or behind this never land.
    static constexpr float LANDING_WINDOW = 10.0f;       ///< Capture band below landY.
    static constexpr float DRIFT_AMPLITUDE = 0.5f;       ///< Sine drift amplitude at depth 1.
    static constexpr float FALLING_ALPHA_SCALE = 0.8f;   ///< Falling opacity = z * scale.
    /// @}

    Snowflake();

    /**
     * @brief (Re)initialize every field of the flake.
     *
     * Resets depth, size, position, velocity, opacity, melt opacity,
     * landed flag and stack offset. Always leaves the flake Falling.
     *
     * @param mode     Vertical placement rule.
     * @param config   Active configuration.
     * @param viewSize Visible width and height (px).
     * @param rng      Random source (six or five draws, see class docs).
     */
    void Spawn(SpawnMode mode, const SnowConfig &config, glm::vec2 viewSize, IRandomSource &rng);

    /**
     * @brief Advance the flake by one frame.
     * @param ctx Shared per-frame context.
     */
    void Update(const FlakeContext &ctx);

    /**
     * @brief Toroidal horizontal wrap with a 5px margin.
     *
     * Positions more than WRAP_MARGIN past the right edge move to
     * -WRAP_MARGIN; positions left of -WRAP_MARGIN move to
     * `width + WRAP_MARGIN`.
     */
    static float WrapX(float x, float width);

    /// @brief Opacity handed to the renderer: meltOpacity if landed, else z * 0.8.
    float GetDrawOpacity() const;

    FlakeState GetState() const { return m_Landed ? FlakeState::Landed : FlakeState::Falling; }
    bool IsLanded() const { return m_Landed; }
    glm::vec2 GetPosition() const { return m_Position; }
    glm::vec2 GetVelocity() const { return m_Velocity; }
    float GetDepth() const { return m_Depth; }
    float GetSize() const { return m_Size; }
    float GetOpacity() const { return m_Opacity; }
    float GetMeltOpacity() const { return m_MeltOpacity; }
    float GetStackOffset() const { return m_StackOffset; }

private:
    void UpdateLanded(const FlakeContext &ctx);
    void UpdateFalling(const FlakeContext &ctx);
    void CheckLanding(const FlakeContext &ctx);

    glm::vec2 m_Position;   ///< Center (px).
    glm::vec2 m_Velocity;   ///< Base motion per frame (px/frame).
    float m_Depth;          ///< Pseudo-3D depth z in [0.1, 1).
    float m_Size;           ///< Radius, always sizeBase * z.
    float m_Opacity;        ///< Base opacity, reset to 1 on spawn.
    float m_MeltOpacity;    ///< Opacity while landed, decays to 0.
    float m_StackOffset;    ///< Per-spawn landing height offset in [0, 4).
    bool m_Landed;          ///< Resting on an obstacle.
};
