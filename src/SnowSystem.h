#pragma once

#include "IGeometryProvider.h"
#include "IRenderer.h"
#include "ObstacleSet.h"
#include "RandomSource.h"
#include "SnowConfig.h"
#include "Snowflake.h"

#include <glm/glm.hpp>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

/**
 * @class SnowSystem
 * @brief Owns the flake pool and drives one simulation pass per frame.
 * @ingroup Simulation
 *
 * SnowSystem composes the simulation: a fixed pool of Snowflake objects,
 * the current ObstacleSet, the pointer position for the RepulsionField, and
 * the configuration. The host calls OnFrame() once per animation frame.
 *
 * @section snow_architecture System Architecture
 * @htmlonly
 * <pre class="mermaid">
 * flowchart LR
 *     classDef input fill:#164e54,stroke:#06b6d4,color:#e2e8f0
 *     classDef system fill:#1e3a5f,stroke:#3b82f6,color:#e2e8f0
 *     classDef particle fill:#4a3520,stroke:#f59e0b,color:#e2e8f0
 *
 *     G[IGeometryProvider]:::input -->|RefreshObstacles| OS[ObstacleSet]:::system
 *     P[Pointer]:::input --> RF[RepulsionField]:::system
 *     OS --> SS[SnowSystem]:::system
 *     RF --> SS
 *     SS --> F[Snowflake Pool]:::particle
 *     F --> R[IRenderer]
 * </pre>
 * @endhtmlonly
 *
 * @section snow_frame Frame Pass
 * OnFrame() runs Update() then Render():
 * 1. Take the current obstacle snapshot and build the RepulsionField
 * 2. Update every flake in pool order (forces, integrate, wrap, respawn, land)
 * 3. BeginFrame(), clear, draw the backdrop (if any), one circle per
 *    flake, EndFrame()
 *
 * @section snow_lifecycle Lifecycle
 * | Call               | While stopped              | While running          |
 * |--------------------|----------------------------|------------------------|
 * | Start()            | spawn pool, refresh, run   | no-op, returns false   |
 * | Stop()             | no-op                      | stop running           |
 * | OnFrame()          | no-op                      | one pass               |
 * | RefreshObstacles() | no-op                      | rebuild obstacle set   |
 *
 * @par Pool Stability
 * The pool is allocated once in Start() and never resized while running,
 * so a flake's index and address are stable across frames.
 *
 * @par Obstacle Snapshots
 * Obstacles are held as `shared_ptr<const ObstacleSet>` and replaced
 * wholesale. A refresh never mutates a set a frame might be reading.
 *
 * @par Threading
 * Single-threaded. Input, refresh and frame ticks must come from the
 * same thread.
 */
class SnowSystem
{
public:
    /// @brief Construct with a randomly seeded MersenneRandomSource.
    SnowSystem();

    /**
     * @brief Construct with an injected random source.
     * @param rng Random source; must not be null.
     */
    explicit SnowSystem(std::unique_ptr<IRandomSource> rng);

    /**
     * @brief Start a simulation run.
     *
     * Copies @p config, binds the collaborators, spawns
     * `config.flakeCount` flakes (the first `midFieldFraction` of them
     * across the visible height, the rest above the top edge), and
     * performs the initial obstacle refresh.
     *
     * @param config   Configuration, already merged over defaults.
     * @param viewSize Visible surface size (px).
     * @param renderer Drawing surface; may be null for headless runs.
     * @param geometry Element geometry source; may be null (no obstacles).
     * @return `false` if already running (nothing is changed).
     */
    bool Start(const SnowConfig &config, glm::vec2 viewSize, IRenderer *renderer,
               const IGeometryProvider *geometry);

    /**
     * @brief Stop running. The next Start() begins a fresh simulation.
     */
    void Stop();

    bool IsRunning() const { return m_Running; }

    /**
     * @brief Rebuild the obstacle set from the geometry provider.
     *
     * Resolves every configured selector, skipping (and logging) invalid
     * ones, de-duplicates elements matched by several selectors, and
     * filters out rectangles outside the visible height. No selectors or
     * no matches give an empty set.
     */
    void RefreshObstacles();

    /**
     * @brief Update the visible size and refresh obstacles.
     */
    void Resize(glm::vec2 viewSize);

    /**
     * @brief Move the repulsion point. Ignored when mouse interaction is off.
     */
    void SetPointer(glm::vec2 position);

    /**
     * @brief Forget the pointer (e.g. it left the window).
     */
    void ClearPointer();

    /**
     * @brief Color the surface is cleared to before flakes are drawn.
     *
     * Defaults to fully transparent so overlay windows show what is
     * behind them.
     */
    void SetClearColor(glm::vec4 color) { m_ClearColor = color; }

    /**
     * @brief Host drawing run after the clear and before the flakes.
     *
     * Pass an empty function to remove it.
     */
    void SetBackdrop(std::function<void(IRenderer &)> backdrop) { m_Backdrop = std::move(backdrop); }

    /**
     * @brief Run one full simulation and render pass.
     * @param timeMs Monotonic time in milliseconds.
     */
    void OnFrame(double timeMs);

    /**
     * @brief Simulation half of OnFrame().
     */
    void Update(double timeMs);

    /**
     * @brief Render half of OnFrame(): one complete renderer frame.
     *
     * Brackets the clear, the backdrop and the flakes with
     * BeginFrame()/EndFrame(), so batched backends flush before the host
     * presents.
     */
    void Render(IRenderer &renderer) const;

    /**
     * @brief Draw one circle per flake without clearing or framing.
     */
    void DrawFlakes(IRenderer &renderer) const;

    const std::vector<Snowflake> &GetFlakes() const { return m_Flakes; }
    const ObstacleSet &GetObstacles() const { return *m_Obstacles; }
    const SnowConfig &GetConfig() const { return m_Config; }
    glm::vec2 GetViewSize() const { return m_ViewSize; }
    glm::vec2 GetPointer() const { return m_Pointer; }

private:
    void SpawnFlakes();

    SnowConfig m_Config;                            ///< Configuration for this run.
    std::vector<Snowflake> m_Flakes;                ///< Fixed flake pool.
    std::shared_ptr<const ObstacleSet> m_Obstacles; ///< Current obstacle snapshot.
    std::unique_ptr<IRandomSource> m_Rng;           ///< Injected random source.
    IRenderer *m_Renderer;                          ///< Drawing surface (not owned).
    const IGeometryProvider *m_Geometry;            ///< Element geometry (not owned).
    glm::vec2 m_ViewSize;                           ///< Visible size (px).
    glm::vec2 m_Pointer;                            ///< Repulsion point.
    glm::vec4 m_ClearColor;                         ///< Background for Render().
    std::function<void(IRenderer &)> m_Backdrop;    ///< Drawn under the flakes.
    bool m_Running;                                 ///< Between Start() and Stop().
};
