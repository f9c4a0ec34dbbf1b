/**
 * @file DoxygenGroups.h
 * @brief Doxygen module definitions.
 *
 * The codebase is split into three modules:
 *
 * \htmlonly
 * <pre class="mermaid">
 * flowchart TB
 * classDef sim fill:#1e3a5f,stroke:#3b82f6,color:#e2e8f0
 * classDef render fill:#2e1f5e,stroke:#8b5cf6,color:#e2e8f0
 * classDef platform fill:#164e54,stroke:#06b6d4,color:#e2e8f0
 *
 * Platform["Platform"]:::platform
 * Simulation["Simulation"]:::sim
 * Rendering["Rendering"]:::render
 *
 * Platform --> Simulation
 * Platform --> Rendering
 * Simulation --> Rendering
 * </pre>
 * \endhtmlonly
 */

/**
 * @defgroup Simulation Simulation
 * @brief The snow itself: flakes, obstacles, repulsion and configuration.
 *
 * Everything here is windowing-free and is linked into the `flurry_core`
 * library, so it runs headless in tests.
 *
 * @par Per-Frame Order
 * 1. Snapshot obstacles, build the repulsion field
 * 2. For each flake: melt if landed, otherwise drift, integrate, wrap,
 *    respawn past the bottom and try to land
 * 3. Draw one circle per flake
 *
 * @par Units
 * Positions are in surface pixels with a top-left origin. Velocities, melt
 * speed and forces are per animation frame, not per second.
 *
 * @see SnowSystem, Snowflake, ObstacleSet, RepulsionField, SnowConfig
 */

/**
 * @defgroup Rendering Rendering
 * @brief Drawing interface and the OpenGL backend.
 *
 * The simulation only draws filled circles through IRenderer. The OpenGL
 * backend batches them into one buffer per frame.
 *
 * @see IRenderer, OpenGLRenderer
 */

/**
 * @defgroup Platform Platform
 * @brief Window, input, scene geometry and config file handling.
 *
 * @see SnowApp, SceneGeometry, AppConfig
 */
