#include "SnowSystem.h"
#include "RepulsionField.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_set>
#include <utility>

SnowSystem::SnowSystem()
    : SnowSystem(std::make_unique<MersenneRandomSource>())
{
}

SnowSystem::SnowSystem(std::unique_ptr<IRandomSource> rng)
    : m_Obstacles(std::make_shared<const ObstacleSet>())  // No obstacles until first refresh
    , m_Rng(std::move(rng))                               // Spawn and landing randomness
    , m_Renderer(nullptr)                                 // Drawing surface, bound in Start()
    , m_Geometry(nullptr)                                 // Element geometry, bound in Start()
    , m_ViewSize(0.0f)                                    // Visible area in pixels
    , m_Pointer(RepulsionField::NoPointer())              // Far away until input arrives
    , m_ClearColor(0.0f)                                  // Transparent background
    , m_Running(false)
{
}

bool SnowSystem::Start(const SnowConfig &config, glm::vec2 viewSize, IRenderer *renderer,
                       const IGeometryProvider *geometry)
{
    // Second Start() must not respawn or reset anything
    if (m_Running)
        return false;

    m_Config = config;
    m_ViewSize = viewSize;
    m_Renderer = renderer;
    m_Geometry = geometry;
    m_Pointer = RepulsionField::NoPointer();

    SpawnFlakes();
    m_Running = true;
    RefreshObstacles();

    std::cout << "SnowSystem started: " << m_Flakes.size() << " flakes, "
              << m_ViewSize.x << "x" << m_ViewSize.y << " view, "
              << m_Obstacles->Size() << " obstacles" << std::endl;
    return true;
}

void SnowSystem::Stop()
{
    if (!m_Running)
        return;

    m_Running = false;
    std::cout << "SnowSystem stopped" << std::endl;
}

void SnowSystem::SpawnFlakes()
{
    size_t count = static_cast<size_t>(std::max(0, m_Config.flakeCount));
    float fraction = std::clamp(m_Config.midFieldFraction, 0.0f, 1.0f);
    size_t midFieldCount = static_cast<size_t>(std::lround(fraction * static_cast<float>(count)));

    m_Flakes.assign(count, Snowflake());
    for (size_t i = 0; i < count; ++i)
    {
        // Seed part of the first population across the screen so the
        // opening frames don't show one solid wave entering from the top
        SpawnMode mode = (i < midFieldCount) ? SpawnMode::MidField : SpawnMode::New;
        m_Flakes[i].Spawn(mode, m_Config, m_ViewSize, *m_Rng);
    }
}

void SnowSystem::RefreshObstacles()
{
    if (!m_Running || !m_Geometry || m_Config.collectSelectors.empty())
    {
        m_Obstacles = std::make_shared<const ObstacleSet>();
        return;
    }

    std::vector<ElementRect> resolved;
    for (const std::string &selector : m_Config.collectSelectors)
    {
        if (!m_Geometry->ResolveSelector(selector, resolved))
        {
            std::cerr << "WARNING: Invalid selector \"" << selector << "\"" << std::endl;
        }
    }

    // An element matched by several selectors only counts once
    std::vector<ElementRect> unique;
    unique.reserve(resolved.size());
    std::unordered_set<int> seen;
    for (const ElementRect &rect : resolved)
    {
        if (rect.elementId >= 0 && !seen.insert(rect.elementId).second)
            continue;
        unique.push_back(rect);
    }

    m_Obstacles = std::make_shared<const ObstacleSet>(ObstacleSet::FromRects(unique, m_ViewSize.y));
}

void SnowSystem::Resize(glm::vec2 viewSize)
{
    m_ViewSize = viewSize;
    RefreshObstacles();
}

void SnowSystem::SetPointer(glm::vec2 position)
{
    if (!m_Config.mouseInteraction)
        return;

    m_Pointer = position;
}

void SnowSystem::ClearPointer()
{
    m_Pointer = RepulsionField::NoPointer();
}

void SnowSystem::OnFrame(double timeMs)
{
    if (!m_Running)
        return;

    Update(timeMs);

    if (m_Renderer)
    {
        Render(*m_Renderer);
    }
}

void SnowSystem::Update(double timeMs)
{
    if (!m_Running)
        return;

    // Hold the snapshot for the whole pass; a refresh swaps the pointer, not the set
    std::shared_ptr<const ObstacleSet> obstacles = m_Obstacles;
    RepulsionField repulsion(m_Pointer, m_Config.mouseRepulsionRadius, m_Config.mouseInteraction);

    FlakeContext ctx{m_Config, m_ViewSize, repulsion, *obstacles, timeMs, *m_Rng};
    for (Snowflake &flake : m_Flakes)
    {
        flake.Update(ctx);
    }
}

void SnowSystem::Render(IRenderer &renderer) const
{
    renderer.BeginFrame();
    renderer.Clear(m_ClearColor.r, m_ClearColor.g, m_ClearColor.b, m_ClearColor.a);
    if (m_Backdrop)
    {
        m_Backdrop(renderer);
    }
    DrawFlakes(renderer);
    renderer.EndFrame();
}

void SnowSystem::DrawFlakes(IRenderer &renderer) const
{
    for (const Snowflake &flake : m_Flakes)
    {
        renderer.DrawFilledCircle(flake.GetPosition(), flake.GetSize(),
                                  glm::vec4(1.0f, 1.0f, 1.0f, flake.GetDrawOpacity()));
    }
}
