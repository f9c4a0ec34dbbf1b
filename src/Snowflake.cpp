#include "Snowflake.h"

#include <algorithm>
#include <cmath>

Snowflake::Snowflake()
    : m_Position(0.0f)
    , m_Velocity(0.0f)
    , m_Depth(MIN_DEPTH)
    , m_Size(0.0f)
    , m_Opacity(1.0f)
    , m_MeltOpacity(1.0f)
    , m_StackOffset(0.0f)
    , m_Landed(false)
{
}

void Snowflake::Spawn(SpawnMode mode, const SnowConfig &config, glm::vec2 viewSize, IRandomSource &rng)
{
    // Depth: 0.1 (far) to just under 1.0 (near)
    m_Depth = MIN_DEPTH + rng.NextFloat() * DEPTH_RANGE;
    m_Depth = std::min(m_Depth, std::nextafter(1.0f, 0.0f));
    m_Size = config.sizeBase * m_Depth;

    m_Position.x = rng.NextFloat() * viewSize.x;
    m_Position.y = (mode == SpawnMode::MidField) ? rng.NextFloat() * viewSize.y : SPAWN_Y;

    m_Velocity.y = config.gravity * m_Depth + rng.NextFloat() * FALL_JITTER;
    m_Velocity.x = (rng.NextFloat() - 0.5f) * SIDE_JITTER;

    m_Opacity = 1.0f;
    m_MeltOpacity = 1.0f;
    m_Landed = false;
    m_StackOffset = rng.NextFloat() * MAX_STACK_OFFSET;
}

void Snowflake::Update(const FlakeContext &ctx)
{
    if (m_Landed)
    {
        UpdateLanded(ctx);
        return;
    }

    UpdateFalling(ctx);
}

void Snowflake::UpdateLanded(const FlakeContext &ctx)
{
    m_MeltOpacity -= ctx.config.meltSpeed;
    if (m_MeltOpacity <= 0.0f)
    {
        Spawn(SpawnMode::New, ctx.config, ctx.viewSize, ctx.rng);
    }
}

void Snowflake::UpdateFalling(const FlakeContext &ctx)
{
    const SnowConfig &conf = ctx.config;

    // Wind plus a depth-scaled sine drift that travels down the screen over time
    double wave = std::sin(static_cast<double>(m_Position.y) * 0.01 + ctx.timeMs * 0.002);
    glm::vec2 delta;
    delta.x = m_Velocity.x + conf.wind * m_Depth + static_cast<float>(wave) * DRIFT_AMPLITUDE * m_Depth;
    delta.y = m_Velocity.y;

    delta += ctx.repulsion.Displacement(m_Position, m_Depth);

    m_Position += delta;

    m_Position.x = WrapX(m_Position.x, ctx.viewSize.x);
    if (m_Position.y > ctx.viewSize.y)
    {
        Spawn(SpawnMode::New, conf, ctx.viewSize, ctx.rng);
    }

    // Far flakes pass behind the page and never collide
    if (m_Depth > COLLISION_MIN_DEPTH && !ctx.obstacles.Empty())
    {
        CheckLanding(ctx);
    }
}

void Snowflake::CheckLanding(const FlakeContext &ctx)
{
    for (const Obstacle &obs : ctx.obstacles)
    {
        if (!obs.SpansX(m_Position.x))
            continue;

        float landY = obs.top - m_Size * 0.5f + m_StackOffset;
        if (m_Position.y < landY || m_Position.y > landY + LANDING_WINDOW)
            continue;

        if (ctx.rng.NextFloat() < ctx.config.stickiness)
        {
            m_Landed = true;
            m_Position.y = landY;
            return;
        }
    }
}

float Snowflake::WrapX(float x, float width)
{
    if (x > width + WRAP_MARGIN)
        return -WRAP_MARGIN;
    if (x < -WRAP_MARGIN)
        return width + WRAP_MARGIN;
    return x;
}

float Snowflake::GetDrawOpacity() const
{
    return m_Landed ? m_MeltOpacity : m_Depth * FALLING_ALPHA_SCALE;
}
