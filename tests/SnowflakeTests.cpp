#include <gtest/gtest.h>
#include "../src/Snowflake.h"
#include "../src/RepulsionField.h"
#include "TestDoubles.h"

#include <cmath>

// Spawn draws, in order: depth, x, y (mid-field only), fall jitter, side jitter, stack offset
class SnowflakeTest : public ::testing::Test
{
protected:
    SnowConfig config;
    glm::vec2 viewSize{800.0f, 610.0f};
    RepulsionField noRepulsion;
    ObstacleSet noObstacles;
    ObstacleSet ledge;

    void SetUp() override
    {
        config.gravity = 0.0f;
        config.wind = 0.0f;
        config.sizeBase = 2.0f;
        config.stickiness = 1.0f;
        config.meltSpeed = 0.25f;

        // Top edge at y=300, spanning x 350..450
        ledge = ObstacleSet::FromRects({MakeRect(0, 350.0f, 300.0f, 100.0f, 50.0f)}, viewSize.y);
    }

    FlakeContext Context(IRandomSource &rng, const ObstacleSet &obstacles, double timeMs = 0.0)
    {
        return FlakeContext{config, viewSize, noRepulsion, obstacles, timeMs, rng};
    }
};

// --- Spawn Tests ---

TEST_F(SnowflakeTest, Spawn_DepthAndSizeFromFirstDraw)
{
    SequenceRandomSource rng({0.5f, 0.25f, 0.0f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::New, config, viewSize, rng);

    EXPECT_NEAR(flake.GetDepth(), 0.55f, 1e-6f);
    EXPECT_NEAR(flake.GetSize(), 1.1f, 1e-6f);
    EXPECT_EQ(rng.GetDrawCount(), 5u);
}

TEST_F(SnowflakeTest, Spawn_New_StartsAboveTopEdge)
{
    SequenceRandomSource rng({0.5f, 0.25f, 0.0f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::New, config, viewSize, rng);

    EXPECT_FLOAT_EQ(flake.GetPosition().x, 200.0f);
    EXPECT_FLOAT_EQ(flake.GetPosition().y, Snowflake::SPAWN_Y);
    EXPECT_FALSE(flake.IsLanded());
    EXPECT_FLOAT_EQ(flake.GetMeltOpacity(), 1.0f);
}

TEST_F(SnowflakeTest, Spawn_MidField_SpreadsOverHeight)
{
    SequenceRandomSource rng({0.5f, 0.25f, 0.5f, 0.0f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);

    EXPECT_FLOAT_EQ(flake.GetPosition().y, 305.0f);
    EXPECT_EQ(rng.GetDrawCount(), 6u);
}

TEST_F(SnowflakeTest, Spawn_Velocity)
{
    config.gravity = 1.0f;
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 1.0f / 8.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::New, config, viewSize, rng);

    // vy = gravity * z + jitter * 0.5, vx = (r - 0.5) * 0.5
    EXPECT_NEAR(flake.GetVelocity().y, 0.55f + 0.25f, 1e-6f);
    EXPECT_NEAR(flake.GetVelocity().x, -0.1875f, 1e-6f);
    EXPECT_FLOAT_EQ(flake.GetStackOffset(), 0.0f);
}

TEST_F(SnowflakeTest, Spawn_DepthStaysBelowOne)
{
    SequenceRandomSource rng({std::nextafter(1.0f, 0.0f)});
    Snowflake flake;
    flake.Spawn(SpawnMode::New, config, viewSize, rng);

    EXPECT_LT(flake.GetDepth(), 1.0f);
    EXPECT_GE(flake.GetDepth(), Snowflake::MIN_DEPTH);
}

TEST_F(SnowflakeTest, Spawn_DepthAtLeastMinimum)
{
    SequenceRandomSource rng({0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::New, config, viewSize, rng);

    EXPECT_FLOAT_EQ(flake.GetDepth(), Snowflake::MIN_DEPTH);
    EXPECT_FLOAT_EQ(flake.GetSize(), config.sizeBase * Snowflake::MIN_DEPTH);
}

// --- Wrap Tests ---

TEST_F(SnowflakeTest, WrapX_PastRightEdge)
{
    EXPECT_FLOAT_EQ(Snowflake::WrapX(806.0f, 800.0f), -5.0f);
}

TEST_F(SnowflakeTest, WrapX_PastLeftEdge)
{
    EXPECT_FLOAT_EQ(Snowflake::WrapX(-6.0f, 800.0f), 805.0f);
}

TEST_F(SnowflakeTest, WrapX_InsideMarginUnchanged)
{
    EXPECT_FLOAT_EQ(Snowflake::WrapX(805.0f, 800.0f), 805.0f);
    EXPECT_FLOAT_EQ(Snowflake::WrapX(-5.0f, 800.0f), -5.0f);
    EXPECT_FLOAT_EQ(Snowflake::WrapX(400.0f, 800.0f), 400.0f);
}

TEST_F(SnowflakeTest, Update_WrapsAcrossRightEdge)
{
    config.wind = 30.0f;
    // x = 0.99 * 800 = 792, moves right by about 30 * z
    SequenceRandomSource rng({0.5f, 0.99f, 0.1f, 0.0f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, noObstacles));

    EXPECT_FLOAT_EQ(flake.GetPosition().x, -Snowflake::WRAP_MARGIN);
}

// --- Respawn Tests ---

TEST_F(SnowflakeTest, Update_FallingPastBottomRespawnsAtTop)
{
    config.gravity = 100.0f;
    SequenceRandomSource rng({0.5f, 0.5f, 0.99f, 0.0f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, noObstacles));

    EXPECT_FLOAT_EQ(flake.GetPosition().y, Snowflake::SPAWN_Y);
    EXPECT_FALSE(flake.IsLanded());
}

// --- Landing Tests ---

TEST_F(SnowflakeTest, Update_LandsInsideWindowWithFullStickiness)
{
    // Spawns at (400, 305), not moving; landY = 300 - 1.1 / 2 = 299.45
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, ledge));

    ASSERT_TRUE(flake.IsLanded());
    EXPECT_EQ(flake.GetState(), FlakeState::Landed);
    EXPECT_NEAR(flake.GetPosition().y, 299.45f, 1e-4f);
}

TEST_F(SnowflakeTest, Update_LandingHeightIncludesStackOffset)
{
    // Stack offset draw 0.5 -> 2px lower
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, ledge));

    ASSERT_TRUE(flake.IsLanded());
    EXPECT_NEAR(flake.GetPosition().y, 301.45f, 1e-4f);
}

TEST_F(SnowflakeTest, Update_ZeroStickinessNeverLands)
{
    config.stickiness = 0.0f;
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);

    for (int i = 0; i < 5; ++i)
    {
        flake.Update(Context(rng, ledge));
        EXPECT_FALSE(flake.IsLanded());
    }
}

TEST_F(SnowflakeTest, Update_FarFlakeNeverCollides)
{
    // Depth 0.1 + 0.2 * 0.9 = 0.28
    SequenceRandomSource rng({0.2f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    size_t drawsBefore = rng.GetDrawCount();
    flake.Update(Context(rng, ledge));

    EXPECT_FALSE(flake.IsLanded());
    EXPECT_EQ(rng.GetDrawCount(), drawsBefore);
}

TEST_F(SnowflakeTest, Update_AboveWindowDoesNotRoll)
{
    // y = 0.3 * 610 = 183, well above the ledge
    SequenceRandomSource rng({0.5f, 0.5f, 0.3f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    size_t drawsBefore = rng.GetDrawCount();
    flake.Update(Context(rng, ledge));

    EXPECT_FALSE(flake.IsLanded());
    EXPECT_EQ(rng.GetDrawCount(), drawsBefore);
}

TEST_F(SnowflakeTest, Update_BelowWindowFallsThrough)
{
    // y = 0.52 * 610 = 317.2, past landY + 10
    SequenceRandomSource rng({0.5f, 0.5f, 0.52f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, ledge));

    EXPECT_FALSE(flake.IsLanded());
}

TEST_F(SnowflakeTest, Update_OutsideObstacleSpanDoesNotLand)
{
    // x = 0.1 * 800 = 80, ledge spans 350..450
    SequenceRandomSource rng({0.5f, 0.1f, 0.5f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, ledge));

    EXPECT_FALSE(flake.IsLanded());
}

TEST_F(SnowflakeTest, Update_FirstQualifyingObstacleWins)
{
    ObstacleSet stacked = ObstacleSet::FromRects({MakeRect(0, 350.0f, 300.0f, 100.0f, 50.0f),
                                                  MakeRect(1, 350.0f, 302.0f, 100.0f, 50.0f)},
                                                 viewSize.y);
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, stacked));

    ASSERT_TRUE(flake.IsLanded());
    EXPECT_NEAR(flake.GetPosition().y, 299.45f, 1e-4f);
}

// --- Melt Tests ---

TEST_F(SnowflakeTest, Landed_PositionFrozenWhileMelting)
{
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, ledge));
    ASSERT_TRUE(flake.IsLanded());

    glm::vec2 restPosition = flake.GetPosition();
    flake.Update(Context(rng, ledge, 5000.0));

    EXPECT_EQ(flake.GetPosition(), restPosition);
    EXPECT_FLOAT_EQ(flake.GetMeltOpacity(), 0.75f);
}

TEST_F(SnowflakeTest, Landed_MeltsThenRespawns)
{
    // Spawn, landing roll, then the respawn draws
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f,
                              0.0f,
                              0.75f, 0.25f, 0.0f, 0.5f, 0.5f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, ledge));
    ASSERT_TRUE(flake.IsLanded());
    ASSERT_FLOAT_EQ(flake.GetDepth(), 0.55f);
    ASSERT_FLOAT_EQ(flake.GetSize(), 1.1f);
    ASSERT_FLOAT_EQ(flake.GetStackOffset(), 0.0f);

    flake.Update(Context(rng, ledge));
    flake.Update(Context(rng, ledge));
    flake.Update(Context(rng, ledge));
    EXPECT_TRUE(flake.IsLanded());
    EXPECT_FLOAT_EQ(flake.GetMeltOpacity(), 0.25f);

    flake.Update(Context(rng, ledge));
    EXPECT_FALSE(flake.IsLanded());
    EXPECT_FLOAT_EQ(flake.GetPosition().y, Snowflake::SPAWN_Y);
    EXPECT_FLOAT_EQ(flake.GetPosition().x, 0.25f * viewSize.x);
    EXPECT_FLOAT_EQ(flake.GetMeltOpacity(), 1.0f);

    // Fresh depth, size and stack offset from the respawn draws
    EXPECT_FLOAT_EQ(flake.GetDepth(), 0.775f);
    EXPECT_FLOAT_EQ(flake.GetSize(), 2.0f * 0.775f);
    EXPECT_FLOAT_EQ(flake.GetStackOffset(), 2.0f);
    EXPECT_EQ(rng.GetDrawCount(), 12u);
}

// --- Opacity Tests ---

TEST_F(SnowflakeTest, DrawOpacity_FallingScalesWithDepth)
{
    SequenceRandomSource rng({0.5f, 0.5f, 0.0f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::New, config, viewSize, rng);

    EXPECT_NEAR(flake.GetDrawOpacity(), 0.55f * 0.8f, 1e-6f);
}

TEST_F(SnowflakeTest, DrawOpacity_LandedUsesMelt)
{
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);
    flake.Update(Context(rng, ledge));
    flake.Update(Context(rng, ledge));

    EXPECT_FLOAT_EQ(flake.GetDrawOpacity(), 0.75f);
}

// --- Force Tests ---

TEST_F(SnowflakeTest, Update_RepulsionPushesAwayFromPointer)
{
    SequenceRandomSource rngA({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f});
    SequenceRandomSource rngB({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f});
    Snowflake plain;
    Snowflake pushed;
    plain.Spawn(SpawnMode::MidField, config, viewSize, rngA);
    pushed.Spawn(SpawnMode::MidField, config, viewSize, rngB);

    // Pointer 50px left of the flake at (400, 305)
    RepulsionField field(glm::vec2(350.0f, 305.0f), 150.0f, true);
    FlakeContext pushedCtx{config, viewSize, field, noObstacles, 1000.0, rngB};

    plain.Update(Context(rngA, noObstacles, 1000.0));
    pushed.Update(pushedCtx);

    glm::vec2 diff = pushed.GetPosition() - plain.GetPosition();
    EXPECT_NEAR(diff.x, (100.0f / 150.0f) * RepulsionField::MAX_PUSH * 0.55f, 1e-3f);
    EXPECT_NEAR(diff.y, 0.0f, 1e-3f);
}

TEST_F(SnowflakeTest, Update_WindScalesWithDepth)
{
    config.wind = 2.0f;
    SequenceRandomSource rng({0.5f, 0.5f, 0.5f, 0.0f, 0.5f, 0.0f});
    Snowflake flake;
    flake.Spawn(SpawnMode::MidField, config, viewSize, rng);

    // Drift term: sin(305 * 0.01 + 0) * 0.5 * z
    double wave = std::sin(305.0 * 0.01);
    float expectedX = 400.0f + 2.0f * 0.55f + static_cast<float>(wave) * 0.5f * 0.55f;

    flake.Update(Context(rng, noObstacles, 0.0));
    EXPECT_NEAR(flake.GetPosition().x, expectedX, 1e-3f);
    EXPECT_FLOAT_EQ(flake.GetPosition().y, 305.0f);
}
