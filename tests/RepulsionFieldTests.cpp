#include <gtest/gtest.h>
#include "../src/RepulsionField.h"

class RepulsionFieldTest : public ::testing::Test
{
protected:
    RepulsionField field{glm::vec2(0.0f, 0.0f), 100.0f, true};
};

// --- Strength Tests ---

TEST_F(RepulsionFieldTest, Strength_FullAtPointer)
{
    EXPECT_FLOAT_EQ(field.Strength(0.0f), 1.0f);
}

TEST_F(RepulsionFieldTest, Strength_ZeroAtRadius)
{
    EXPECT_FLOAT_EQ(field.Strength(100.0f), 0.0f);
    EXPECT_FLOAT_EQ(field.Strength(250.0f), 0.0f);
}

TEST_F(RepulsionFieldTest, Strength_LinearFalloff)
{
    EXPECT_FLOAT_EQ(field.Strength(50.0f), 0.5f);
    EXPECT_FLOAT_EQ(field.Strength(75.0f), 0.25f);
}

TEST_F(RepulsionFieldTest, Strength_DecreasesWithDistance)
{
    float previous = field.Strength(0.0f);
    for (float d = 5.0f; d <= 100.0f; d += 5.0f)
    {
        float current = field.Strength(d);
        EXPECT_LT(current, previous);
        previous = current;
    }
}

TEST_F(RepulsionFieldTest, Disabled_NoForce)
{
    RepulsionField disabled(glm::vec2(0.0f), 100.0f, false);
    EXPECT_FALSE(disabled.IsActive());
    EXPECT_FLOAT_EQ(disabled.Strength(0.0f), 0.0f);
    EXPECT_EQ(disabled.Displacement(glm::vec2(10.0f, 0.0f), 1.0f), glm::vec2(0.0f));
}

TEST_F(RepulsionFieldTest, ZeroRadius_NoForce)
{
    RepulsionField zero(glm::vec2(0.0f), 0.0f, true);
    EXPECT_FALSE(zero.IsActive());
    EXPECT_EQ(zero.Displacement(glm::vec2(0.0f), 1.0f), glm::vec2(0.0f));
}

TEST_F(RepulsionFieldTest, DefaultConstructed_Inactive)
{
    RepulsionField none;
    EXPECT_FALSE(none.IsActive());
    EXPECT_EQ(none.GetPoint(), RepulsionField::NoPointer());
}

// --- Displacement Tests ---

TEST_F(RepulsionFieldTest, Displacement_PointsAwayFromPointer)
{
    // Distance 50 along (0.6, 0.8): force 0.5, push 0.5 * 5 * depth
    glm::vec2 push = field.Displacement(glm::vec2(30.0f, 40.0f), 1.0f);
    EXPECT_NEAR(push.x, 1.5f, 1e-5f);
    EXPECT_NEAR(push.y, 2.0f, 1e-5f);
}

TEST_F(RepulsionFieldTest, Displacement_ScalesWithDepth)
{
    glm::vec2 nearPush = field.Displacement(glm::vec2(-50.0f, 0.0f), 1.0f);
    glm::vec2 farPush = field.Displacement(glm::vec2(-50.0f, 0.0f), 0.2f);
    EXPECT_NEAR(nearPush.x, -2.5f, 1e-5f);
    EXPECT_NEAR(farPush.x, -0.5f, 1e-5f);
}

TEST_F(RepulsionFieldTest, Displacement_ZeroOutsideRadius)
{
    EXPECT_EQ(field.Displacement(glm::vec2(100.0f, 0.0f), 1.0f), glm::vec2(0.0f));
    EXPECT_EQ(field.Displacement(glm::vec2(80.0f, 80.0f), 1.0f), glm::vec2(0.0f));
}

TEST_F(RepulsionFieldTest, Displacement_AtPointerPushesRight)
{
    glm::vec2 push = field.Displacement(glm::vec2(0.0f), 0.5f);
    EXPECT_NEAR(push.x, RepulsionField::MAX_PUSH * 0.5f, 1e-5f);
    EXPECT_NEAR(push.y, 0.0f, 1e-5f);
}

TEST_F(RepulsionFieldTest, NoPointer_FarFromScreen)
{
    RepulsionField idle(RepulsionField::NoPointer(), 150.0f, true);
    EXPECT_EQ(idle.Displacement(glm::vec2(400.0f, 300.0f), 1.0f), glm::vec2(0.0f));
}
