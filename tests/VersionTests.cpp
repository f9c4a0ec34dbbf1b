#include <gtest/gtest.h>
#include "../src/Version.h"

#include <string>

TEST(VersionTest, StringMatchesComponents)
{
    std::string expected = std::to_string(FLURRY_VERSION_MAJOR) + "." +
                           std::to_string(FLURRY_VERSION_MINOR) + "." +
                           std::to_string(FLURRY_VERSION_PATCH);
    EXPECT_EQ(std::string(FLURRY_VERSION), expected);
}

TEST(VersionTest, NumberOrdersReleases)
{
    EXPECT_EQ(FLURRY_VERSION_NUMBER,
              FLURRY_VERSION_MAJOR * 10000 + FLURRY_VERSION_MINOR * 100 + FLURRY_VERSION_PATCH);
    EXPECT_GT(FLURRY_VERSION_NUMBER, 0);
}
