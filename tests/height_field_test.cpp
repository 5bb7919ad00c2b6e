#include <cmath>

#include <gtest/gtest.h>

#include "terrain/height_field.h"

TEST(HeightFieldTest, SameSeedGivesSameHeights)
{
    terrain::HeightField first(1234u);
    terrain::HeightField second(1234u);

    for (int x = -40; x <= 40; x += 7)
    {
        for (int z = -40; z <= 40; z += 5)
        {
            EXPECT_EQ(first.height(x, z), second.height(x, z)) << "column " << x << ", " << z;
        }
    }
}

TEST(HeightFieldTest, DifferentSeedsGiveDifferentTerrain)
{
    terrain::HeightField first(1u);
    terrain::HeightField second(2u);

    bool anyDifference = false;
    for (int x = 0; x < 256 && !anyDifference; x += 3)
    {
        for (int z = 0; z < 256 && !anyDifference; z += 3)
        {
            anyDifference = first.height(x, z) != second.height(x, z);
        }
    }
    EXPECT_TRUE(anyDifference);
}

TEST(HeightFieldTest, HeightIsFloorOfScaledNoise)
{
    terrain::HeightField field(0u);
    const auto& settings = field.settings();
    for (int x = -64; x <= 64; x += 16)
    {
        const float n = field.noise(static_cast<float>(x), 12.0f);
        EXPECT_EQ(field.height(x, 12), static_cast<int>(std::floor(n * settings.amplitude + settings.offset)));
    }
}

TEST(HeightFieldTest, DefaultsMatchDocumentedTerrain)
{
    terrain::HeightField field(0u);
    EXPECT_FLOAT_EQ(field.settings().frequency, 0.01f);
    EXPECT_FLOAT_EQ(field.settings().amplitude, 32.0f);
    EXPECT_FLOAT_EQ(field.settings().offset, 32.0f);
    EXPECT_EQ(field.settings().octaves, 1);
}

TEST(HeightFieldTest, ZeroAmplitudeFlattensToOffset)
{
    terrain::HeightFieldSettings settings{};
    settings.amplitude = 0.0f;
    settings.offset = 7.5f;
    terrain::HeightField field(99u, settings);

    EXPECT_EQ(field.height(0, 0), 7);
    EXPECT_EQ(field.height(-500, 1234), 7);
}

TEST(HeightFieldTest, HeightsStayWithinAmplitudeBand)
{
    terrain::HeightFieldSettings settings{};
    settings.octaves = 4;
    terrain::HeightField field(42u, settings);

    for (int x = -200; x <= 200; x += 13)
    {
        for (int z = -200; z <= 200; z += 11)
        {
            const int h = field.height(x, z);
            EXPECT_GE(h, static_cast<int>(settings.offset - 2.0f * settings.amplitude));
            EXPECT_LE(h, static_cast<int>(settings.offset + 2.0f * settings.amplitude));
        }
    }
}
