#include <gtest/gtest.h>
#include <sparkline/color.hpp>

using namespace sparkline;

TEST(Color, DefaultIsOpaqueBlack)
{
    Color c;
    EXPECT_FLOAT_EQ(c.r, 0.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(Color, FromHexRgb)
{
    Color c = Color::from_hex(0xFF8000);
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_NEAR(c.g, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(Color, FromHexArgb)
{
    Color c = Color::from_hex(0x80FF0000);
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_NEAR(c.a, 128.0f / 255.0f, 1e-6f);
}

TEST(Color, NamedColorsMatchMaterialPalette)
{
    EXPECT_EQ(colors::light_blue, Color::from_hex(0x03A9F4));
    EXPECT_EQ(colors::grey, Color::from_hex(0x9E9E9E));
}

TEST(Color, LerpEndpointsAndMidpoint)
{
    Color a = rgb(0.0f, 0.0f, 0.0f);
    Color b = rgba(1.0f, 0.5f, 0.0f, 0.0f);

    EXPECT_EQ(lerp(a, b, 0.0f), a);
    EXPECT_EQ(lerp(a, b, 1.0f), b);

    Color mid = lerp(a, b, 0.5f);
    EXPECT_FLOAT_EQ(mid.r, 0.5f);
    EXPECT_FLOAT_EQ(mid.g, 0.25f);
    EXPECT_FLOAT_EQ(mid.a, 0.5f);
}

TEST(Color, Equality)
{
    EXPECT_EQ(rgb(0.1f, 0.2f, 0.3f), rgba(0.1f, 0.2f, 0.3f, 1.0f));
    EXPECT_NE(rgb(0.1f, 0.2f, 0.3f), rgba(0.1f, 0.2f, 0.3f, 0.5f));
}
