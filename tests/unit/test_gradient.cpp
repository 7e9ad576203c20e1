#include <gtest/gtest.h>
#include <sparkline/gradient.hpp>

using namespace sparkline;

TEST(LinearGradient, EvenlySpacedStops)
{
    auto g = make_linear_gradient({colors::black, colors::white, colors::black});
    ASSERT_EQ(g.stops.size(), 3u);
    EXPECT_FLOAT_EQ(g.stops[0].offset, 0.0f);
    EXPECT_FLOAT_EQ(g.stops[1].offset, 0.5f);
    EXPECT_FLOAT_EQ(g.stops[2].offset, 1.0f);
}

TEST(LinearGradient, SampleInterpolatesBetweenStops)
{
    auto  g   = make_linear_gradient({colors::black, colors::white});
    Color mid = g.sample(0.25f);
    EXPECT_FLOAT_EQ(mid.r, 0.25f);
    EXPECT_FLOAT_EQ(mid.g, 0.25f);
    EXPECT_FLOAT_EQ(mid.b, 0.25f);
}

TEST(LinearGradient, SampleClampsOutsideStops)
{
    LinearGradient g;
    g.stops = {{0.2f, colors::black}, {0.8f, colors::white}};
    EXPECT_EQ(g.sample(0.0f), colors::black);
    EXPECT_EQ(g.sample(-3.0f), colors::black);
    EXPECT_EQ(g.sample(1.0f), colors::white);
    EXPECT_NEAR(g.sample(0.5f).r, 0.5f, 1e-5f);
}

TEST(LinearGradient, NoStopsIsTransparent)
{
    LinearGradient g;
    EXPECT_EQ(g.sample(0.5f), colors::transparent);
}

TEST(LinearGradient, ShaderResolvesAgainstRect)
{
    auto   g      = make_linear_gradient({colors::black, colors::white});
    Shader shader = g.create_shader(Rect{0.0f, 0.0f, 200.0f, 80.0f});

    EXPECT_FLOAT_EQ(shader.start.x, 0.0f);
    EXPECT_FLOAT_EQ(shader.start.y, 40.0f);
    EXPECT_FLOAT_EQ(shader.end.x, 200.0f);
    EXPECT_FLOAT_EQ(shader.end.y, 40.0f);
    EXPECT_EQ(shader.stops, g.stops);
}

TEST(LinearGradient, VerticalShaderColorAt)
{
    auto   g = make_linear_gradient({colors::white, colors::black}, {0.5f, 0.0f}, {0.5f, 1.0f});
    Shader shader = g.create_shader(Rect{10.0f, 10.0f, 100.0f, 100.0f});

    EXPECT_EQ(shader.color_at({60.0f, 10.0f}), colors::white);
    EXPECT_EQ(shader.color_at({60.0f, 110.0f}), colors::black);
    // x does not matter for a vertical axis
    EXPECT_EQ(shader.color_at({0.0f, 60.0f}), shader.color_at({500.0f, 60.0f}));
    EXPECT_FLOAT_EQ(shader.color_at({60.0f, 60.0f}).r, 0.5f);
}

TEST(LinearGradient, DegenerateShaderUsesFirstStop)
{
    Shader shader;
    shader.start = shader.end = {5.0f, 5.0f};
    shader.stops              = {{0.0f, colors::amber}, {1.0f, colors::black}};
    EXPECT_EQ(shader.color_at({100.0f, 100.0f}), colors::amber);
}
