#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <limits>
#include <sparkline/export.hpp>
#include <sparkline/logger.hpp>
#include <sparkline/sparkline.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace sparkline
{
namespace
{

const std::vector<float> kData = {0.0f, 1.0f, 0.5f, 1.5f, 1.0f};

size_t count_occurrences(const std::string& haystack, const std::string& needle)
{
    size_t count = 0;
    size_t pos   = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos)
    {
        ++count;
        pos += needle.size();
    }
    return count;
}

TEST(SvgExport, ToStringProducesValidSvg)
{
    std::string svg = SvgExporter::to_string(kData, {300.0f, 100.0f});

    // Must start with XML declaration and SVG root
    EXPECT_EQ(svg.rfind("<?xml", 0), 0u);
    EXPECT_NE(svg.find("<svg"), std::string::npos);
    EXPECT_NE(svg.find("</svg>"), std::string::npos);
}

TEST(SvgExport, ContainsViewBoxDimensions)
{
    std::string svg = SvgExporter::to_string(kData, {800.0f, 600.0f});

    EXPECT_NE(svg.find("width=\"800\""), std::string::npos);
    EXPECT_NE(svg.find("height=\"600\""), std::string::npos);
    EXPECT_NE(svg.find("viewBox=\"0 0 800 600\""), std::string::npos);
}

TEST(SvgExport, LineIsStrokedPath)
{
    SparklineStyle style;
    style.line_color = rgb(1.0f, 0.0f, 0.0f);
    std::string svg  = SvgExporter::to_string(kData, {300.0f, 100.0f}, style);

    EXPECT_EQ(count_occurrences(svg, "<path"), 1u);
    EXPECT_NE(svg.find("d=\"M1,"), std::string::npos);
    EXPECT_NE(svg.find("stroke=\"rgb(255,0,0)\""), std::string::npos);
    EXPECT_NE(svg.find("stroke-linecap=\"round\""), std::string::npos);
    EXPECT_NE(svg.find("stroke-linejoin=\"round\""), std::string::npos);
}

TEST(SvgExport, BackgroundRectIsWhite)
{
    std::string svg = SvgExporter::to_string(kData, {300.0f, 100.0f});
    EXPECT_NE(svg.find("fill=\"rgb(255,255,255)\""), std::string::npos);
}

TEST(SvgExport, FillPathPrecedesLine)
{
    SparklineStyle style;
    style.fill_mode = FillMode::Below;
    std::string svg = SvgExporter::to_string(kData, {300.0f, 100.0f}, style);

    EXPECT_EQ(count_occurrences(svg, "<path"), 2u);
    size_t fill   = svg.find("stroke=\"none\"");
    size_t stroke = svg.find("fill=\"none\"");
    ASSERT_NE(fill, std::string::npos);
    ASSERT_NE(stroke, std::string::npos);
    EXPECT_LT(fill, stroke);
    EXPECT_NE(svg.find(" Z\""), std::string::npos);
}

TEST(SvgExport, CubicSmoothingUsesCurveCommands)
{
    SparklineStyle style;
    style.cubic_smoothing = true;
    std::string svg       = SvgExporter::to_string(kData, {300.0f, 100.0f}, style);
    EXPECT_EQ(count_occurrences(svg, " C"), kData.size() - 1);
}

TEST(SvgExport, ContainsCirclesForMarkers)
{
    SparklineStyle style;
    style.points_mode = PointsMode::All;
    style.point_color = rgb(0.0f, 0.0f, 1.0f);
    std::string svg   = SvgExporter::to_string(kData, {300.0f, 100.0f}, style);

    EXPECT_EQ(count_occurrences(svg, "<circle"), kData.size());
    EXPECT_NE(svg.find("<g fill=\"rgb(0,0,255)\""), std::string::npos);
}

TEST(SvgExport, GridLinesAndLabels)
{
    SparklineStyle style;
    style.grid_lines        = true;
    style.grid_line_amount  = 3;
    style.grid_label_prefix = "<$>";
    std::vector<float> data = {0.0f, 50.0f, 100.0f};
    std::string        svg  = SvgExporter::to_string(data, {300.0f, 100.0f}, style);

    EXPECT_EQ(count_occurrences(svg, "<line"), 3u);
    EXPECT_EQ(count_occurrences(svg, "<text"), 3u);
    EXPECT_NE(svg.find("font-weight=\"bold\""), std::string::npos);
    // Label prefix is XML-escaped
    EXPECT_NE(svg.find("&lt;$&gt;100.00</text>"), std::string::npos);
    EXPECT_EQ(svg.find("<$>"), std::string::npos);
}

TEST(SvgExport, GradientBecomesDefinition)
{
    SparklineStyle style;
    style.line_gradient = make_linear_gradient({colors::amber, colors::light_green});
    std::string svg     = SvgExporter::to_string(kData, {300.0f, 100.0f}, style);

    EXPECT_NE(svg.find("<defs>"), std::string::npos);
    EXPECT_NE(svg.find("<linearGradient id=\"sparkline-gradient-0\""), std::string::npos);
    EXPECT_EQ(count_occurrences(svg, "<stop"), 2u);
    EXPECT_NE(svg.find("stroke=\"url(#sparkline-gradient-0)\""), std::string::npos);
    EXPECT_LT(svg.find("</defs>"), svg.find("<path"));
}

TEST(SvgExport, GradientFillIgnoresBaseColorAlpha)
{
    SparklineStyle style;
    style.fill_mode     = FillMode::Below;
    style.fill_color    = colors::transparent;
    style.fill_gradient = make_linear_gradient({colors::amber, colors::light_green});
    std::string svg     = SvgExporter::to_string(kData, {300.0f, 100.0f}, style);

    EXPECT_NE(svg.find("fill=\"url(#sparkline-gradient-0)\" fill-opacity=\"1\""),
              std::string::npos);
    EXPECT_EQ(svg.find("fill-opacity=\"0\""), std::string::npos);
}

TEST(SvgCanvas, ShaderStrokeAndPointsAreOpaque)
{
    SvgCanvas canvas({10.0f, 10.0f}, std::nullopt);
    Paint     paint;
    paint.color  = colors::transparent;
    paint.shader = make_linear_gradient({colors::amber, colors::light_green})
                       .create_shader(Rect{0.0f, 0.0f, 10.0f, 10.0f});

    std::vector<Point> pts = {{5.0f, 5.0f}};
    canvas.draw_line({0.0f, 0.0f}, {10.0f, 10.0f}, paint);
    canvas.draw_points(pts, paint);

    std::string svg = canvas.to_string();
    EXPECT_EQ(count_occurrences(svg, "stroke-opacity=\"1\""), 1u);
    EXPECT_EQ(count_occurrences(svg, "fill-opacity=\"1\""), 1u);
    EXPECT_EQ(svg.find("opacity=\"0\""), std::string::npos);
}

TEST(SvgExport, UnboundedWidthUsesFallback)
{
    std::string svg =
        SvgExporter::to_string(kData, {std::numeric_limits<float>::infinity(), 100.0f});
    EXPECT_NE(svg.find("viewBox=\"0 0 300 100\""), std::string::npos);
    EXPECT_EQ(count_occurrences(svg, "<path"), 1u);
    EXPECT_EQ(svg.find("inf"), std::string::npos);
}

TEST(SvgExport, SinglePointIsOneDot)
{
    std::vector<float> data = {42.0f};
    std::string        svg  = SvgExporter::to_string(data, {300.0f, 100.0f});

    EXPECT_EQ(svg.find("<path"), std::string::npos);
    EXPECT_NE(svg.find("<circle cx=\"150\" cy=\"50\" r=\"1\"/>"), std::string::npos);
}

TEST(SvgExport, EmptyDataThrows)
{
    ScopedLogLevel     quiet(LogLevel::Off);
    std::vector<float> empty;
    EXPECT_THROW(SvgExporter::to_string(empty, {300.0f, 100.0f}), std::invalid_argument);
}

TEST(SvgExport, ConvenienceUsesFallbackSize)
{
    SparklineStyle style;
    style.fallback_width  = 120.0f;
    style.fallback_height = 30.0f;
    std::string svg       = to_svg(kData, style);
    EXPECT_NE(svg.find("viewBox=\"0 0 120 30\""), std::string::npos);
}

TEST(SvgCanvas, SquareCapPointsAreRects)
{
    SvgCanvas canvas({10.0f, 10.0f}, std::nullopt);
    Paint     paint;
    paint.stroke_width = 4.0f;
    paint.cap          = StrokeCap::Square;

    std::vector<Point> pts = {{5.0f, 5.0f}};
    canvas.draw_points(pts, paint);

    std::string svg = canvas.to_string();
    EXPECT_NE(svg.find("<rect x=\"3\" y=\"3\" width=\"4\" height=\"4\"/>"), std::string::npos);
    // No background when none is requested
    EXPECT_EQ(svg.find("100%"), std::string::npos);
}

TEST(SvgCanvas, EmptyPathIsSkipped)
{
    SvgCanvas canvas({10.0f, 10.0f});
    canvas.draw_path(Path{}, Paint{});
    EXPECT_EQ(canvas.to_string().find("<path"), std::string::npos);
}

TEST(SvgExport, WriteToFile)
{
    std::string path = "/tmp/sparkline_test_svg_export.svg";
    EXPECT_TRUE(SvgExporter::write_svg(path, kData, {300.0f, 100.0f}));

    std::ifstream f(path);
    ASSERT_TRUE(f.is_open());
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("<svg"), std::string::npos);
    EXPECT_NE(content.find("</svg>"), std::string::npos);

    std::remove(path.c_str());
}

TEST(SvgExport, WriteToInvalidPathFails)
{
    ScopedLogLevel quiet(LogLevel::Off);
    EXPECT_FALSE(SvgExporter::write_svg("/nonexistent/dir/test.svg", kData, {300.0f, 100.0f}));
}

}   // anonymous namespace
}   // namespace sparkline
