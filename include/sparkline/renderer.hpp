#pragma once

#include <optional>
#include <sparkline/canvas.hpp>
#include <sparkline/geometry.hpp>
#include <sparkline/style.hpp>
#include <span>
#include <string>
#include <vector>

namespace sparkline
{

// Turns a dataset into a draw program on a Canvas.
//
//   SparklineStyle style;
//   style.fill_mode = FillMode::Below;
//   SparklineRenderer renderer(style);
//   renderer.render(canvas, samples, {300.0f, 100.0f});
//
// Draw order: grid lines and labels, fill, line, point markers.
class SparklineRenderer
{
   public:
    // Throws std::invalid_argument if the style does not validate.
    explicit SparklineRenderer(SparklineStyle style = {});

    const SparklineStyle& style() const { return style_; }

    // Throws std::invalid_argument on an empty dataset or a non-finite sample,
    // before anything is drawn. An unbounded (+inf) axis takes the style's
    // fallback extent; an empty size draws nothing.
    void render(Canvas& canvas, std::span<const float> data, Size constraints);

   private:
    const std::vector<std::string>& grid_label_texts(const Bounds& bounds);

    SparklineStyle style_;

    // Formatted grid labels for label_bounds_; the style is fixed, so the
    // bounds are the only key.
    std::optional<Bounds>    label_bounds_;
    std::vector<std::string> label_texts_;
};

// Throws std::invalid_argument("invalid input: empty dataset") or names the
// first non-finite sample.
void validate_data(std::span<const float> data);

// Everything a render depends on.
struct RenderInputs
{
    std::vector<float> data;
    Size               size;
    SparklineStyle     style;

    bool operator==(const RenderInputs&) const = default;
};

// Exact comparison of every input; true whenever anything observable differs.
bool should_repaint(const RenderInputs& previous, const RenderInputs& next);

}   // namespace sparkline
