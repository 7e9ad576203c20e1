#pragma once

#include <initializer_list>
#include <sparkline/color.hpp>
#include <sparkline/geometry.hpp>
#include <vector>

namespace sparkline
{

struct GradientStop
{
    float offset = 0.0f;   // [0, 1] along the gradient axis
    Color color;

    bool operator==(const GradientStop&) const = default;
};

// A gradient resolved against a concrete rectangle: absolute endpoints in
// canvas space. This is what a Paint carries.
struct Shader
{
    Point                     start;
    Point                     end;
    std::vector<GradientStop> stops;

    // Color at `p`, projected onto the start->end axis and clamped.
    Color color_at(Point p) const;

    bool operator==(const Shader&) const = default;
};

// Linear gradient with endpoints given as fractions of the rectangle it is
// later evaluated over. Defaults run from center-left to center-right.
struct LinearGradient
{
    Point                     begin{0.0f, 0.5f};
    Point                     end{1.0f, 0.5f};
    std::vector<GradientStop> stops;

    // Color at axis position t in [0, 1]. Outside the stop range the nearest
    // stop color is used. No stops gives a transparent color.
    Color sample(float t) const;

    Shader create_shader(const Rect& rect) const;

    bool operator==(const LinearGradient&) const = default;
};

// Evenly spaced stops, first color at offset 0 and last at offset 1.
LinearGradient make_linear_gradient(std::initializer_list<Color> colors,
                                    Point                        begin = {0.0f, 0.5f},
                                    Point                        end   = {1.0f, 0.5f});

}   // namespace sparkline
