#include <cstddef>
#include <sparkline/gradient.hpp>

namespace sparkline
{

namespace
{

Color sample_stops(const std::vector<GradientStop>& stops, float t)
{
    if (stops.empty())
        return colors::transparent;
    if (t <= stops.front().offset)
        return stops.front().color;
    if (t >= stops.back().offset)
        return stops.back().color;

    for (size_t i = 1; i < stops.size(); ++i)
    {
        const auto& lo = stops[i - 1];
        const auto& hi = stops[i];
        if (t > hi.offset)
            continue;
        float span = hi.offset - lo.offset;
        if (span <= 0.0f)
            return hi.color;
        return lerp(lo.color, hi.color, (t - lo.offset) / span);
    }
    return stops.back().color;
}

}   // anonymous namespace

Color Shader::color_at(Point p) const
{
    Point axis     = end - start;
    float length_2 = axis.x * axis.x + axis.y * axis.y;
    if (length_2 == 0.0f)
        return sample_stops(stops, 0.0f);

    Point rel = p - start;
    float t   = (rel.x * axis.x + rel.y * axis.y) / length_2;
    return sample_stops(stops, t);
}

Color LinearGradient::sample(float t) const
{
    return sample_stops(stops, t);
}

Shader LinearGradient::create_shader(const Rect& rect) const
{
    Shader shader;
    shader.start = Point{rect.x + begin.x * rect.w, rect.y + begin.y * rect.h};
    shader.end   = Point{rect.x + end.x * rect.w, rect.y + end.y * rect.h};
    shader.stops = stops;
    return shader;
}

LinearGradient make_linear_gradient(std::initializer_list<Color> colors, Point begin, Point end)
{
    LinearGradient gradient;
    gradient.begin = begin;
    gradient.end   = end;

    const size_t n = colors.size();
    size_t       i = 0;
    for (const auto& c : colors)
    {
        float offset = n > 1 ? static_cast<float>(i) / static_cast<float>(n - 1) : 0.0f;
        gradient.stops.push_back({offset, c});
        ++i;
    }
    return gradient;
}

}   // namespace sparkline
