#pragma once

namespace sparkline
{

// Canvas space: origin top-left, y grows downward.
struct Point
{
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const Point&) const = default;
};

inline constexpr Point operator+(Point a, Point b)
{
    return Point{a.x + b.x, a.y + b.y};
}

inline constexpr Point operator-(Point a, Point b)
{
    return Point{a.x - b.x, a.y - b.y};
}

inline constexpr Point operator*(Point p, float s)
{
    return Point{p.x * s, p.y * s};
}

struct Size
{
    float width  = 0.0f;
    float height = 0.0f;

    // Zero, negative and NaN extents all count as empty.
    bool is_empty() const { return !(width > 0.0f && height > 0.0f); }

    bool operator==(const Size&) const = default;
};

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    bool operator==(const Rect&) const = default;
};

// Effective value range of one render.
struct Bounds
{
    float min = 0.0f;
    float max = 0.0f;

    // Double so that opposite-sign extremes near FLT_MAX stay finite.
    double range() const { return static_cast<double>(max) - min; }
    bool   is_flat() const { return max == min; }

    bool operator==(const Bounds&) const = default;
};

}   // namespace sparkline
