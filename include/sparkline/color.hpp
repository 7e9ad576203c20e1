#pragma once

#include <cstdint>

namespace sparkline
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // 0xRRGGBB is opaque; anything above 0xFFFFFF is read as 0xAARRGGBB.
    static constexpr Color from_hex(uint32_t hex)
    {
        if (hex > 0xFFFFFF)
        {
            return Color(((hex >> 16) & 0xFF) / 255.0f,
                         ((hex >> 8) & 0xFF) / 255.0f,
                         (hex & 0xFF) / 255.0f,
                         ((hex >> 24) & 0xFF) / 255.0f);
        }
        return Color(((hex >> 16) & 0xFF) / 255.0f,
                     ((hex >> 8) & 0xFF) / 255.0f,
                     (hex & 0xFF) / 255.0f,
                     1.0f);
    }

    bool operator==(const Color&) const = default;
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

// Component-wise interpolation, t is not clamped.
inline constexpr Color lerp(const Color& from, const Color& to, float t)
{
    return Color{from.r + (to.r - from.r) * t,
                 from.g + (to.g - from.g) * t,
                 from.b + (to.b - from.b) * t,
                 from.a + (to.a - from.a) * t};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color transparent{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Color light_blue     = Color::from_hex(0x03A9F4);
inline constexpr Color light_blue_200 = Color::from_hex(0x81D4FA);
inline constexpr Color light_blue_800 = Color::from_hex(0x0277BD);
inline constexpr Color grey           = Color::from_hex(0x9E9E9E);
inline constexpr Color amber          = Color::from_hex(0xFFC107);
inline constexpr Color light_green    = Color::from_hex(0x8BC34A);
}   // namespace colors

}   // namespace sparkline
