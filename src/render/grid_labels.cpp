#include "render/grid_labels.hpp"

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace sparkline::detail
{

std::vector<double> grid_line_values(const Bounds& bounds, int amount)
{
    std::vector<double> values;
    if (amount < 2)
        return values;

    const double max  = bounds.max;
    const double step = (static_cast<double>(bounds.max) - bounds.min) / (amount - 1);
    values.reserve(static_cast<size_t>(amount));
    for (int i = 0; i < amount; ++i)
        values.push_back(max - step * i);
    return values;
}

float grid_line_y(int index, int amount, float drawable_height)
{
    const float spacing = drawable_height / static_cast<float>(amount - 1);
    return std::round(spacing * static_cast<float>(index));
}

std::string format_significant(double value, int digits)
{
    if (value == 0.0)
        return digits > 1 ? "0." + std::string(static_cast<size_t>(digits - 1), '0') : "0";

    // Let printf round first, then read the exponent back so 0.99995 → "1.000".
    char sci[64];
    std::snprintf(sci, sizeof(sci), "%.*e", digits - 1, value);
    const char* e        = std::strchr(sci, 'e');
    const int   exponent = e ? std::atoi(e + 1) : 0;

    char buf[64];
    if (exponent < -6 || exponent >= digits)
    {
        // "1.234e-7" / "-1.235e+4": no zero padding on the exponent.
        std::string mantissa(sci, e ? static_cast<size_t>(e - sci) : std::strlen(sci));
        std::snprintf(buf,
                      sizeof(buf),
                      "%se%c%d",
                      mantissa.c_str(),
                      exponent < 0 ? '-' : '+',
                      std::abs(exponent));
        return buf;
    }

    const int decimals = digits - 1 - exponent;
    std::snprintf(buf, sizeof(buf), "%.*f", decimals > 0 ? decimals : 0, value);
    return buf;
}

std::string format_grid_label(double value, std::string_view prefix)
{
    std::string text;
    char        buf[64];
    if (value == 0.0)
    {
        text = "0.00";
    }
    else if (value < 1.0)
    {
        text = format_significant(value, 4);
    }
    else if (value < 999.0)
    {
        std::snprintf(buf, sizeof(buf), "%.2f", value);
        text = buf;
    }
    else
    {
        // %.0f rather than an integer cast: values up to FLT_MAX exceed long long.
        std::snprintf(buf, sizeof(buf), "%.0f", std::round(value));
        text = buf;
    }
    return std::string(prefix) + text;
}

}   // namespace sparkline::detail
