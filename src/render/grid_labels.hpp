#pragma once

#include <sparkline/geometry.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sparkline::detail
{

// Label values top to bottom: max first, min last. `amount` must be >= 2.
std::vector<double> grid_line_values(const Bounds& bounds, int amount);

// Vertical position of grid line `index`, rounded to whole pixels.
float grid_line_y(int index, int amount, float drawable_height);

// Label text for one grid value:
//   value < 1          4 significant digits ("0.5000", "-1.000")
//   1 <= value < 999   2 decimals ("42.00")
//   value >= 999       nearest integer ("1234")
// Exact zero prints as "0.00". `prefix` is prepended verbatim.
std::string format_grid_label(double value, std::string_view prefix = {});

// Decimal text of `value` with `digits` significant digits, trailing zeros
// kept. Switches to exponent form below 1e-6 or at/above 10^digits.
std::string format_significant(double value, int digits);

}   // namespace sparkline::detail
