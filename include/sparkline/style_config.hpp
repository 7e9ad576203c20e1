#pragma once

#include <sparkline/style.hpp>
#include <string>

namespace sparkline
{

// JSON persistence for SparklineStyle.
//
//   {
//     "version": 1,
//     "line_width": 2,
//     "line_color": [0.012, 0.663, 0.957, 1],
//     "line_gradient": {"begin": [0, 0.5], "end": [1, 0.5],
//                       "stops": [[0, 1, 0, 0, 1], [1, 0, 0, 1, 1]]},
//     "fill_mode": "below",
//     "point_size": null,
//     ...
//   }
//
// Colors are [r, g, b, a] in [0, 1]. Unset optionals are written as null.

std::string serialize_style(const SparklineStyle& style);

// Keys missing from `json` keep the value already in `out`; unknown keys are
// ignored. Returns false, leaving `out` untouched, on malformed input.
bool deserialize_style(const std::string& json, SparklineStyle& out);

// Returns true on success.
bool save_style(const std::string& path, const SparklineStyle& style);

// Returns true on success. Does not validate; the renderer does that.
bool load_style(const std::string& path, SparklineStyle& out);

}   // namespace sparkline
