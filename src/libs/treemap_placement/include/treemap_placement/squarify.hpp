#pragma once

#include <treemap_model/types.hpp>
#include <treemap_placement/types.hpp>
#include <vector>

namespace treemap_placement {

// Worst aspect ratio of a row laid along a side of length short_side, with
// sizes already in area units. Infinite for degenerate rows.
double worst_ratio(double row_area, double min_area, double max_area, double short_side);

// Squarified treemap of `nodes` inside `rect`, largest first. Output rectangles
// tile `rect` with areas proportional to node sizes. Empty when the nodes sum
// to zero; zero-size nodes get zero-area rectangles.
std::vector<PlacedNode> squarify(const std::vector<treemap_model::TreemapNode>& nodes, const Rect& rect);

} // namespace treemap_placement
