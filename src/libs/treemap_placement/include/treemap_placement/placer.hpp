#pragma once

#include <treemap_placement/types.hpp>
#include <treemap_model/types.hpp>
#include <cstddef>

namespace treemap_placement {

// Lays out the children of `root` in a canvas at the origin; a childless root
// fills the whole canvas.
PlacedTreemap place_treemap(const treemap_model::TreemapNode& root,
    double view_width, double view_height);

// Topmost rectangle containing the point, or nullptr.
const PlacedNode* hit_test(const PlacedTreemap& placed, double x, double y);

double covered_area(const PlacedTreemap& placed);
std::size_t count_overlaps(const PlacedTreemap& placed, double epsilon = 1e-6);

} // namespace treemap_placement
