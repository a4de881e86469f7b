#pragma once

#include <treemap_model/types.hpp>
#include <vector>

namespace treemap_placement {

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double area() const { return width * height; }
    bool contains(double px, double py) const {
        return px >= x && px <= x + width && py >= y && py <= y + height;
    }
};

// A node paired with its rectangle for one layout pass. The node is borrowed
// from the tree handed to the layout and must outlive this value.
struct PlacedNode {
    const treemap_model::TreemapNode* node = nullptr;
    Rect rect;
};

struct PlacedTreemap {
    Rect bounds;
    std::vector<PlacedNode> placed_nodes;
};

} // namespace treemap_placement
