#include <treemap_placement/placer.hpp>
#include <treemap_placement/squarify.hpp>
#include <algorithm>

namespace treemap_placement {

PlacedTreemap place_treemap(const treemap_model::TreemapNode& root,
    double view_width, double view_height)
{
    PlacedTreemap out;
    out.bounds = Rect{ 0, 0, std::max(view_width, 0.0), std::max(view_height, 0.0) };
    if (root.has_children())
        out.placed_nodes = squarify(root.children, out.bounds);
    else
        out.placed_nodes.push_back({ &root, out.bounds });
    return out;
}

const PlacedNode* hit_test(const PlacedTreemap& placed, double x, double y) {
    for (auto it = placed.placed_nodes.rbegin(); it != placed.placed_nodes.rend(); ++it) {
        if (it->rect.area() > 0 && it->rect.contains(x, y))
            return &*it;
    }
    return nullptr;
}

double covered_area(const PlacedTreemap& placed) {
    double total = 0;
    for (const auto& pn : placed.placed_nodes)
        total += pn.rect.area();
    return total;
}

std::size_t count_overlaps(const PlacedTreemap& placed, double epsilon) {
    std::size_t overlaps = 0;
    const auto& nodes = placed.placed_nodes;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const Rect& a = nodes[i].rect;
        for (std::size_t j = i + 1; j < nodes.size(); ++j) {
            const Rect& b = nodes[j].rect;
            const double overlap_x = std::min(a.x + a.width, b.x + b.width) - std::max(a.x, b.x);
            const double overlap_y = std::min(a.y + a.height, b.y + b.height) - std::max(a.y, b.y);
            if (overlap_x > epsilon && overlap_y > epsilon) ++overlaps;
        }
    }
    return overlaps;
}

} // namespace treemap_placement
