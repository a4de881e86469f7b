#include <treemap_placement/squarify.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace treemap_placement {

namespace {

using treemap_model::TreemapNode;

std::int64_t clamped_size(const TreemapNode* node) {
    return std::max<std::int64_t>(node->size, 0);
}

// Places one row against the shorter side of `remaining` and returns what is left.
// A wide rectangle gets a full-height column on its left, a tall one a
// full-width band on its top.
Rect layout_row(const std::vector<const TreemapNode*>& sorted, std::size_t begin, std::size_t end,
    std::int64_t row_total, std::int64_t remaining_total, const Rect& remaining,
    std::vector<PlacedNode>& out)
{
    const bool last_row = row_total == remaining_total;
    const double fraction = static_cast<double>(row_total) / static_cast<double>(remaining_total);

    if (remaining.width >= remaining.height) {
        const double thickness = last_row ? remaining.width : remaining.width * fraction;
        const double bottom = remaining.y + remaining.height;
        double y = remaining.y;
        for (std::size_t i = begin; i < end; ++i) {
            const double share = static_cast<double>(clamped_size(sorted[i])) / static_cast<double>(row_total);
            double h = remaining.height * share;
            if (i + 1 == end) h = bottom - y;
            out.push_back({ sorted[i], Rect{ remaining.x, y, thickness, h } });
            y += h;
        }
        return Rect{ remaining.x + thickness, remaining.y, remaining.width - thickness, remaining.height };
    }

    const double thickness = last_row ? remaining.height : remaining.height * fraction;
    const double right = remaining.x + remaining.width;
    double x = remaining.x;
    for (std::size_t i = begin; i < end; ++i) {
        const double share = static_cast<double>(clamped_size(sorted[i])) / static_cast<double>(row_total);
        double w = remaining.width * share;
        if (i + 1 == end) w = right - x;
        out.push_back({ sorted[i], Rect{ x, remaining.y, w, thickness } });
        x += w;
    }
    return Rect{ remaining.x, remaining.y + thickness, remaining.width, remaining.height - thickness };
}

} // namespace

double worst_ratio(double row_area, double min_area, double max_area, double short_side) {
    if (short_side <= 0 || row_area <= 0 || min_area <= 0)
        return std::numeric_limits<double>::infinity();
    const double side2 = short_side * short_side;
    const double area2 = row_area * row_area;
    return std::max((side2 * max_area) / area2, area2 / (side2 * min_area));
}

std::vector<PlacedNode> squarify(const std::vector<TreemapNode>& nodes, const Rect& rect) {
    std::vector<PlacedNode> out;
    if (nodes.empty()) return out;

    std::vector<const TreemapNode*> sorted;
    sorted.reserve(nodes.size());
    for (const auto& n : nodes)
        sorted.push_back(&n);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const TreemapNode* a, const TreemapNode* b) { return clamped_size(a) > clamped_size(b); });

    std::int64_t total = 0;
    for (const auto* n : sorted)
        total += clamped_size(n);
    if (total <= 0) return out;

    Rect bounds = rect;
    bounds.width = std::max(bounds.width, 0.0);
    bounds.height = std::max(bounds.height, 0.0);
    // Converts sizes to area units of the target rectangle.
    const double scale = bounds.area() / static_cast<double>(total);

    out.reserve(sorted.size());
    Rect remaining = bounds;
    std::int64_t remaining_total = total;
    std::size_t i = 0;
    while (i < sorted.size()) {
        if (remaining_total <= 0) {
            // Only zero-size nodes are left.
            for (; i < sorted.size(); ++i)
                out.push_back({ sorted[i], Rect{ remaining.x, remaining.y, 0, 0 } });
            break;
        }

        const double short_side = std::min(remaining.width, remaining.height);
        std::int64_t row_total = clamped_size(sorted[i]);
        std::int64_t row_min = row_total;
        std::int64_t row_max = row_total;
        double current = worst_ratio(row_total * scale, row_min * scale, row_max * scale, short_side);

        std::size_t row_end = i + 1;
        while (row_end < sorted.size()) {
            const std::int64_t candidate = clamped_size(sorted[row_end]);
            if (candidate <= 0) break;
            const std::int64_t next_total = row_total + candidate;
            const std::int64_t next_min = std::min(row_min, candidate);
            const std::int64_t next_max = std::max(row_max, candidate);
            const double next = worst_ratio(next_total * scale, next_min * scale, next_max * scale, short_side);
            if (next > current) break;
            row_total = next_total;
            row_min = next_min;
            row_max = next_max;
            current = next;
            ++row_end;
        }

        remaining = layout_row(sorted, i, row_end, row_total, remaining_total, remaining, out);
        remaining_total -= row_total;
        i = row_end;
    }
    return out;
}

} // namespace treemap_placement
