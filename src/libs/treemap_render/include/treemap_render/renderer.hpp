#pragma once

#include <treemap_model/category.hpp>
#include <treemap_model/types.hpp>
#include <treemap_placement/types.hpp>
#include <string>
#include <unordered_map>

struct ImDrawList;

namespace treemap_render {

struct RenderStyle {
    double label_min_width = 40;
    double label_min_height = 20;
    double size_label_min_height = 35;
};

unsigned int category_fill_color(treemap_model::FileTypeCategory category, float alpha);

// Draws the placed rectangles at the given screen offset. When `current_rects`
// is given, the animated rectangle for a node path replaces its layout rectangle.
void render_treemap(ImDrawList* draw_list,
    const treemap_placement::PlacedTreemap& placed,
    float offset_x, float offset_y,
    const RenderStyle& style,
    const std::unordered_map<std::string, treemap_placement::Rect>* current_rects = nullptr,
    const std::string& hovered_path = {},
    const std::string& selected_path = {});

// ImGui tooltip for the hovered node. Call only when an ImGui frame is active.
void render_node_tooltip(const treemap_model::TreemapNode& node);

// Category swatches plus total size, item count and depth of `root`.
void render_legend(const treemap_model::TreemapNode* root);

// Name, path, size and category of the selected node.
void render_detail_bar(const treemap_model::TreemapNode& node);

} // namespace treemap_render
