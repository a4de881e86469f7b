#include <treemap_render/renderer.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>

namespace treemap_render {

namespace {

const unsigned int border_color = IM_COL32(20, 20, 24, 255);
const unsigned int selected_border_color = IM_COL32(255, 255, 255, 255);
const unsigned int text_color = IM_COL32(255, 255, 255, 255);
const unsigned int shadow_color = IM_COL32(0, 0, 0, 80);
const float label_padding = 4.0f;

unsigned int to_imcolor(const treemap_model::CategoryColor& c, float alpha) {
    return ImGui::ColorConvertFloat4ToU32(ImVec4(c.r, c.g, c.b, alpha));
}

void draw_label(ImDrawList* draw_list, ImVec2 pos, const char* text) {
    draw_list->AddText(ImVec2(pos.x + 1.0f, pos.y + 1.0f), shadow_color, text);
    draw_list->AddText(pos, text_color, text);
}

} // namespace

unsigned int category_fill_color(treemap_model::FileTypeCategory category, float alpha) {
    return to_imcolor(treemap_model::category_color(category), alpha);
}

void render_treemap(ImDrawList* draw_list,
    const treemap_placement::PlacedTreemap& placed,
    float offset_x, float offset_y,
    const RenderStyle& style,
    const std::unordered_map<std::string, treemap_placement::Rect>* current_rects,
    const std::string& hovered_path,
    const std::string& selected_path)
{
    if (!draw_list) return;

    for (const auto& pn : placed.placed_nodes) {
        if (!pn.node) continue;
        const treemap_model::TreemapNode& node = *pn.node;

        treemap_placement::Rect r = pn.rect;
        if (current_rects) {
            auto it = current_rects->find(node.path);
            if (it != current_rects->end()) r = it->second;
        }
        if (r.width <= 0 || r.height <= 0) continue;

        const bool hovered = !hovered_path.empty() && node.path == hovered_path;
        const bool selected = !selected_path.empty() && node.path == selected_path;
        const float alpha = hovered ? 0.8f : (selected ? 0.6f : 0.5f);
        const float rounding = node.has_children() || node.approximate ? 4.0f : 2.0f;

        ImVec2 min_pt(offset_x + (float)r.x, offset_y + (float)r.y);
        ImVec2 max_pt(offset_x + (float)(r.x + r.width), offset_y + (float)(r.y + r.height));
        draw_list->AddRectFilled(min_pt, max_pt, category_fill_color(node.category, alpha), rounding);
        draw_list->AddRect(min_pt, max_pt, selected ? selected_border_color : border_color,
            rounding, 0, selected ? 2.0f : 1.0f);

        if (r.width <= style.label_min_width || r.height <= style.label_min_height) continue;

        draw_list->PushClipRect(min_pt, max_pt, true);
        ImVec2 text_pos(min_pt.x + label_padding, min_pt.y + label_padding);
        draw_label(draw_list, text_pos, node.name.c_str());
        if (r.height > style.size_label_min_height) {
            const std::string size_text = treemap_model::format_size(node.size);
            text_pos.y += ImGui::GetTextLineHeight();
            draw_label(draw_list, text_pos, size_text.c_str());
        }
        draw_list->PopClipRect();
    }
}

void render_node_tooltip(const treemap_model::TreemapNode& node) {
    ImGui::BeginTooltip();
    ImGui::ColorButton("##category",
        ImGui::ColorConvertU32ToFloat4(category_fill_color(node.category, 1.0f)),
        ImGuiColorEditFlags_NoTooltip, ImVec2(12, 12));
    ImGui::SameLine();
    ImGui::TextUnformatted(node.name.c_str());
    ImGui::Separator();
    const std::string size_text = treemap_model::format_size(node.size);
    ImGui::Text("Size: %s%s", size_text.c_str(), node.approximate ? " (estimate)" : "");
    ImGui::Text("Type: %s", treemap_model::category_name(node.category));
    ImGui::PushTextWrapPos(ImGui::GetFontSize() * 20.0f);
    ImGui::Text("Path: %s", node.path.c_str());
    ImGui::PopTextWrapPos();
    if (node.has_children())
        ImGui::TextDisabled("%zu items", node.children.size());
    ImGui::EndTooltip();
}

void render_legend(const treemap_model::TreemapNode* root) {
    ImGui::TextUnformatted("File Types");
    for (treemap_model::FileTypeCategory category : treemap_model::all_categories()) {
        ImGui::ColorButton(treemap_model::category_name(category),
            ImGui::ColorConvertU32ToFloat4(category_fill_color(category, 1.0f)),
            ImGuiColorEditFlags_NoTooltip, ImVec2(16, 16));
        ImGui::SameLine();
        ImGui::TextUnformatted(treemap_model::category_name(category));
    }

    if (!root) return;
    ImGui::Separator();
    ImGui::TextUnformatted("Statistics");
    const std::string total = treemap_model::format_size(root->size);
    ImGui::Text("Total Size  %s", total.c_str());
    ImGui::Text("Items       %zu", treemap_model::count_items(*root));
    ImGui::Text("Depth       %d", treemap_model::max_depth(*root));
}

void render_detail_bar(const treemap_model::TreemapNode& node) {
    const std::string size_text = treemap_model::format_size(node.size);
    ImGui::TextUnformatted(node.name.c_str());
    ImGui::SameLine();
    ImGui::TextDisabled("%s", node.path.c_str());
    ImGui::SameLine();
    ImGui::Text("| %s | %s", size_text.c_str(), treemap_model::category_name(node.category));
}

} // namespace treemap_render
