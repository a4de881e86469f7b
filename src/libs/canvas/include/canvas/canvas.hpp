#pragma once

#include <animation/rect_animator.hpp>
#include <treemap_loaders/viewer_config.hpp>
#include <treemap_model/types.hpp>
#include <treemap_placement/types.hpp>
#include <treemap_render/renderer.hpp>
#include <treemap_scan/scan_session.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct ImVec2;

namespace canvas {

class TreemapCanvas {
public:
    explicit TreemapCanvas(treemap_loaders::ViewerConfig config);
    ~TreemapCanvas();

    // Starts a scan of `path`; the previous tree stays visible until the result arrives.
    void open(const std::string& path);
    void navigate_to(const treemap_model::TreemapNode& node);
    bool navigate_back();
    void refresh();

    const std::string& current_path() const { return current_path_; }
    bool can_go_back() const { return !back_stack_.empty(); }
    bool is_scanning() const { return session_.is_running() || awaiting_result_; }
    bool last_scan_timed_out() const { return last_timed_out_; }

    const treemap_model::TreemapNode* root() const { return root_.get(); }
    const treemap_placement::PlacedTreemap& placed() const { return placed_; }
    const treemap_model::TreemapNode* selected_node() const;

    // A tree is shown, no scan is pending and the transition animation has finished.
    bool is_layout_settled() const;

    bool update_and_draw(float region_width, float region_height);

private:
    void poll_scan();
    void relayout(float region_width, float region_height);
    void handle_input(ImVec2 region_min, float region_width, float region_height);
    void log_tiling_anomalies() const;

    treemap_loaders::ViewerConfig config_;
    treemap_render::RenderStyle style_;
    treemap_scan::ScanSession session_;
    bool awaiting_result_ = false;
    bool last_timed_out_ = false;

    std::string current_path_;
    std::vector<std::string> back_stack_;
    std::unique_ptr<treemap_model::TreemapNode> root_;

    treemap_placement::PlacedTreemap placed_;
    bool layout_dirty_ = true;
    float last_region_width_ = 0;
    float last_region_height_ = 0;

    animation::RectAnimator animator_;
    std::unordered_map<std::string, treemap_placement::Rect> current_rects_;

    std::string hovered_path_;
    std::string selected_path_;
};

} // namespace canvas
