#include <canvas/canvas.hpp>
#include <treemap_placement/placer.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>
#include <utility>

namespace {

std::filesystem::path find_project_root() {
    std::error_code ec;
    std::filesystem::path p = std::filesystem::current_path(ec);
    if (ec) return {};
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt", ec) && std::filesystem::exists(p / "src", ec)) {
            return p;
        }
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path(ec);
}

std::shared_ptr<spdlog::logger> canvas_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "treemap_latest.log";
        logger = spdlog::basic_logger_mt("treemap_canvas", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Treemap logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

// Directories can be entered even when only a placeholder size is known.
bool is_navigable(const treemap_model::TreemapNode& node) {
    return node.has_children() || node.approximate;
}

} // namespace

namespace canvas {

TreemapCanvas::TreemapCanvas(treemap_loaders::ViewerConfig config)
    : config_(std::move(config))
{
    style_.label_min_width = config_.label_min_width;
    style_.label_min_height = config_.label_min_height;
    style_.size_label_min_height = config_.size_label_min_height;
    animator_.set_duration(config_.animation_seconds);
}

TreemapCanvas::~TreemapCanvas() = default;

void TreemapCanvas::open(const std::string& path) {
    current_path_ = path;
    hovered_path_.clear();
    selected_path_.clear();
    awaiting_result_ = true;
    const auto generation = session_.start(path, config_.scan);
    canvas_logger()->info("scan_started generation={} path={}", generation, path);
}

void TreemapCanvas::navigate_to(const treemap_model::TreemapNode& node) {
    if (!is_navigable(node) || node.path == current_path_) return;
    // Copy first: `node` lives inside the tree that the next scan result replaces.
    const std::string target = node.path;
    back_stack_.push_back(current_path_);
    canvas_logger()->info("navigate_to path={} depth={}", target, back_stack_.size());
    open(target);
}

bool TreemapCanvas::navigate_back() {
    if (back_stack_.empty()) return false;
    std::string previous = std::move(back_stack_.back());
    back_stack_.pop_back();
    canvas_logger()->info("navigate_back path={}", previous);
    open(previous);
    return true;
}

void TreemapCanvas::refresh() {
    if (current_path_.empty()) return;
    open(current_path_);
}

const treemap_model::TreemapNode* TreemapCanvas::selected_node() const {
    if (selected_path_.empty()) return nullptr;
    for (const auto& pn : placed_.placed_nodes) {
        if (pn.node && pn.node->path == selected_path_) return pn.node;
    }
    return nullptr;
}

bool TreemapCanvas::is_layout_settled() const {
    return root_ && !is_scanning() && !layout_dirty_ && animator_.is_settled();
}

void TreemapCanvas::poll_scan() {
    auto result = session_.take_result();
    if (!result) return;

    awaiting_result_ = false;
    last_timed_out_ = result->timed_out;
    auto logger = canvas_logger();
    if (result->timed_out) {
        logger->warn("scan_timed_out path={} elapsed_ms={} entries={}",
            result->root_path, result->elapsed.count(), result->stats.entries_visited);
    }
    logger->info("scan_finished generation={} path={} size={} children={} cancelled={}",
        result->generation, result->root_path, result->root.size,
        result->root.children.size(), result->cancelled);

    // The placed rectangles point into the old tree; drop them before replacing it.
    placed_ = {};
    animator_.clear();
    root_ = std::make_unique<treemap_model::TreemapNode>(std::move(result->root));
    layout_dirty_ = true;
}

void TreemapCanvas::relayout(float region_width, float region_height) {
    last_region_width_ = region_width;
    last_region_height_ = region_height;
    layout_dirty_ = false;
    if (!root_) {
        placed_ = {};
        return;
    }
    placed_ = treemap_placement::place_treemap(*root_, region_width, region_height);
    animator_.set_targets(placed_);
    log_tiling_anomalies();
}

void TreemapCanvas::log_tiling_anomalies() const {
    const double expected = placed_.placed_nodes.empty() ? 0.0 : placed_.bounds.area();
    const double covered = treemap_placement::covered_area(placed_);
    const std::size_t overlaps = treemap_placement::count_overlaps(placed_, 1e-6);
    const double tolerance = std::max(1e-6, expected * 1e-9);
    if (std::abs(covered - expected) > tolerance || overlaps != 0) {
        canvas_logger()->error("tiling_mismatch path={} expected_area={} covered_area={} overlaps={}",
            current_path_, expected, covered, overlaps);
    }
}

void TreemapCanvas::handle_input(ImVec2 region_min, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    const ImVec2 mouse = io.MousePos;
    const bool in_region = ImGui::IsWindowHovered() &&
        mouse.x >= region_min.x && mouse.x <= region_min.x + region_width &&
        mouse.y >= region_min.y && mouse.y <= region_min.y + region_height;

    hovered_path_.clear();
    const treemap_placement::PlacedNode* hit = nullptr;
    if (in_region && !is_scanning())
        hit = treemap_placement::hit_test(placed_, mouse.x - region_min.x, mouse.y - region_min.y);
    if (hit) hovered_path_ = hit->node->path;

    if (ImGui::IsWindowFocused() && ImGui::IsKeyPressed(ImGuiKey_Backspace)) {
        navigate_back();
        return;
    }
    if (!in_region) return;

    if (ImGui::IsMouseClicked(3) || ImGui::IsMouseClicked(1)) {
        navigate_back();
        return;
    }
    if (ImGui::IsMouseClicked(0)) {
        if (!hit) {
            selected_path_.clear();
            return;
        }
        selected_path_ = hit->node->path;
        if (is_navigable(*hit->node)) navigate_to(*hit->node);
    }
}

bool TreemapCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    poll_scan();
    if (layout_dirty_ || region_width != last_region_width_ || region_height != last_region_height_)
        relayout(region_width, region_height);

    const ImVec2 region_min = ImGui::GetCursorScreenPos();
    handle_input(region_min, region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    if (!root_) {
        const char* text = is_scanning() ? "Scanning directory..." : "Nothing scanned yet";
        const ImVec2 text_size = ImGui::CalcTextSize(text);
        draw_list->AddText(ImVec2(region_min.x + (region_width - text_size.x) * 0.5f,
            region_min.y + (region_height - text_size.y) * 0.5f),
            IM_COL32(200, 200, 200, 255), text);
        return true;
    }

    animator_.tick(ImGui::GetIO().DeltaTime);
    animator_.get_current_rects(current_rects_);
    treemap_render::render_treemap(draw_list, placed_, region_min.x, region_min.y, style_,
        &current_rects_, hovered_path_, selected_path_);

    if (is_scanning()) {
        const char* text = "Scanning directory...";
        draw_list->AddText(ImVec2(region_min.x + 8.0f, region_min.y + 8.0f), IM_COL32(255, 255, 255, 255), text);
    }

    if (!hovered_path_.empty()) {
        for (const auto& pn : placed_.placed_nodes) {
            if (pn.node && pn.node->path == hovered_path_) {
                treemap_render::render_node_tooltip(*pn.node);
                break;
            }
        }
    }
    return true;
}

} // namespace canvas
