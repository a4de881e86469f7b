#include <animation/rect_animator.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace animation {

namespace {

const double snap_epsilon = 0.5;

bool same_rect(const treemap_placement::Rect& a, const treemap_placement::Rect& b, double eps) {
    return std::abs(a.x - b.x) < eps && std::abs(a.y - b.y) < eps &&
        std::abs(a.width - b.width) < eps && std::abs(a.height - b.height) < eps;
}

} // namespace

RectAnimator::RectAnimator() = default;

void RectAnimator::set_target(const std::string& id, const treemap_placement::Rect& target_rect) {
    auto it = state_.find(id);
    if (it == state_.end()) {
        State s;
        s.current = target_rect;
        s.target = target_rect;
        state_[id] = s;
    } else {
        it->second.target = target_rect;
    }
}

void RectAnimator::set_targets(const treemap_placement::PlacedTreemap& placed) {
    std::unordered_set<std::string> live;
    for (const auto& pn : placed.placed_nodes) {
        if (!pn.node) continue;
        live.insert(pn.node->path);
        set_target(pn.node->path, pn.rect);
    }
    for (auto it = state_.begin(); it != state_.end();) {
        if (live.find(it->first) == live.end())
            it = state_.erase(it);
        else
            ++it;
    }
}

static double ease_out(double t) {
    if (t >= 1.0) return 1.0;
    return 1.0 - (1.0 - t) * (1.0 - t);
}

void RectAnimator::tick(float dt) {
    if (dt <= 0.f) return;
    double step = duration_ > 0.f ? static_cast<double>(dt) / static_cast<double>(duration_) : 1.0;
    step = std::min(1.0, step);
    step = ease_out(step);
    for (auto& [id, s] : state_) {
        s.current.x += (s.target.x - s.current.x) * step;
        s.current.y += (s.target.y - s.current.y) * step;
        s.current.width += (s.target.width - s.current.width) * step;
        s.current.height += (s.target.height - s.current.height) * step;
        if (same_rect(s.current, s.target, snap_epsilon))
            s.current = s.target;
    }
}

bool RectAnimator::is_settled() const {
    for (const auto& [id, s] : state_) {
        if (!same_rect(s.current, s.target, 1e-9)) return false;
    }
    return true;
}

treemap_placement::Rect RectAnimator::get_current(const std::string& id) const {
    auto it = state_.find(id);
    if (it == state_.end()) return {};
    return it->second.current;
}

void RectAnimator::get_current_rects(std::unordered_map<std::string, treemap_placement::Rect>& out) const {
    out.clear();
    for (const auto& [id, s] : state_)
        out[id] = s.current;
}

} // namespace animation
