#pragma once

#include <treemap_placement/types.hpp>
#include <string>
#include <unordered_map>

namespace animation {

// Eases each treemap rectangle (keyed by node path) toward its latest layout position.
class RectAnimator {
public:
    RectAnimator();
    void set_duration(float seconds) { duration_ = seconds; }
    float duration() const { return duration_; }

    void set_target(const std::string& id, const treemap_placement::Rect& target_rect);
    // Retargets every placed node and forgets ids missing from `placed`.
    void set_targets(const treemap_placement::PlacedTreemap& placed);
    void clear() { state_.clear(); }

    void tick(float dt);
    bool is_settled() const;
    treemap_placement::Rect get_current(const std::string& id) const;
    void get_current_rects(std::unordered_map<std::string, treemap_placement::Rect>& out) const;

private:
    struct State {
        treemap_placement::Rect current;
        treemap_placement::Rect target;
    };
    std::unordered_map<std::string, State> state_;
    float duration_ = 0.3f;
};

} // namespace animation
