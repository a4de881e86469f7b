#include <catch2/catch.hpp>
#include <animation/rect_animator.hpp>

using animation::RectAnimator;
using treemap_placement::PlacedTreemap;
using treemap_placement::Rect;

TEST_CASE("Rect animator", "[animation]") {
    RectAnimator animator;
    animator.set_duration(0.2f);

    SECTION("First target is adopted immediately") {
        animator.set_target("/a", Rect{ 0, 0, 100, 50 });
        REQUIRE(animator.is_settled());
        REQUIRE(animator.get_current("/a").width == 100.0);
    }

    SECTION("Retargeting eases toward the new rectangle") {
        animator.set_target("/a", Rect{ 0, 0, 100, 100 });
        animator.set_target("/a", Rect{ 0, 0, 200, 100 });
        REQUIRE_FALSE(animator.is_settled());

        animator.tick(0.05f);
        const double mid = animator.get_current("/a").width;
        REQUIRE(mid > 100.0);
        REQUIRE(mid < 200.0);

        for (int i = 0; i < 20; ++i)
            animator.tick(0.05f);
        REQUIRE(animator.is_settled());
        REQUIRE(animator.get_current("/a").width == 200.0);
    }

    SECTION("A full duration step lands on the target") {
        animator.set_target("/a", Rect{ 0, 0, 10, 10 });
        animator.set_target("/a", Rect{ 50, 50, 10, 10 });
        animator.tick(1.0f);
        REQUIRE(animator.get_current("/a").x == 50.0);
        REQUIRE(animator.is_settled());
    }

    SECTION("Targets from a layout replace stale entries") {
        treemap_model::TreemapNode keep;
        keep.path = "/keep";
        animator.set_target("/gone", Rect{ 0, 0, 1, 1 });
        PlacedTreemap placed;
        placed.placed_nodes.push_back({ &keep, Rect{ 0, 0, 30, 30 } });
        animator.set_targets(placed);

        std::unordered_map<std::string, Rect> current;
        animator.get_current_rects(current);
        REQUIRE(current.size() == 1);
        REQUIRE(current.count("/keep") == 1);
    }

    SECTION("Unknown ids give an empty rectangle") {
        REQUIRE(animator.get_current("/missing").area() == 0.0);
    }
}
