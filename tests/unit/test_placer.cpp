#include <catch2/catch.hpp>
#include <treemap_placement/placer.hpp>

using namespace treemap_placement;
using treemap_model::FileTypeCategory;

TEST_CASE("Placing a scanned tree", "[placer]") {
    SECTION("Leaf root fills the canvas") {
        auto root = treemap_model::make_leaf("file.bin", "/file.bin", 42, FileTypeCategory::Other);
        auto placed = place_treemap(root, 800, 600);
        REQUIRE(placed.placed_nodes.size() == 1);
        REQUIRE(placed.placed_nodes[0].node == &root);
        REQUIRE(placed.placed_nodes[0].rect.x == 0.0);
        REQUIRE(placed.placed_nodes[0].rect.y == 0.0);
        REQUIRE(placed.placed_nodes[0].rect.width == 800.0);
        REQUIRE(placed.placed_nodes[0].rect.height == 600.0);
    }

    SECTION("Children are laid out, not the root") {
        auto root = treemap_model::make_directory("d", "/d", {
            treemap_model::make_leaf("a", "/d/a", 75, FileTypeCategory::Code, 1),
            treemap_model::make_leaf("b", "/d/b", 25, FileTypeCategory::Images, 1),
        });
        auto placed = place_treemap(root, 400, 200);
        REQUIRE(placed.placed_nodes.size() == 2);
        REQUIRE(covered_area(placed) == Approx(80000.0));
        REQUIRE(count_overlaps(placed) == 0);
        for (const auto& pn : placed.placed_nodes)
            REQUIRE(pn.node != &root);
    }

    SECTION("Directory with zero total size places nothing") {
        auto root = treemap_model::make_directory("d", "/d", {
            treemap_model::make_leaf("a", "/d/a", 0, FileTypeCategory::Other, 1),
        });
        REQUIRE(place_treemap(root, 400, 200).placed_nodes.empty());
    }

    SECTION("Negative canvas size is clamped") {
        auto root = treemap_model::make_leaf("f", "/f", 1, FileTypeCategory::Other);
        auto placed = place_treemap(root, -10, 50);
        REQUIRE(placed.bounds.width == 0.0);
        REQUIRE(covered_area(placed) == 0.0);
    }
}

TEST_CASE("Hit testing", "[placer]") {
    auto root = treemap_model::make_directory("d", "/d", {
        treemap_model::make_leaf("big", "/d/big", 100, FileTypeCategory::Videos, 1),
        treemap_model::make_leaf("small", "/d/small", 50, FileTypeCategory::Audio, 1),
        treemap_model::make_leaf("small2", "/d/small2", 50, FileTypeCategory::Audio, 1),
    });
    auto placed = place_treemap(root, 200, 100);

    const PlacedNode* hit = hit_test(placed, 10, 10);
    REQUIRE(hit != nullptr);
    REQUIRE(hit->node->name == "big");

    hit = hit_test(placed, 190, 90);
    REQUIRE(hit != nullptr);
    REQUIRE(hit->node->name.rfind("small", 0) == 0);

    REQUIRE(hit_test(placed, 250, 50) == nullptr);
    REQUIRE(hit_test(placed, -1, 50) == nullptr);
}

TEST_CASE("Overlap counting", "[placer]") {
    treemap_model::TreemapNode a;
    treemap_model::TreemapNode b;
    PlacedTreemap placed;
    placed.bounds = Rect{ 0, 0, 100, 100 };

    SECTION("Touching edges do not overlap") {
        placed.placed_nodes = { { &a, Rect{ 0, 0, 50, 100 } }, { &b, Rect{ 50, 0, 50, 100 } } };
        REQUIRE(count_overlaps(placed) == 0);
        REQUIRE(covered_area(placed) == Approx(10000.0));
    }

    SECTION("Intersecting rectangles overlap") {
        placed.placed_nodes = { { &a, Rect{ 0, 0, 60, 100 } }, { &b, Rect{ 50, 0, 50, 100 } } };
        REQUIRE(count_overlaps(placed) == 1);
    }
}
