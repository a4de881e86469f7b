#include <catch2/catch.hpp>
#include <treemap_loaders/json_loader.hpp>
#include "TreemapTestHelper.hpp"
#include <fstream>
#include <sstream>

using namespace treemap_loaders;
using namespace std::chrono_literals;

TEST_CASE("Viewer config from JSON", "[loaders]") {
    SECTION("Empty object keeps defaults") {
        std::istringstream in("{}");
        auto config = load_viewer_config_from_json(in);
        REQUIRE(config.has_value());
        REQUIRE(config->root_path == default_root_path());
        REQUIRE(config->show_legend);
        REQUIRE(config->scan.max_entries_per_directory == 50);
        REQUIRE(config->scan.max_children == 30);
        REQUIRE(config->scan.directory_placeholder_size == 1024 * 1024);
        REQUIRE(config->scan.max_depth == 1);
        REQUIRE_FALSE(config->scan.include_hidden);
        REQUIRE(config->scan.timeout == 30s);
        REQUIRE(config->label_min_width == 40.0);
        REQUIRE(config->label_min_height == 20.0);
        REQUIRE(config->size_label_min_height == 35.0);
    }

    SECTION("All keys are read") {
        std::istringstream in(R"({
            "root_path": "/srv/data",
            "show_legend": false,
            "animation_seconds": 0.5,
            "label_min_width": 60,
            "label_min_height": 25,
            "size_label_min_height": 40,
            "scan": {
                "max_entries_per_directory": 200,
                "max_children": 12,
                "directory_placeholder_bytes": 4096,
                "max_depth": 3,
                "include_hidden": true,
                "timeout_seconds": 2.5
            }
        })");
        auto config = load_viewer_config_from_json(in);
        REQUIRE(config.has_value());
        REQUIRE(config->root_path == "/srv/data");
        REQUIRE_FALSE(config->show_legend);
        REQUIRE(config->animation_seconds == Approx(0.5f));
        REQUIRE(config->label_min_width == 60.0);
        REQUIRE(config->label_min_height == 25.0);
        REQUIRE(config->size_label_min_height == 40.0);
        REQUIRE(config->scan.max_entries_per_directory == 200);
        REQUIRE(config->scan.max_children == 12);
        REQUIRE(config->scan.directory_placeholder_size == 4096);
        REQUIRE(config->scan.max_depth == 3);
        REQUIRE(config->scan.include_hidden);
        REQUIRE(config->scan.timeout == 2500ms);
    }

    SECTION("Depth below one is raised to one") {
        std::istringstream in(R"({"scan": {"max_depth": 0}})");
        auto config = load_viewer_config_from_json(in);
        REQUIRE(config.has_value());
        REQUIRE(config->scan.max_depth == 1);
    }

    SECTION("Wrong types fail the load") {
        std::istringstream a(R"({"root_path": 5})");
        REQUIRE_FALSE(load_viewer_config_from_json(a).has_value());
        std::istringstream b(R"({"scan": {"max_children": "many"}})");
        REQUIRE_FALSE(load_viewer_config_from_json(b).has_value());
        std::istringstream c(R"({"scan": {"max_children": -3}})");
        REQUIRE_FALSE(load_viewer_config_from_json(c).has_value());
        std::istringstream d(R"({"scan": []})");
        REQUIRE_FALSE(load_viewer_config_from_json(d).has_value());
        std::istringstream e(R"([1, 2])");
        REQUIRE_FALSE(load_viewer_config_from_json(e).has_value());
    }

    SECTION("Malformed JSON fails the load") {
        std::istringstream in("{ \"root_path\": ");
        REQUIRE_FALSE(load_viewer_config_from_json(in).has_value());
    }
}

TEST_CASE("Viewer config from file", "[loaders]") {
    treemap_test::TempDir tmp;
    const auto file = tmp.path() / "viewer.json";
    {
        std::ofstream out(file);
        out << R"({"root_path": "/tmp", "scan": {"max_children": 7}})";
    }
    auto config = load_viewer_config_from_json_file(file.string());
    REQUIRE(config.has_value());
    REQUIRE(config->root_path == "/tmp");
    REQUIRE(config->scan.max_children == 7);

    REQUIRE_FALSE(load_viewer_config_from_json_file((tmp.path() / "missing.json").string()).has_value());
}
