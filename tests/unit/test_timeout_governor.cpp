#include <catch2/catch.hpp>
#include <treemap_scan/timeout_governor.hpp>
#include "TreemapTestHelper.hpp"
#include <chrono>
#include <string>
#include <thread>

using namespace treemap_scan;
using namespace std::chrono_literals;
using treemap_test::TempDir;

TEST_CASE("Scan finishing before the deadline", "[timeout]") {
    TempDir tmp;
    tmp.write_file("a.txt", 10);
    tmp.write_file("b.txt", 20);
    CancellationFlag cancel;
    ScanOptions options;
    options.timeout = 10s;

    auto result = scan_with_timeout(tmp.path().string(), options, cancel);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE_FALSE(result.cancelled);
    REQUIRE(result.root.children.size() == 2);
    REQUIRE(result.root.size == 30);
    REQUIRE(result.root_path == tmp.path().string());
    REQUIRE(result.stats.entries_visited == 2);
}

TEST_CASE("Deadline cancels a slow scan and returns the partial tree", "[timeout]") {
    TempDir tmp;
    for (int i = 0; i < 40; ++i)
        tmp.write_file("f" + std::to_string(i) + ".bin", 10);
    CancellationFlag cancel;
    ScanOptions options;
    options.timeout = 100ms;
    options.on_entry = [](const treemap_model::TreemapNode&) { std::this_thread::sleep_for(20ms); };

    auto result = scan_with_timeout(tmp.path().string(), options, cancel);
    REQUIRE(result.timed_out);
    REQUIRE(result.cancelled);
    REQUIRE(cancel.is_cancelled());
    REQUIRE(result.root.children.size() < 30);
    REQUIRE(result.root.size == static_cast<std::int64_t>(result.root.children.size()) * 10);
    REQUIRE(result.elapsed < 2000ms);
}

TEST_CASE("Caller cancellation is reported without a timeout", "[timeout]") {
    TempDir tmp;
    tmp.write_file("a.txt", 10);
    CancellationFlag cancel;
    cancel.request_cancel();

    auto result = scan_with_timeout(tmp.path().string(), ScanOptions{}, cancel);
    REQUIRE(result.cancelled);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.root.children.empty());
}

TEST_CASE("Bad path through the governor", "[timeout]") {
    CancellationFlag cancel;
    auto result = scan_with_timeout("/no/such/path", ScanOptions{}, cancel);
    REQUIRE(result.root.name == "Error");
    REQUIRE(result.root.size == 0);
    REQUIRE_FALSE(result.timed_out);
}
