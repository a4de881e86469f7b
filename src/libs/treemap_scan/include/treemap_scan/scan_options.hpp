#pragma once

#include <treemap_model/types.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace treemap_scan {

struct ScanOptions {
    // Entries looked at per directory (hidden entries excluded before counting).
    std::size_t max_entries_per_directory = 50;
    // Children kept per directory after sorting by descending size.
    std::size_t max_children = 30;
    // Size given to directories below the full-detail depth.
    std::int64_t directory_placeholder_size = 1024 * 1024;
    // Directory levels enumerated in full; the root is level 0 and is always enumerated.
    int max_depth = 1;
    bool include_hidden = false;
    std::chrono::milliseconds timeout{ 30000 };
    // Called after each entry has been turned into a node, on the scanning thread.
    std::function<void(const treemap_model::TreemapNode&)> on_entry;
};

} // namespace treemap_scan
