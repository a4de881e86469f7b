#pragma once

#include <treemap_model/types.hpp>
#include <treemap_scan/cancellation.hpp>
#include <treemap_scan/scan_options.hpp>
#include <cstddef>
#include <filesystem>

namespace treemap_scan {

struct ScanStats {
    std::size_t entries_visited = 0;
    std::size_t entries_skipped = 0;
    std::size_t directories_failed = 0;
};

// Never throws. A missing or unreadable root yields a zero-size "Error" leaf,
// unreadable directories yield empty child lists, and a cancelled scan returns
// the children collected so far.
treemap_model::TreemapNode scan_path(const std::filesystem::path& root,
    const ScanOptions& options,
    const CancellationFlag& cancel,
    ScanStats* stats = nullptr);

treemap_model::TreemapNode make_error_node(const std::filesystem::path& root);

} // namespace treemap_scan
