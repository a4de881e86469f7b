#pragma once

#include <treemap_model/types.hpp>
#include <treemap_scan/cancellation.hpp>
#include <treemap_scan/scan_options.hpp>
#include <treemap_scan/scanner.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace treemap_scan {

struct ScanResult {
    treemap_model::TreemapNode root;
    std::string root_path;
    std::uint64_t generation = 0;
    // Cancellation was observed, either requested by the caller or by the deadline.
    bool cancelled = false;
    bool timed_out = false;
    ScanStats stats;
    std::chrono::milliseconds elapsed{ 0 };
};

// Runs scan_path on a worker and requests cancellation once options.timeout
// elapses. The call still waits for the scan to return; the overrun is bounded
// by the scanner's per-entry cancellation checks. A non-positive timeout means
// no deadline.
ScanResult scan_with_timeout(const std::string& root_path,
    const ScanOptions& options,
    CancellationFlag& cancel);

} // namespace treemap_scan
