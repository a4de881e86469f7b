#include <treemap_scan/timeout_governor.hpp>
#include <spdlog/spdlog.h>
#include <future>
#include <utility>

namespace treemap_scan {

ScanResult scan_with_timeout(const std::string& root_path,
    const ScanOptions& options,
    CancellationFlag& cancel)
{
    const auto started = std::chrono::steady_clock::now();
    ScanResult result;
    result.root_path = root_path;

    ScanStats stats;
    auto scan = std::async(std::launch::async, [&root_path, &options, &cancel, &stats]() {
        return scan_path(root_path, options, cancel, &stats);
    });

    if (options.timeout.count() > 0 &&
        scan.wait_for(options.timeout) == std::future_status::timeout)
    {
        spdlog::warn("scan of {} exceeded {} ms, requesting cancellation", root_path, options.timeout.count());
        result.timed_out = true;
        cancel.request_cancel();
    }

    result.root = scan.get();
    result.stats = stats;
    result.cancelled = cancel.is_cancelled();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("scan of {} finished: entries={} skipped={} failed_dirs={} elapsed_ms={}{}",
        root_path, stats.entries_visited, stats.entries_skipped, stats.directories_failed,
        result.elapsed.count(), result.cancelled ? " (cancelled)" : "");
    return result;
}

} // namespace treemap_scan
