#pragma once

#include <treemap_scan/cancellation.hpp>
#include <treemap_scan/scan_options.hpp>
#include <treemap_scan/timeout_governor.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace treemap_scan {

// Owns at most one in-flight scan. Starting a new scan cancels and joins the
// previous one first; a superseded scan's result is dropped.
class ScanSession {
public:
    ScanSession();
    ~ScanSession();
    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    // Returns the generation id carried by the eventual ScanResult.
    std::uint64_t start(const std::string& root_path, const ScanOptions& options);

    // Requests cancellation of the running scan; its partial result is still delivered.
    void cancel();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    std::uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

    // Non-blocking: the finished result, once.
    std::optional<ScanResult> take_result();
    std::optional<ScanResult> wait_for_result(std::chrono::milliseconds timeout);

private:
    void join_worker();
    void run(std::string root_path, ScanOptions options, std::uint64_t generation);

    std::thread worker_;
    CancellationFlag cancel_;
    std::atomic<bool> running_{ false };
    std::atomic<std::uint64_t> generation_{ 0 };

    mutable std::mutex mutex_;
    std::condition_variable result_ready_;
    std::optional<ScanResult> pending_;
};

} // namespace treemap_scan
