#include <treemap_scan/scan_session.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace treemap_scan {

ScanSession::ScanSession() = default;

ScanSession::~ScanSession() {
    generation_.fetch_add(1, std::memory_order_acq_rel);
    cancel_.request_cancel();
    join_worker();
}

std::uint64_t ScanSession::start(const std::string& root_path, const ScanOptions& options) {
    const std::uint64_t generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (worker_.joinable()) {
        if (running_.load(std::memory_order_acquire))
            spdlog::warn("scan generation {} superseded by scan of {}", generation - 1, root_path);
        cancel_.request_cancel();
        join_worker();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.reset();
    }
    cancel_.reset();
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this, root_path, options, generation]() { run(root_path, options, generation); });
    return generation;
}

void ScanSession::cancel() {
    cancel_.request_cancel();
}

std::optional<ScanResult> ScanSession::take_result() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<ScanResult> out = std::move(pending_);
    pending_.reset();
    return out;
}

std::optional<ScanResult> ScanSession::wait_for_result(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!result_ready_.wait_for(lock, timeout, [this]() { return pending_.has_value(); }))
        return std::nullopt;
    std::optional<ScanResult> out = std::move(pending_);
    pending_.reset();
    return out;
}

void ScanSession::join_worker() {
    if (worker_.joinable()) worker_.join();
}

void ScanSession::run(std::string root_path, ScanOptions options, std::uint64_t generation) {
    spdlog::info("scan generation {} started: {}", generation, root_path);
    ScanResult result = scan_with_timeout(root_path, options, cancel_);
    result.generation = generation;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_.load(std::memory_order_acquire)) {
            pending_ = std::move(result);
        } else {
            spdlog::debug("scan generation {} discarded", generation);
        }
        running_.store(false, std::memory_order_release);
    }
    result_ready_.notify_all();
}

} // namespace treemap_scan
