#pragma once

#include <atomic>

namespace treemap_scan {

// Cooperative cancellation signal. The scanner polls it before every entry and
// at the start of every directory; nothing is interrupted forcibly.
class CancellationFlag {
public:
    CancellationFlag() = default;
    CancellationFlag(const CancellationFlag&) = delete;
    CancellationFlag& operator=(const CancellationFlag&) = delete;

    void request_cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    void reset() { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{ false };
};

} // namespace treemap_scan
