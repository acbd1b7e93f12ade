#include "s3xfer/transfer/speed_tracker.hpp"

namespace s3xfer::transfer {

SpeedTracker::SpeedTracker(Clock clock, std::chrono::milliseconds window,
                           std::chrono::milliseconds emit_interval)
    : clock_(std::move(clock))
    , window_(window)
    , emit_interval_(emit_interval) {
}

std::chrono::steady_clock::time_point SpeedTracker::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::optional<double> SpeedTracker::record(uint64_t bytes) {
    auto current = now();
    samples_.emplace_back(current, bytes);
    
    while (!samples_.empty() && current - samples_.front().first > window_) {
        samples_.pop_front();
    }
    
    if (last_emit_ && current - *last_emit_ < emit_interval_) {
        return std::nullopt;
    }
    last_emit_ = current;
    
    auto elapsed = std::chrono::duration<double>(current - samples_.front().first).count();
    if (elapsed <= 0.0) {
        return std::nullopt;
    }
    
    uint64_t total = 0;
    for (const auto& [time, sample_bytes] : samples_) {
        total += sample_bytes;
    }
    return static_cast<double>(total) / elapsed;
}

void SpeedTracker::reset() {
    samples_.clear();
    last_emit_.reset();
}

} // namespace s3xfer::transfer
