#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>

namespace s3xfer::transfer {

// Sliding-window throughput for one transfer. record() yields a value at
// most once per emit interval.
class SpeedTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    
    static constexpr std::chrono::milliseconds WINDOW{3000};
    static constexpr std::chrono::milliseconds EMIT_INTERVAL{500};
    
    explicit SpeedTracker(Clock clock = nullptr,
                          std::chrono::milliseconds window = WINDOW,
                          std::chrono::milliseconds emit_interval = EMIT_INTERVAL);
    
    // Bytes per second over the window, when an update is due
    std::optional<double> record(uint64_t bytes);
    
    void reset();
    size_t sample_count() const { return samples_.size(); }

private:
    std::chrono::steady_clock::time_point now() const;
    
    Clock clock_;
    std::chrono::milliseconds window_;
    std::chrono::milliseconds emit_interval_;
    
    std::deque<std::pair<std::chrono::steady_clock::time_point, uint64_t>> samples_;
    std::optional<std::chrono::steady_clock::time_point> last_emit_;
};

} // namespace s3xfer::transfer
