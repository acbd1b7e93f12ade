#pragma once

#include <chrono>
#include <random>

namespace s3xfer::transfer {

// Exponential backoff with jitter. After failed attempt `a` (0-based) the
// next attempt waits 0 for a = 0, otherwise
// base * growth^(a-1) plus up to `jitter` of that again.
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    double growth = 4.0;
    double jitter = 0.5;
    
    std::chrono::milliseconds delay_for(int attempt, std::mt19937_64& rng) const;
    std::chrono::milliseconds min_delay_for(int attempt) const;
    std::chrono::milliseconds max_delay_for(int attempt) const;
    
    bool validate() const;
};

} // namespace s3xfer::transfer
