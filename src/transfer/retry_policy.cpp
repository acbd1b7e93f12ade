#include "s3xfer/transfer/retry_policy.hpp"
#include <cmath>

namespace s3xfer::transfer {

std::chrono::milliseconds RetryPolicy::min_delay_for(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }
    double base = static_cast<double>(base_delay.count()) * std::pow(growth, attempt - 1);
    return std::chrono::milliseconds(static_cast<int64_t>(base));
}

std::chrono::milliseconds RetryPolicy::max_delay_for(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }
    double base = static_cast<double>(base_delay.count()) * std::pow(growth, attempt - 1);
    return std::chrono::milliseconds(static_cast<int64_t>(base * (1.0 + jitter)));
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt, std::mt19937_64& rng) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }
    
    double base = static_cast<double>(base_delay.count()) * std::pow(growth, attempt - 1);
    std::uniform_real_distribution<double> spread(0.0, base * jitter);
    double delay = base + (jitter > 0.0 ? spread(rng) : 0.0);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool RetryPolicy::validate() const {
    return max_attempts > 0 && base_delay.count() >= 0 && growth >= 1.0 && jitter >= 0.0;
}

} // namespace s3xfer::transfer
