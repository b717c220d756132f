#include "uplink/token_bucket_throttle.hpp"

#include <algorithm>
#include <cmath>

namespace uplink {

TokenBucketThrottle::TokenBucketThrottle(std::uint64_t rate_bytes_per_sec,
                                         std::uint64_t capacity,
                                         IClock& clock)
    : rate_(rate_bytes_per_sec), capacity_(std::max<std::uint64_t>(capacity, 1)), clock_(clock),
      last_(clock.Now()) {}

void TokenBucketThrottle::RefillLocked() {
    const SteadyTime now = clock_.Now();
    const double elapsed = std::chrono::duration<double>(now - last_).count();
    last_ = now;
    if (elapsed <= 0.0) return;
    tokens_ = std::min(static_cast<double>(capacity_), tokens_ + elapsed * static_cast<double>(rate_));
}

void TokenBucketThrottle::Acquire(std::uint64_t n) {
    if (rate_ == 0 || n == 0) return;

    std::lock_guard<std::mutex> lk(mu_);
    std::uint64_t remaining = n;
    while (remaining > 0) {
        const double take = static_cast<double>(std::min(remaining, capacity_));
        RefillLocked();
        while (tokens_ < take) {
            const double deficit_sec = (take - tokens_) / static_cast<double>(rate_);
            const auto wait = std::chrono::nanoseconds(
                std::max<long long>(1, static_cast<long long>(std::ceil(deficit_sec * 1e9))));
            clock_.SleepFor(wait);
            RefillLocked();
        }
        tokens_ -= take;
        remaining -= static_cast<std::uint64_t>(take);
    }
}

} // namespace uplink
