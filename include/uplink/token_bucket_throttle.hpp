#pragma once

#include "util/clock.hpp"

#include <cstdint>
#include <mutex>

namespace uplink {

// Bytes/second limiter. The bucket holds at most `capacity` bytes of budget
// (one chunk) and starts empty, so N bytes never pass in less than N / rate
// seconds. A rate of 0 disables throttling.
class TokenBucketThrottle {
public:
    TokenBucketThrottle(std::uint64_t rate_bytes_per_sec, std::uint64_t capacity, IClock& clock);

    // Blocks until `n` bytes of budget are available, then consumes them.
    // Requests above capacity are served in capacity-sized installments.
    void Acquire(std::uint64_t n);

    std::uint64_t Rate() const { return rate_; }
    std::uint64_t Capacity() const { return capacity_; }
    bool Unlimited() const { return rate_ == 0; }

private:
    void RefillLocked();

    std::uint64_t rate_;
    std::uint64_t capacity_;
    IClock& clock_;

    std::mutex mu_;
    double tokens_ = 0.0;
    SteadyTime last_;
};

} // namespace uplink
