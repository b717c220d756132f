#include "testing.hpp"
#include "uplink/token_bucket_throttle.hpp"

#include <chrono>
#include <gtest/gtest.h>

namespace {

using namespace std::chrono_literals;

TEST(TokenBucketThrottleTests, ZeroRateNeverSleeps) {
    testutil::FakeClock clock;
    uplink::TokenBucketThrottle t(0, 1024, clock);
    EXPECT_TRUE(t.Unlimited());

    t.Acquire(100 * 1024 * 1024);
    EXPECT_TRUE(clock.Sleeps().empty());
}

TEST(TokenBucketThrottleTests, BucketStartsEmpty) {
    testutil::FakeClock clock;
    uplink::TokenBucketThrottle t(1000, 1000, clock);

    t.Acquire(500);
    EXPECT_GE(clock.TotalSlept(), 500ms);
}

TEST(TokenBucketThrottleTests, ElapsedTimeAtLeastBytesOverRate) {
    testutil::FakeClock clock;
    const std::uint64_t rate = 1024 * 1024;
    uplink::TokenBucketThrottle t(rate, 256 * 1024, clock);

    const auto start = clock.Now();
    // 4 MiB in chunk-sized requests, larger than capacity on purpose.
    for (int i = 0; i < 8; ++i) t.Acquire(512 * 1024);
    const auto elapsed = clock.Now() - start;

    EXPECT_GE(elapsed, 4s);
    EXPECT_LT(elapsed, 4s + 10ms);
}

TEST(TokenBucketThrottleTests, IdleTimeRefillsUpToCapacity) {
    testutil::FakeClock clock;
    uplink::TokenBucketThrottle t(1000, 1000, clock);

    clock.Advance(10s);  // Would be 10000 bytes without the cap.
    t.Acquire(1000);
    EXPECT_TRUE(clock.Sleeps().empty());

    t.Acquire(1000);
    EXPECT_GE(clock.TotalSlept(), 1s);
}

} // namespace
