#pragma once

#include <chrono>

namespace uplink {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

// Time source for everything that waits or compares against expiry.
// Tests substitute a fake that advances on SleepFor().
class IClock {
public:
    virtual ~IClock() = default;
    virtual SteadyTime Now() const = 0;
    virtual WallTime WallNow() const = 0;
    virtual void SleepFor(std::chrono::nanoseconds d) = 0;
};

class SystemClock final : public IClock {
public:
    static SystemClock& Instance();

    SteadyTime Now() const override;
    WallTime WallNow() const override;
    void SleepFor(std::chrono::nanoseconds d) override;
};

} // namespace uplink
