#include "util/clock.hpp"

#include <thread>

namespace uplink {

SystemClock& SystemClock::Instance() {
    static SystemClock inst;
    return inst;
}

SteadyTime SystemClock::Now() const { return std::chrono::steady_clock::now(); }

WallTime SystemClock::WallNow() const { return std::chrono::system_clock::now(); }

void SystemClock::SleepFor(std::chrono::nanoseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

} // namespace uplink
