#pragma once

#include <chrono>

namespace platform {

// Time source for poll loops. Tests substitute a fake that advances on sleep().
class Clock {
public:
    using duration = std::chrono::milliseconds;

    virtual ~Clock() = default;

    // Monotonic time since an arbitrary epoch.
    virtual duration now() = 0;
    virtual void sleep(duration d) = 0;
};

class SteadyClock : public Clock {
public:
    duration now() override;
    void sleep(duration d) override;
};

// Seconds (as configured) to the clock's resolution.
inline Clock::duration seconds_to_ms(double seconds) {
    return Clock::duration(static_cast<long long>(seconds * 1000.0 + 0.5));
}

} // namespace platform
