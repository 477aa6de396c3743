#include "clock.hpp"
#include "platform.hpp"

namespace platform {

Clock::duration SteadyClock::now() {
    return std::chrono::duration_cast<duration>(
        std::chrono::steady_clock::now().time_since_epoch());
}

void SteadyClock::sleep(duration d) {
    sleep_ms(static_cast<int>(d.count()));
}

} // namespace platform
