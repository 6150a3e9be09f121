#include "timer/monotonic_clock.h"

#include <chrono>

namespace pomo {

namespace {
const auto g_epoch = std::chrono::steady_clock::now();
}

uint64_t SteadyClock::now_us() const {
    const auto elapsed = std::chrono::steady_clock::now() - g_epoch;
    return kBaseUs + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

}  // namespace pomo
