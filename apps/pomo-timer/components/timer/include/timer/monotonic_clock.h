#pragma once

#include <cstdint>

namespace pomo {

// Source of monotonic time in microseconds. Readings never decrease on a
// conforming implementation, but consumers must tolerate ones that do.
class MonotonicClock {
public:
    virtual ~MonotonicClock() = default;
    virtual uint64_t now_us() const = 0;
};

// std::chrono::steady_clock, counted from process start plus a fixed base
// so that deadlines minus any realistic duration edit stay representable.
class SteadyClock final : public MonotonicClock {
public:
    static constexpr uint64_t kBaseUs = 1ULL << 40;  // ~12.7 days

    uint64_t now_us() const override;
};

}  // namespace pomo
