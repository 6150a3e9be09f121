#pragma once

#include <cstdint>
#include <limits>

namespace pomo {

constexpr uint64_t kUsPerMs = 1000;
constexpr uint64_t kUsPerSecond = 1000 * kUsPerMs;
constexpr uint64_t kUsPerMinute = 60 * kUsPerSecond;
constexpr uint64_t kMaxSpanUs = std::numeric_limits<uint64_t>::max();

constexpr uint64_t saturating_add(uint64_t a, uint64_t b) {
    return a > kMaxSpanUs - b ? kMaxSpanUs : a + b;
}

constexpr uint64_t saturating_sub(uint64_t a, uint64_t b) {
    return a > b ? a - b : 0;
}

// Span from `earlier` to `now`, zero if the clock reads as having gone backwards.
constexpr uint64_t elapsed_since(uint64_t now, uint64_t earlier) {
    return saturating_sub(now, earlier);
}

// Writes a + b to `out` and returns true, or leaves `out` untouched on overflow.
constexpr bool checked_add(uint64_t a, uint64_t b, uint64_t& out) {
    if (a > kMaxSpanUs - b) {
        return false;
    }
    out = a + b;
    return true;
}

constexpr bool checked_sub(uint64_t a, uint64_t b, uint64_t& out) {
    if (b > a) {
        return false;
    }
    out = a - b;
    return true;
}

constexpr uint64_t minutes_to_us(uint64_t minutes) {
    return minutes > kMaxSpanUs / kUsPerMinute ? kMaxSpanUs : minutes * kUsPerMinute;
}

constexpr uint64_t seconds_to_us(uint64_t seconds) {
    return seconds > kMaxSpanUs / kUsPerSecond ? kMaxSpanUs : seconds * kUsPerSecond;
}

}  // namespace pomo
