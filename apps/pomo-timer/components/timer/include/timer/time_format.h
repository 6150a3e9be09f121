#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "timer/timer_types.h"

namespace pomo {

// Renders whole seconds of `remaining_us` as "M:SS" (e.g. "24:05", "125:00").
// Writes at most `size` bytes including the terminator and returns the length
// the full string would have, like snprintf.
size_t format_remaining(uint64_t remaining_us, char* buffer, size_t size);

std::string format_remaining(uint64_t remaining_us);

// Window or status-line caption: "<countdown> · <phase>", e.g. "24:05 · Working".
std::string format_title(const TimerSnapshot& snapshot);

}  // namespace pomo
