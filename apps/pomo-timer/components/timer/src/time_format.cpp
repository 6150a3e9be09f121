#include "timer/time_format.h"

#include <cinttypes>
#include <cstdio>

#include "timer/time_math.h"

namespace pomo {

size_t format_remaining(uint64_t remaining_us, char* buffer, size_t size) {
    const uint64_t total_seconds = remaining_us / kUsPerSecond;
    const uint64_t minutes = total_seconds / 60;
    const unsigned int seconds = static_cast<unsigned int>(total_seconds % 60);
    const int written = std::snprintf(buffer, size, "%" PRIu64 ":%02u", minutes, seconds);
    return written < 0 ? 0 : static_cast<size_t>(written);
}

std::string format_remaining(uint64_t remaining_us) {
    char buffer[32];
    const size_t length = format_remaining(remaining_us, buffer, sizeof(buffer));
    return std::string(buffer, length < sizeof(buffer) ? length : sizeof(buffer) - 1);
}

std::string format_title(const TimerSnapshot& snapshot) {
    std::string title = format_remaining(snapshot.remaining_ms * kUsPerMs);
    title += " \xC2\xB7 ";  // U+00B7 middle dot
    title += phase_name(snapshot.phase);
    return title;
}

}  // namespace pomo
