#pragma once

#include <cstdint>

namespace pomo {

enum class TimerPhase : uint8_t {
    Inactive,
    Working,
    Resting,
    Paused,
};

enum class ControlCommand : uint8_t {
    None,
    Start,
    Stop,
    Resume,
    TogglePause,
    Reset,
    Flip,
    IncreaseDuration,
    DecreaseDuration,
};

struct TimerSnapshot {
    TimerPhase phase = TimerPhase::Inactive;
    TimerPhase paused_phase = TimerPhase::Inactive;  // Working or Resting while phase == Paused
    uint32_t work_seconds = 0;
    uint32_t rest_seconds = 0;
    uint64_t phase_total_ms = 0;
    uint64_t remaining_ms = 0;
    uint32_t flip_count = 0;
    uint64_t monotonic_us = 0;
};

const char* phase_name(TimerPhase phase);
const char* command_name(ControlCommand command);

}  // namespace pomo
