#pragma once

#include <cstdint>

#include "timer/alert_sink.h"
#include "timer/monotonic_clock.h"
#include "timer/time_math.h"
#include "timer/timer_types.h"

namespace pomo {

// Work/rest interval timer driven by a monotonic clock.
//
// The timer keeps one absolute deadline for the running phase. Remaining time
// is always derived as `deadline - now`, so irregular polling never
// accumulates drift. Pausing records the instant it happened; resuming pushes
// the deadline forward by exactly the paused span and returns to the phase
// that was running.
//
// Rest length is fixed at a fifth of the work length. Every operation is
// total: out-of-range arithmetic clamps and invalid transitions are no-ops.
//
// Not thread-safe. The clock and alert sink must outlive the timer; the alert
// sink may be null.
class IntervalTimer {
public:
    static constexpr uint64_t kMinWorkDurationUs = 5 * kUsPerMinute;
    static constexpr uint64_t kRestDivisor = 5;

    IntervalTimer(const MonotonicClock& clock, uint64_t work_duration_us, AlertSink* alert = nullptr);

    // Inactive: begins a work phase unless the work duration is zero.
    // Paused: same as resume(). Otherwise a no-op.
    void start();

    // Working/Resting: freezes the remaining time. Otherwise a no-op.
    void stop();
    void pause() { stop(); }

    // Paused: shifts the deadline by the paused span and continues the phase
    // that was interrupted. Otherwise a no-op.
    void resume();

    void toggle_pause();
    void reset();

    // Switches to the other phase with a fresh deadline and fires the alert.
    // From Inactive this starts a work phase; from Paused it switches away
    // from the paused phase.
    void flip();

    // Performs at most one flip when the running phase has expired.
    // Returns true if a flip happened.
    bool update();
    bool tick() { return update(); }

    void increase_duration(uint64_t delta_us);
    void decrease_duration(uint64_t delta_us);

    uint64_t remaining_us() const;

    // Length of the phase currently shown: rest while resting (or paused
    // during rest), work otherwise.
    uint64_t phase_total_us() const;

    TimerPhase phase() const { return phase_; }
    TimerPhase paused_phase() const { return phase_ == TimerPhase::Paused ? paused_phase_ : TimerPhase::Inactive; }
    uint64_t work_duration_us() const { return work_duration_us_; }
    uint64_t rest_duration_us() const { return rest_duration_us_; }
    uint64_t deadline_us() const { return deadline_us_; }
    bool running() const { return phase_ == TimerPhase::Working || phase_ == TimerPhase::Resting; }

private:
    void set_work_duration(uint64_t work_duration_us);
    bool has_deadline() const { return running() || phase_ == TimerPhase::Paused; }
    void enter_phase(TimerPhase phase, uint64_t now_us);
    void ring();

    const MonotonicClock* clock_;
    AlertSink* alert_;
    uint64_t work_duration_us_ = 0;
    uint64_t rest_duration_us_ = 0;
    uint64_t deadline_us_ = 0;
    uint64_t paused_at_us_ = 0;
    TimerPhase phase_ = TimerPhase::Inactive;
    TimerPhase paused_phase_ = TimerPhase::Inactive;
};

}  // namespace pomo
