#include "timer/interval_timer.h"

#include <algorithm>

namespace pomo {

IntervalTimer::IntervalTimer(const MonotonicClock& clock, uint64_t work_duration_us, AlertSink* alert)
    : clock_(&clock), alert_(alert) {
    set_work_duration(work_duration_us);
    deadline_us_ = saturating_add(clock_->now_us(), work_duration_us_);
}

void IntervalTimer::start() {
    switch (phase_) {
        case TimerPhase::Inactive:
            if (work_duration_us_ == 0) {
                return;
            }
            enter_phase(TimerPhase::Working, clock_->now_us());
            break;
        case TimerPhase::Paused:
            resume();
            break;
        case TimerPhase::Working:
        case TimerPhase::Resting:
            break;
    }
}

void IntervalTimer::stop() {
    if (!running()) {
        return;
    }
    paused_phase_ = phase_;
    paused_at_us_ = clock_->now_us();
    phase_ = TimerPhase::Paused;
}

void IntervalTimer::resume() {
    if (phase_ != TimerPhase::Paused) {
        return;
    }
    deadline_us_ = saturating_add(deadline_us_, elapsed_since(clock_->now_us(), paused_at_us_));
    phase_ = paused_phase_;
    paused_phase_ = TimerPhase::Inactive;
}

void IntervalTimer::toggle_pause() {
    if (running()) {
        stop();
    } else {
        start();
    }
}

void IntervalTimer::reset() {
    phase_ = TimerPhase::Inactive;
    paused_phase_ = TimerPhase::Inactive;
    paused_at_us_ = 0;
}

void IntervalTimer::flip() {
    const uint64_t now_us = clock_->now_us();
    const TimerPhase current = phase_ == TimerPhase::Paused ? paused_phase_ : phase_;
    switch (current) {
        case TimerPhase::Working:
            enter_phase(TimerPhase::Resting, now_us);
            break;
        case TimerPhase::Resting:
            enter_phase(TimerPhase::Working, now_us);
            break;
        case TimerPhase::Inactive:
        case TimerPhase::Paused:
            if (work_duration_us_ == 0) {
                return;
            }
            enter_phase(TimerPhase::Working, now_us);
            break;
    }
    ring();
}

bool IntervalTimer::update() {
    if (!running() || remaining_us() != 0) {
        return false;
    }
    flip();
    return true;
}

void IntervalTimer::increase_duration(uint64_t delta_us) {
    set_work_duration(saturating_add(work_duration_us_, delta_us));
    if (has_deadline()) {
        checked_add(deadline_us_, delta_us, deadline_us_);
    }
}

void IntervalTimer::decrease_duration(uint64_t delta_us) {
    uint64_t duration = 0;
    if (!checked_sub(work_duration_us_, delta_us, duration)) {
        duration = kMinWorkDurationUs;
    }
    set_work_duration(std::max(duration, kMinWorkDurationUs));
    if (has_deadline()) {
        checked_sub(deadline_us_, delta_us, deadline_us_);
    }
}

uint64_t IntervalTimer::remaining_us() const {
    switch (phase_) {
        case TimerPhase::Inactive:
            return work_duration_us_;
        case TimerPhase::Paused:
            return saturating_sub(deadline_us_, paused_at_us_);
        case TimerPhase::Working:
        case TimerPhase::Resting:
            return saturating_sub(deadline_us_, clock_->now_us());
    }
    return 0;
}

uint64_t IntervalTimer::phase_total_us() const {
    const TimerPhase shown = phase_ == TimerPhase::Paused ? paused_phase_ : phase_;
    return shown == TimerPhase::Resting ? rest_duration_us_ : work_duration_us_;
}

void IntervalTimer::set_work_duration(uint64_t work_duration_us) {
    work_duration_us_ = work_duration_us;
    rest_duration_us_ = work_duration_us / kRestDivisor;
}

void IntervalTimer::enter_phase(TimerPhase phase, uint64_t now_us) {
    const uint64_t length = phase == TimerPhase::Resting ? rest_duration_us_ : work_duration_us_;
    deadline_us_ = saturating_add(now_us, length);
    phase_ = phase;
    paused_phase_ = TimerPhase::Inactive;
    paused_at_us_ = 0;
}

void IntervalTimer::ring() {
    if (alert_ != nullptr) {
        alert_->alert();
    }
}

}  // namespace pomo
