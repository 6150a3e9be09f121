#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

#include "support/err.h"
#include "timer/alert_sink.h"
#include "timer/interval_timer.h"
#include "timer/monotonic_clock.h"
#include "timer/timer_types.h"

namespace pomo {

struct TimerEngineConfig {
    uint32_t work_seconds = 25 * 60;
    uint32_t adjust_step_seconds = 5 * 60;
    uint32_t command_queue_depth = 16;
    bool auto_start = false;
};

// Owns the interval timer for a host. Commands may be queued from any thread;
// they are applied in order on the thread that calls poll(). The host alert
// runs inside poll() with the engine locked and must not call back into it.
class TimerEngine {
public:
    TimerEngine() = default;
    TimerEngine(const TimerEngine&) = delete;
    TimerEngine& operator=(const TimerEngine&) = delete;

    pomo_err_t init(const TimerEngineConfig& config, const MonotonicClock& clock, AlertSink* alert = nullptr);

    bool enqueue_control(ControlCommand command);

    // Applies pending commands, advances the timer and publishes a snapshot.
    TimerSnapshot poll();

    TimerSnapshot latest_snapshot() const;
    const TimerEngineConfig& config() const { return config_; }

private:
    // Forwards timer alerts to the host sink and counts flips.
    class FlipRelay : public AlertSink {
    public:
        explicit FlipRelay(TimerEngine& owner) : owner_(owner) {}
        void alert() override;

    private:
        TimerEngine& owner_;
    };

    void execute(ControlCommand command);
    void on_flip();
    TimerSnapshot make_snapshot() const;

    TimerEngineConfig config_{};
    const MonotonicClock* clock_ = nullptr;
    AlertSink* host_alert_ = nullptr;
    FlipRelay relay_{*this};
    std::unique_ptr<IntervalTimer> timer_;

    mutable std::mutex queue_mutex_;
    std::deque<ControlCommand> pending_;
    size_t queue_depth_ = 0;

    mutable std::mutex state_mutex_;
    TimerSnapshot snapshot_{};
    uint32_t flip_count_ = 0;
};

}  // namespace pomo
