#include "timer/timer_engine.h"

#include <algorithm>
#include <cstdint>

#include "support/log.h"
#include "timer/time_format.h"
#include "timer/time_math.h"

namespace pomo {

namespace {
constexpr const char* TAG = "TimerEngine";
}  // namespace

pomo_err_t TimerEngine::init(const TimerEngineConfig& config, const MonotonicClock& clock, AlertSink* alert) {
    if (config.command_queue_depth == 0) {
        POMO_LOGE(TAG, "Command queue depth must be non-zero");
        return POMO_ERR_INVALID_ARG;
    }
    if (config.adjust_step_seconds == 0) {
        POMO_LOGE(TAG, "Adjust step must be non-zero");
        return POMO_ERR_INVALID_ARG;
    }

    std::lock_guard<std::mutex> state_lock(state_mutex_);
    config_ = config;
    clock_ = &clock;
    host_alert_ = alert;
    flip_count_ = 0;
    timer_ = std::make_unique<IntervalTimer>(clock, seconds_to_us(config_.work_seconds), &relay_);
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex_);
        pending_.clear();
        queue_depth_ = config_.command_queue_depth;
    }

    if (config_.auto_start) {
        timer_->start();
    }

    snapshot_ = make_snapshot();
    POMO_LOGI(TAG, "Initialised: work %s, rest %s, %s",
              format_remaining(timer_->work_duration_us()).c_str(),
              format_remaining(timer_->rest_duration_us()).c_str(),
              phase_name(timer_->phase()));
    return POMO_OK;
}

bool TimerEngine::enqueue_control(ControlCommand command) {
    if (command == ControlCommand::None) {
        return false;
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_depth_ == 0) {
        POMO_LOGW(TAG, "Engine not initialised, dropping %s", command_name(command));
        return false;
    }
    if (pending_.size() >= queue_depth_) {
        POMO_LOGW(TAG, "Command queue full, dropping %s", command_name(command));
        return false;
    }
    pending_.push_back(command);
    return true;
}

TimerSnapshot TimerEngine::poll() {
    std::deque<ControlCommand> commands;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        commands.swap(pending_);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!timer_) {
        return snapshot_;
    }

    for (ControlCommand command : commands) {
        execute(command);
    }
    timer_->update();

    snapshot_ = make_snapshot();
    return snapshot_;
}

TimerSnapshot TimerEngine::latest_snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return snapshot_;
}

void TimerEngine::execute(ControlCommand command) {
    const TimerPhase before = timer_->phase();
    const uint64_t step_us = seconds_to_us(config_.adjust_step_seconds);

    switch (command) {
        case ControlCommand::Start:
            timer_->start();
            break;
        case ControlCommand::Stop:
            timer_->stop();
            break;
        case ControlCommand::Resume:
            timer_->resume();
            break;
        case ControlCommand::TogglePause:
            timer_->toggle_pause();
            break;
        case ControlCommand::Reset:
            timer_->reset();
            break;
        case ControlCommand::Flip:
            timer_->flip();
            break;
        case ControlCommand::IncreaseDuration:
            timer_->increase_duration(step_us);
            POMO_LOGI(TAG, "Work duration now %s", format_remaining(timer_->work_duration_us()).c_str());
            break;
        case ControlCommand::DecreaseDuration:
            timer_->decrease_duration(step_us);
            POMO_LOGI(TAG, "Work duration now %s", format_remaining(timer_->work_duration_us()).c_str());
            break;
        case ControlCommand::None:
        default:
            break;
    }

    if (timer_->phase() != before) {
        POMO_LOGD(TAG, "%s: %s -> %s", command_name(command), phase_name(before), phase_name(timer_->phase()));
    }
}

void TimerEngine::on_flip() {
    ++flip_count_;
    POMO_LOGI(TAG, "Phase flipped to %s (%s)", phase_name(timer_->phase()),
              format_remaining(timer_->remaining_us()).c_str());
    if (host_alert_ != nullptr) {
        host_alert_->alert();
    }
}

void TimerEngine::FlipRelay::alert() {
    owner_.on_flip();
}

TimerSnapshot TimerEngine::make_snapshot() const {
    return TimerSnapshot{
        .phase = timer_->phase(),
        .paused_phase = timer_->paused_phase(),
        .work_seconds = static_cast<uint32_t>(std::min<uint64_t>(timer_->work_duration_us() / kUsPerSecond, UINT32_MAX)),
        .rest_seconds = static_cast<uint32_t>(std::min<uint64_t>(timer_->rest_duration_us() / kUsPerSecond, UINT32_MAX)),
        .phase_total_ms = timer_->phase_total_us() / kUsPerMs,
        .remaining_ms = timer_->remaining_us() / kUsPerMs,
        .flip_count = flip_count_,
        .monotonic_us = clock_->now_us(),
    };
}

}  // namespace pomo
