#pragma once

#include <cstdint>

#include <lvgl.h>

#include "support/err.h"
#include "timer/timer_types.h"

namespace pomo {

struct UiConfig {
    uint16_t screen_width = 320;
    uint16_t screen_height = 320;
    uint32_t flash_duration_ms = 1200;
};

using CommandHandler = void (*)(ControlCommand command, void* ctx);

class UiRoot {
public:
    pomo_err_t init(const UiConfig& config, CommandHandler handler = nullptr, void* handler_ctx = nullptr);
    void update(const TimerSnapshot& snapshot);

    // Highlights the screen for flash_duration_ms from the next update.
    void flash();

private:
    static void button_event_cb(lv_event_t* event);

    void create_layout();
    void create_controls();
    lv_obj_t* create_button(lv_obj_t* parent, const char* text, ControlCommand command);
    void update_readout(const TimerSnapshot& snapshot);
    void update_progress(const TimerSnapshot& snapshot);
    void update_controls(const TimerSnapshot& snapshot);
    void update_flash(const TimerSnapshot& snapshot);

    UiConfig config_{};
    CommandHandler handler_ = nullptr;
    void* handler_ctx_ = nullptr;

    lv_obj_t* root_ = nullptr;
    lv_obj_t* label_time_ = nullptr;
    lv_obj_t* label_phase_ = nullptr;
    lv_obj_t* arc_progress_ = nullptr;
    lv_obj_t* controls_inactive_ = nullptr;
    lv_obj_t* controls_running_ = nullptr;
    lv_obj_t* controls_paused_ = nullptr;
    lv_obj_t* label_help_ = nullptr;

    bool flash_pending_ = false;
    uint64_t flash_until_us_ = 0;
    TimerPhase shown_phase_ = TimerPhase::Inactive;
    bool controls_initialised_ = false;
};

extern UiRoot g_ui_root;

}  // namespace pomo
