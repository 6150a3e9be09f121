#include "ui/ui_root.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>

#include "input/key_bindings.h"
#include "support/log.h"
#include "timer/time_format.h"

namespace pomo {

namespace {
constexpr const char* TAG = "UiRoot";

constexpr uint32_t kWorkColor = 0x9B59B6;    // purple
constexpr uint32_t kRestColor = 0x2ECC71;    // green
constexpr uint32_t kWarnColor = 0xF1C40F;    // yellow
constexpr uint32_t kUrgentColor = 0xE74C3C;  // red
constexpr uint32_t kBackground = 0x1E1E2E;
constexpr uint32_t kFlashBackground = 0xF5E6FF;

// Work colour for Inactive/Working, rest colour for Resting/Paused.
lv_color_t phase_color(TimerPhase phase) {
    switch (phase) {
        case TimerPhase::Resting:
        case TimerPhase::Paused:
            return lv_color_hex(kRestColor);
        case TimerPhase::Inactive:
        case TimerPhase::Working:
        default:
            return lv_color_hex(kWorkColor);
    }
}

lv_color_t determine_color(const TimerSnapshot& snapshot) {
    if (snapshot.phase != TimerPhase::Working && snapshot.phase != TimerPhase::Resting) {
        return phase_color(snapshot.phase);
    }
    if (snapshot.phase_total_ms == 0) {
        return lv_color_hex(kUrgentColor);
    }

    const uint64_t remaining_s = snapshot.remaining_ms / 1000;
    float fraction = static_cast<float>(snapshot.remaining_ms) / static_cast<float>(snapshot.phase_total_ms);
    if (remaining_s <= 10) {
        fraction = std::min(fraction, 0.01f);
    } else if (remaining_s <= 60) {
        fraction = std::min(fraction, 0.05f);
    }

    if (fraction <= 0.05f) {
        return lv_color_hex(kUrgentColor);
    }
    if (fraction <= 0.10f) {
        return lv_color_hex(kWarnColor);
    }
    return phase_color(snapshot.phase);
}

const char* phase_caption(const TimerSnapshot& snapshot) {
    switch (snapshot.phase) {
        case TimerPhase::Working:
            return "Work";
        case TimerPhase::Resting:
            return "Rest";
        case TimerPhase::Paused:
            return snapshot.paused_phase == TimerPhase::Resting ? "Rest (paused)" : "Work (paused)";
        case TimerPhase::Inactive:
        default:
            return "Ready";
    }
}

}  // namespace

UiRoot g_ui_root;

pomo_err_t UiRoot::init(const UiConfig& config, CommandHandler handler, void* handler_ctx) {
    config_ = config;
    handler_ = handler;
    handler_ctx_ = handler_ctx;

    root_ = lv_obj_create(lv_scr_act());
    if (root_ == nullptr) {
        POMO_LOGE(TAG, "Failed to create root object");
        return POMO_FAIL;
    }
    lv_obj_set_size(root_, config_.screen_width, config_.screen_height);
    lv_obj_center(root_);
    lv_obj_clear_flag(root_, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_set_style_bg_color(root_, lv_color_hex(kBackground), 0);
    lv_obj_set_style_border_width(root_, 0, 0);

    create_layout();
    create_controls();
    return POMO_OK;
}

void UiRoot::create_layout() {
    arc_progress_ = lv_arc_create(root_);
    lv_obj_set_size(arc_progress_, config_.screen_width - 20, config_.screen_height - 20);
    lv_obj_center(arc_progress_);
    lv_arc_set_bg_angles(arc_progress_, 0, 360);
    lv_arc_set_rotation(arc_progress_, 270);
    lv_arc_set_mode(arc_progress_, LV_ARC_MODE_NORMAL);
    lv_arc_set_range(arc_progress_, 0, 360);
    lv_obj_remove_style(arc_progress_, nullptr, LV_PART_KNOB);
    lv_obj_clear_flag(arc_progress_, LV_OBJ_FLAG_CLICKABLE);
    lv_obj_set_style_arc_width(arc_progress_, 12, LV_PART_MAIN);
    lv_obj_set_style_arc_width(arc_progress_, 12, LV_PART_INDICATOR);

    label_phase_ = lv_label_create(root_);
    lv_label_set_text(label_phase_, "Ready");
    lv_obj_set_style_text_color(label_phase_, lv_color_white(), 0);
    lv_obj_align(label_phase_, LV_ALIGN_CENTER, 0, -50);

    label_time_ = lv_label_create(root_);
    lv_label_set_text(label_time_, "25:00");
    lv_obj_set_style_text_align(label_time_, LV_TEXT_ALIGN_CENTER, 0);
    lv_obj_align(label_time_, LV_ALIGN_CENTER, 0, -20);

    label_help_ = lv_label_create(root_);
    char help[160];
    std::snprintf(help, sizeof(help), "%s\n%s\n%s\n%s\n%s",
                  key_legend(ControlCommand::Flip),
                  key_legend(ControlCommand::IncreaseDuration),
                  key_legend(ControlCommand::Reset),
                  key_legend(ControlCommand::DecreaseDuration),
                  key_legend(ControlCommand::TogglePause));
    lv_label_set_text(label_help_, help);
    lv_obj_set_style_text_color(label_help_, lv_color_hex(0xA0A0B0), 0);
    lv_obj_align(label_help_, LV_ALIGN_CENTER, 0, 75);
}

void UiRoot::create_controls() {
    const auto make_row = [this]() {
        lv_obj_t* row = lv_obj_create(root_);
        lv_obj_remove_style_all(row);
        lv_obj_set_size(row, LV_SIZE_CONTENT, LV_SIZE_CONTENT);
        lv_obj_set_flex_flow(row, LV_FLEX_FLOW_ROW);
        lv_obj_set_flex_align(row, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER);
        lv_obj_set_style_pad_column(row, 6, 0);
        lv_obj_align(row, LV_ALIGN_CENTER, 0, 20);
        return row;
    };

    controls_inactive_ = make_row();
    create_button(controls_inactive_, "-", ControlCommand::DecreaseDuration);
    create_button(controls_inactive_, "Start", ControlCommand::Start);
    create_button(controls_inactive_, "+", ControlCommand::IncreaseDuration);

    controls_running_ = make_row();
    create_button(controls_running_, "Pause", ControlCommand::Stop);

    controls_paused_ = make_row();
    create_button(controls_paused_, "Resume", ControlCommand::Resume);

    lv_obj_add_flag(controls_running_, LV_OBJ_FLAG_HIDDEN);
    lv_obj_add_flag(controls_paused_, LV_OBJ_FLAG_HIDDEN);
}

lv_obj_t* UiRoot::create_button(lv_obj_t* parent, const char* text, ControlCommand command) {
    lv_obj_t* button = lv_btn_create(parent);
    lv_obj_set_user_data(button, reinterpret_cast<void*>(static_cast<uintptr_t>(command)));
    lv_obj_add_event_cb(button, &UiRoot::button_event_cb, LV_EVENT_CLICKED, this);

    lv_obj_t* label = lv_label_create(button);
    lv_label_set_text(label, text);
    lv_obj_center(label);
    return button;
}

void UiRoot::button_event_cb(lv_event_t* event) {
    auto* self = static_cast<UiRoot*>(lv_event_get_user_data(event));
    lv_obj_t* target = lv_event_get_target(event);
    if (self == nullptr || target == nullptr) {
        return;
    }

    const auto command = static_cast<ControlCommand>(reinterpret_cast<uintptr_t>(lv_obj_get_user_data(target)));
    POMO_LOGD(TAG, "Button pressed: %s", command_name(command));
    if (self->handler_ != nullptr) {
        self->handler_(command, self->handler_ctx_);
    }
}

void UiRoot::flash() {
    flash_pending_ = true;
}

void UiRoot::update(const TimerSnapshot& snapshot) {
    update_readout(snapshot);
    update_progress(snapshot);
    update_controls(snapshot);
    update_flash(snapshot);
}

void UiRoot::update_readout(const TimerSnapshot& snapshot) {
    if (label_time_ == nullptr) {
        return;
    }

    char buffer[24];
    format_remaining(snapshot.remaining_ms * 1000, buffer, sizeof(buffer));
    lv_label_set_text(label_time_, buffer);
    lv_obj_set_style_text_color(label_time_, determine_color(snapshot), 0);

    if (label_phase_ != nullptr) {
        lv_label_set_text(label_phase_, phase_caption(snapshot));
    }
}

void UiRoot::update_progress(const TimerSnapshot& snapshot) {
    if (arc_progress_ == nullptr) {
        return;
    }

    const uint64_t total = snapshot.phase_total_ms == 0 ? 1 : snapshot.phase_total_ms;
    const uint64_t remaining = std::min(snapshot.remaining_ms, total);
    const int16_t sweep = static_cast<int16_t>((360 * remaining) / total);

    lv_arc_set_value(arc_progress_, sweep);
    lv_obj_set_style_arc_color(arc_progress_, determine_color(snapshot), LV_PART_INDICATOR);
}

void UiRoot::update_controls(const TimerSnapshot& snapshot) {
    if (controls_initialised_ && snapshot.phase == shown_phase_) {
        return;
    }
    shown_phase_ = snapshot.phase;
    controls_initialised_ = true;

    const auto show = [](lv_obj_t* obj, bool visible) {
        if (obj == nullptr) {
            return;
        }
        if (visible) {
            lv_obj_clear_flag(obj, LV_OBJ_FLAG_HIDDEN);
        } else {
            lv_obj_add_flag(obj, LV_OBJ_FLAG_HIDDEN);
        }
    };

    const bool running = snapshot.phase == TimerPhase::Working || snapshot.phase == TimerPhase::Resting;
    show(controls_inactive_, snapshot.phase == TimerPhase::Inactive);
    show(controls_running_, running);
    show(controls_paused_, snapshot.phase == TimerPhase::Paused);
    show(label_help_, snapshot.phase == TimerPhase::Inactive);
    POMO_LOGD(TAG, "Controls for %s", phase_name(snapshot.phase));
}

void UiRoot::update_flash(const TimerSnapshot& snapshot) {
    if (root_ == nullptr) {
        return;
    }

    if (flash_pending_) {
        flash_pending_ = false;
        flash_until_us_ = snapshot.monotonic_us + static_cast<uint64_t>(config_.flash_duration_ms) * 1000;
    }

    const bool flashing = snapshot.monotonic_us < flash_until_us_;
    lv_obj_set_style_bg_color(root_, lv_color_hex(flashing ? kFlashBackground : kBackground), 0);
}

}  // namespace pomo
