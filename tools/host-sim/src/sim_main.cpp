#include <SDL.h>
#include <lvgl.h>

#include <cstdio>
#include <cstdlib>
#include <string>

#include "input/key_bindings.h"
#include "sdl_driver.h"
#include "support/err.h"
#include "support/log.h"
#include "timer/alert_sink.h"
#include "timer/monotonic_clock.h"
#include "timer/time_format.h"
#include "timer/timer_engine.h"
#include "ui/ui_root.h"

namespace {

constexpr const char* TAG = "HostSim";
constexpr int kScreenSize = 320;
constexpr uint32_t kFrameIntervalMs = 16;  // ~60 FPS
constexpr uint32_t kMaxWorkMinutes = 24 * 60;

// Flashes the UI and rings the terminal bell on every phase flip.
class HostAlert : public pomo::AlertSink {
public:
    void alert() override {
        pomo::g_ui_root.flash();
        std::fputs("\a", stderr);
        std::fflush(stderr);
    }
};

struct HostContext {
    pomo::TimerEngine* engine = nullptr;
    pomo::KeyBindingConfig bindings{};
};

uint32_t work_minutes_from_env(uint32_t fallback) {
    const char* raw = std::getenv("POMO_WORK_MINUTES");
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    char* end = nullptr;
    const unsigned long value = std::strtoul(raw, &end, 10);
    if (end == raw || *end != '\0' || value == 0 || value > kMaxWorkMinutes) {
        POMO_LOGW(TAG, "Ignoring POMO_WORK_MINUTES=%s", raw);
        return fallback;
    }
    return static_cast<uint32_t>(value);
}

void on_key(char key, void* ctx) {
    auto* host = static_cast<HostContext*>(ctx);
    const pomo::ControlCommand command = pomo::command_for_key(key, host->bindings);
    if (command != pomo::ControlCommand::None) {
        host->engine->enqueue_control(command);
    }
}

void on_ui_command(pomo::ControlCommand command, void* ctx) {
    static_cast<pomo::TimerEngine*>(ctx)->enqueue_control(command);
}

void update_title(const pomo::TimerSnapshot& snapshot, std::string& last_title) {
    const std::string title = pomo::format_title(snapshot);
    if (title != last_title) {
        host_sim::set_title(title.c_str());
        last_title = title;
    }
}

// Brings up the display, the timer engine and the UI, in that order.
pomo::pomo_err_t init_host(pomo::TimerEngine& engine, const pomo::MonotonicClock& clock, pomo::AlertSink& alert) {
    if (!host_sim::init(kScreenSize, kScreenSize)) {
        return pomo::POMO_FAIL;
    }

    lv_init();
    if (host_sim::register_display(kScreenSize, kScreenSize) == nullptr) {
        POMO_LOGE(TAG, "Failed to register LVGL display");
        return pomo::POMO_FAIL;
    }
    host_sim::register_pointer();

    pomo::TimerEngineConfig engine_cfg{};
    engine_cfg.work_seconds = work_minutes_from_env(engine_cfg.work_seconds / 60) * 60;
    POMO_RETURN_ON_ERROR(engine.init(engine_cfg, clock, &alert), TAG, "Failed to initialise timer engine");

    const pomo::UiConfig ui_cfg{
        .screen_width = static_cast<uint16_t>(kScreenSize),
        .screen_height = static_cast<uint16_t>(kScreenSize),
    };
    POMO_RETURN_ON_ERROR(pomo::g_ui_root.init(ui_cfg, &on_ui_command, &engine), TAG, "Failed to initialise UI root");
    return pomo::POMO_OK;
}

}  // namespace

int main() {
    pomo::log_set_level(pomo::log_level_from_string(std::getenv("POMO_LOG_LEVEL"), pomo::LogLevel::Info));

    pomo::SteadyClock clock;
    HostAlert alert;
    pomo::TimerEngine engine;

    if (init_host(engine, clock, alert) != pomo::POMO_OK) {
        host_sim::shutdown();
        return EXIT_FAILURE;
    }

    HostContext host{.engine = &engine};
    std::string title;
    uint32_t last_tick_ms = SDL_GetTicks();
    bool quit = false;

    while (!quit) {
        host_sim::pump_events(quit, &on_key, &host);

        const pomo::TimerSnapshot snapshot = engine.poll();
        pomo::g_ui_root.update(snapshot);
        update_title(snapshot, title);

        const uint32_t now_ms = SDL_GetTicks();
        lv_tick_inc(now_ms - last_tick_ms);
        last_tick_ms = now_ms;
        lv_timer_handler();

        host_sim::delay(kFrameIntervalMs);
    }

    POMO_LOGI(TAG, "Shutting down");
    host_sim::shutdown();
    return EXIT_SUCCESS;
}
