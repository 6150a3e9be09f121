#pragma once

#include <cstdint>

#include <lvgl.h>

namespace host_sim {

// Receives printable key presses (ASCII) from the SDL event pump.
using KeyHandler = void (*)(char key, void* ctx);

bool init(int width, int height);
void shutdown();

lv_disp_t* register_display(int width, int height);
lv_indev_t* register_pointer();

void pump_events(bool& should_quit, KeyHandler on_key = nullptr, void* key_ctx = nullptr);
void set_title(const char* title);
void delay(uint32_t ms);

}  // namespace host_sim
