#pragma once

#include "timer/timer_types.h"

namespace pomo {

struct KeyBindingConfig {
    bool space_toggles_pause = true;
    bool case_insensitive = true;
};

// Keyboard layout:
//   f      flip between work and rest
//   i / d  increase / decrease the work duration
//   n      new timer (reset)
//   p      pause / resume (space as well, unless disabled)
ControlCommand command_for_key(char key, const KeyBindingConfig& config = {});

// One-line legend for help text, e.g. "f: flip".
const char* key_legend(ControlCommand command);

}  // namespace pomo
