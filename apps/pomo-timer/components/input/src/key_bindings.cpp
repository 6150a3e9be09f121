#include "input/key_bindings.h"

namespace pomo {

ControlCommand command_for_key(char key, const KeyBindingConfig& config) {
    if (config.case_insensitive && key >= 'A' && key <= 'Z') {
        key = static_cast<char>(key - 'A' + 'a');
    }

    switch (key) {
        case 'f':
            return ControlCommand::Flip;
        case 'i':
            return ControlCommand::IncreaseDuration;
        case 'd':
            return ControlCommand::DecreaseDuration;
        case 'n':
            return ControlCommand::Reset;
        case 'p':
            return ControlCommand::TogglePause;
        case ' ':
            return config.space_toggles_pause ? ControlCommand::TogglePause : ControlCommand::None;
        default:
            return ControlCommand::None;
    }
}

const char* key_legend(ControlCommand command) {
    switch (command) {
        case ControlCommand::Flip:
            return "f: flip the timer";
        case ControlCommand::IncreaseDuration:
            return "i: increase duration";
        case ControlCommand::DecreaseDuration:
            return "d: decrease duration";
        case ControlCommand::Reset:
            return "n: new timer";
        case ControlCommand::TogglePause:
            return "p: pause";
        default:
            return "";
    }
}

}  // namespace pomo
