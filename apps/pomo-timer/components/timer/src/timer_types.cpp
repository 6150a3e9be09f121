#include "timer/timer_types.h"

namespace pomo {

const char* phase_name(TimerPhase phase) {
    switch (phase) {
        case TimerPhase::Inactive:
            return "Inactive";
        case TimerPhase::Working:
            return "Working";
        case TimerPhase::Resting:
            return "Resting";
        case TimerPhase::Paused:
            return "Paused";
    }
    return "Unknown";
}

const char* command_name(ControlCommand command) {
    switch (command) {
        case ControlCommand::None:
            return "None";
        case ControlCommand::Start:
            return "Start";
        case ControlCommand::Stop:
            return "Stop";
        case ControlCommand::Resume:
            return "Resume";
        case ControlCommand::TogglePause:
            return "TogglePause";
        case ControlCommand::Reset:
            return "Reset";
        case ControlCommand::Flip:
            return "Flip";
        case ControlCommand::IncreaseDuration:
            return "IncreaseDuration";
        case ControlCommand::DecreaseDuration:
            return "DecreaseDuration";
    }
    return "Unknown";
}

}  // namespace pomo
