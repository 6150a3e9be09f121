#pragma once

namespace pomo {

// Notified whenever the timer flips between work and rest.
class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual void alert() = 0;
};

}  // namespace pomo
