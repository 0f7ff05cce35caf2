#pragma once

#include "guard_events.hpp"

// Writes guard events to the debug log (core/log.hpp).
class LogObserver : public GuardObserver {
public:
    void on_event(const GuardEvent& event) override;
};
