#include "log_observer.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

void LogObserver::on_event(const GuardEvent& event) {
    std::string line = fmt::format("guard {}: {}", to_string(event.kind), event.message);
    if (event.code != 0) line += fmt::format(" (code {})", event.code);
    credguard_log(is_failure(event.kind) ? "error" : "info", line);
}
