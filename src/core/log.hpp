#pragma once

#include <string>

// Debug log: <tmp>/credguard_debug.log unless redirected via set_log_path().
std::string credguard_log_path();

// Redirect the debug log. Empty path restores the default.
void set_log_path(const std::string& path);

// Append a timestamped line to the debug log. Never throws.
void credguard_log(const std::string& msg);

// Same, with a level tag ("info", "warn", "error").
void credguard_log(const std::string& level, const std::string& msg);
