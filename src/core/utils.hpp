#pragma once

#include <string>
#include <vector>
#include <optional>
#include <ctime>
#include <cstdint>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the given local time.
std::string format_iso(TimePoint tp);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Standard base64 with padding.
std::string base64_encode(const uint8_t* data, size_t len);
inline std::string base64_encode(const std::string& input) {
    return base64_encode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

// Returns nullopt on any character outside the alphabet or bad padding.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& input);

// Lowercase hex.
std::string hex_encode(const uint8_t* data, size_t len);
std::optional<std::vector<uint8_t>> hex_decode(const std::string& input);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
