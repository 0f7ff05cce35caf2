#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>

std::string format_iso(TimePoint tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

static const char B64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        unsigned val = data[i] << 16;
        if (i + 1 < len) val |= data[i + 1] << 8;
        if (i + 2 < len) val |= data[i + 2];
        out += B64_CHARS[(val >> 18) & 0x3F];
        out += B64_CHARS[(val >> 12) & 0x3F];
        out += (i + 1 < len) ? B64_CHARS[(val >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? B64_CHARS[val & 0x3F] : '=';
    }
    return out;
}

static int b64_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& input) {
    if (input.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve((input.size() / 4) * 3);
    for (size_t i = 0; i < input.size(); i += 4) {
        int pad = 0;
        unsigned val = 0;
        for (size_t j = 0; j < 4; j++) {
            char c = input[i + j];
            if (c == '=') {
                // Padding only in the last quad, only in the last two positions
                if (i + 4 != input.size() || j < 2) return std::nullopt;
                pad++;
                val <<= 6;
                continue;
            }
            if (pad > 0) return std::nullopt;
            int idx = b64_index(c);
            if (idx < 0) return std::nullopt;
            val = (val << 6) | static_cast<unsigned>(idx);
        }
        out.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<uint8_t>(val & 0xFF));
    }
    return out;
}

std::string hex_encode(const uint8_t* data, size_t len) {
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += HEX[data[i] >> 4];
        out += HEX[data[i] & 0x0F];
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::vector<uint8_t>> hex_decode(const std::string& input) {
    if (input.size() % 2 != 0) return std::nullopt;
    std::vector<uint8_t> out;
    out.reserve(input.size() / 2);
    for (size_t i = 0; i < input.size(); i += 2) {
        int hi = hex_value(input[i]);
        int lo = hex_value(input[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}
