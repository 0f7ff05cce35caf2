#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

static std::mutex g_log_mutex;
static std::string g_log_path;

std::string credguard_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_log_path.empty()) return g_log_path;
    return (platform::temp_dir() / "credguard_debug.log").string();
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

void credguard_log(const std::string& msg) {
    std::string path = credguard_log_path();

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

void credguard_log(const std::string& level, const std::string& msg) {
    credguard_log(fmt::format("{:<5} {}", level, msg));
}
