#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>

static bool g_log_enabled = false;
static std::string g_log_path;

void set_log_enabled(bool enabled) { g_log_enabled = enabled; }

void set_log_path(const std::string& path) { g_log_path = path; }

std::string jpick_log_path() {
    if (!g_log_path.empty()) return g_log_path;
    return (platform::temp_dir() / DEBUG_LOG_FILE).string();
}

void jpick_log(const std::string& msg) {
    if (!g_log_enabled) return;

    std::ofstream out(jpick_log_path(), std::ios::app);
    if (!out) return;

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
    out << "[" << ts << "] " << msg << "\n";
}
