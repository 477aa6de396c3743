#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>

static bool g_verbose = false;

std::string pipe_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_FILE).string();
    return path;
}

void set_verbose(bool verbose) { g_verbose = verbose; }
bool is_verbose() { return g_verbose; }

void pipe_log(const std::string& msg) {
    std::ofstream out(pipe_log_path(), std::ios::app);
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

void pipe_status(const std::string& msg) {
    pipe_log(msg);
    if (g_verbose) {
        std::cerr << "[" << PANEPIPE_NAME << "] " << msg << "\n";
    }
}

void pipe_dump(const std::string& label, const std::string& text) {
    if (!g_verbose) return;
    pipe_log(fmt::format("{} ({} bytes):\n{}", label, text.size(), text));
    std::cerr << "[" << PANEPIPE_NAME << "] " << label << ":\n"
              << text << "\n"
              << "[" << PANEPIPE_NAME << "] --- end " << label << " ---\n";
}
