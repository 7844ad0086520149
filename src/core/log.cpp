#include "log.hpp"
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_log_mutex;
std::string g_log_file;  // guarded by g_log_mutex

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::string timestamp() {
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
    return ts;
}

} // namespace

void configure_logging(const SidecarConfig& config) {
    if (config.verbose_logging) {
        set_log_level(LogLevel::Debug);
    } else if (config.errors_only_logging) {
        set_log_level(LogLevel::Error);
    } else {
        set_log_level(LogLevel::Info);
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = config.log_file;
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

void sidecar_log(LogLevel level, const std::string& msg) {
    if (level < g_level.load()) return;

    std::string line = fmt::format("[{}] {:<5} {}\n", timestamp(), level_name(level), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_log_file.empty()) {
        std::ofstream out(g_log_file, std::ios::app);
        if (out) {
            out << line;
            return;
        }
    }
    std::cerr << line;
}

void log_command(const std::string& label, const std::string& cmd, const CommandResult& r) {
    if (log_level() > LogLevel::Debug) return;
    log_debug(fmt::format("{} CMD: {}", label, cmd));
    log_debug(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                          r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        log_debug(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
