// =============================================================================
// c64view - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: CVLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>

#include <sys/syscall.h>
#include <unistd.h>

namespace c64view::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Accepts "trace".."fatal" (case-sensitive, lower case). Unknown names keep `def`.
inline Level parseLevel(const std::string& name, Level def = Level::Info) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info")  return Level::Info;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return def;
}

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(std::memory_order_relaxed); }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline void write(Level level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    long tid = static_cast<long>(::syscall(SYS_gettid));
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s [%s] [%s] (T%ld) %s\n", time_str, levelStr(level), tag, tid, msg);
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%ld) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace c64view::log

#define CVLOG_TRACE(tag, fmt, ...) c64view::log::write(c64view::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define CVLOG_DEBUG(tag, fmt, ...) c64view::log::write(c64view::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define CVLOG_INFO(tag, fmt, ...)  c64view::log::write(c64view::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define CVLOG_WARN(tag, fmt, ...)  c64view::log::write(c64view::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define CVLOG_ERROR(tag, fmt, ...) c64view::log::write(c64view::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define CVLOG_FATAL(tag, fmt, ...) c64view::log::write(c64view::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
