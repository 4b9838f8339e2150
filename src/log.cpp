// ============================================================================
// log.cpp — implementation for bacgate/log.hpp
// ============================================================================

#include "bacgate/log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>       // std::tolower for level names
#include <ctime>        // localtime_r, strftime
#include <iostream>     // std::cerr is the only sink
#include <mutex>
#include <cstdio>       // snprintf for the millisecond suffix

namespace bacgate {

static std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};
static std::mutex g_write_mu;   // one record at a time on stderr

void set_log_level(LogLevel level) {
    g_level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) {
    if (level == LogLevel::Off) return false;
    return static_cast<uint8_t>(level) >= g_level.load(std::memory_order_relaxed);
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string s;
    s.reserve(name.size());
    for (char c : name) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if      (s == "trace") out = LogLevel::Trace;
    else if (s == "debug") out = LogLevel::Debug;
    else if (s == "info")  out = LogLevel::Info;
    else if (s == "warn" || s == "warning") out = LogLevel::Warn;
    else if (s == "error") out = LogLevel::Error;
    else if (s == "off")   out = LogLevel::Off;
    else return false;
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   break;
    }
    return "     ";
}

// Local wall-clock time with milliseconds: 2026-10-18T09:14:03.512
static std::string timestamp_now() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&secs, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(ms));
    return out;
}

void log(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;
    const std::string ts = timestamp_now();   // format outside the lock

    std::lock_guard<std::mutex> lock(g_write_mu);
    std::cerr << ts << ' ' << log_level_name(level) << ' ' << msg << '\n';
}

} // namespace bacgate
