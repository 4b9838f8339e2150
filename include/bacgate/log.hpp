#pragma once
/**
 * @file log.hpp
 * @brief Levelled line logging for the gateway (iostreams, one record per line).
 *
 * @details
 * Every record is written to std::cerr as
 *
 *     2026-10-18T09:14:03.512 INFO  Discovered BACnet device 42 at 10.0.0.5:47808
 *
 * so logs can be grepped and piped the same way the CLI output is. Writes are
 * serialized by an internal mutex; the receive, poller, bridge and MQTT threads
 * all log through here.
 *
 * The threshold is process-wide. Records below it are discarded before the
 * message string is built when callers guard with log_enabled().
 */

#include <string>
#include <cstdint>

namespace bacgate {

enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

/// Set the process-wide threshold. Records below it are dropped.
void set_log_level(LogLevel level);

/// Current threshold.
LogLevel log_level();

/// True if a record at @p level would be written.
bool log_enabled(LogLevel level);

/**
 * @brief Parse "trace|debug|info|warn|error|off" (case-insensitive).
 * @return false if @p name is not a known level; @p out is untouched then.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

/// Short upper-case name used in the log line ("INFO", "WARN", ...).
const char* log_level_name(LogLevel level);

/// Write one record (no trailing newline needed).
void log(LogLevel level, const std::string& msg);

inline void log_trace(const std::string& msg) { log(LogLevel::Trace, msg); }
inline void log_debug(const std::string& msg) { log(LogLevel::Debug, msg); }
inline void log_info (const std::string& msg) { log(LogLevel::Info,  msg); }
inline void log_warn (const std::string& msg) { log(LogLevel::Warn,  msg); }
inline void log_error(const std::string& msg) { log(LogLevel::Error, msg); }

} // namespace bacgate
