#pragma once

#include <string_view>

namespace shipcalc::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// When disabled, stderr lines omit the "[HH:MM:SS.mmm]" prefix (sinks still receive
// an empty timestamp view). Enabled by default.
void setLogTimestamps(bool enabled);
bool getLogTimestamps();

// Parse "trace", "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
bool tryParseLogLevel(std::string_view text, LogLevel& out);

// Optional callback sink for log messages.
//
// Sinks are invoked after the message has been written to stderr.
// The timestamp and message views are only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

// Register/unregister a sink.
//
// Notes:
//  - Sinks obey the current log level filter.
//  - addLogSink() is idempotent only if you avoid registering duplicates.
void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Writes to stderr with a timestamp, then forwards to registered sinks.
void log(LogLevel level, std::string_view message);

} // namespace shipcalc::core

#define SHIPCALC_LOG_TRACE(msg) ::shipcalc::core::log(::shipcalc::core::LogLevel::Trace, (msg))
#define SHIPCALC_LOG_DEBUG(msg) ::shipcalc::core::log(::shipcalc::core::LogLevel::Debug, (msg))
#define SHIPCALC_LOG_INFO(msg)  ::shipcalc::core::log(::shipcalc::core::LogLevel::Info,  (msg))
#define SHIPCALC_LOG_WARN(msg)  ::shipcalc::core::log(::shipcalc::core::LogLevel::Warn,  (msg))
#define SHIPCALC_LOG_ERROR(msg) ::shipcalc::core::log(::shipcalc::core::LogLevel::Error, (msg))
