#pragma once

#include <string_view>

namespace parkwise::core {

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

// Parse "trace|debug|info|warn|error|off" (case-insensitive).
bool parseLogLevel(std::string_view text, LogLevel& out);

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
//  - This is a minimal facility intended for tooling/UI integration.
//  - Sinks obey the current log level filter.
//  - addLogSink() is idempotent only if you avoid registering duplicates.
void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Thread-safe enough for a starter: writes to stderr with a timestamp.
void log(LogLevel level, std::string_view message);

} // namespace parkwise::core

#define PARKWISE_LOG_TRACE(msg) ::parkwise::core::log(::parkwise::core::LogLevel::Trace, (msg))
#define PARKWISE_LOG_DEBUG(msg) ::parkwise::core::log(::parkwise::core::LogLevel::Debug, (msg))
#define PARKWISE_LOG_INFO(msg)  ::parkwise::core::log(::parkwise::core::LogLevel::Info,  (msg))
#define PARKWISE_LOG_WARN(msg)  ::parkwise::core::log(::parkwise::core::LogLevel::Warn,  (msg))
#define PARKWISE_LOG_ERROR(msg) ::parkwise::core::log(::parkwise::core::LogLevel::Error, (msg))
