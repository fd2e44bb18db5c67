// Repository: Ferry
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by sessions, fetch workers
//          and gRPC handlers.
// Copyright (c) 2025 Ferry

#ifndef FERRY_UTIL_LOGGER_HPP_
#define FERRY_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace ferry::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the tick thread, fetch workers and gRPC handlers
// never interleave.
//
// Info  -> stdout (normal operational logs)
// Debug -> stdout only when FERRY_DEBUG env is set (or SetDebugEnabled(true))
// Warn  -> stderr (degraded but recoverable conditions)
// Error -> stderr (fatal session outcomes, I/O faults)
//
// Test-only: SetErrorSink / SetInfoSink / SetWarnSink install a callback
// invoked for every line at that level (in addition to the stream).
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Overrides the FERRY_DEBUG environment check (ferryd --debug).
  static void SetDebugEnabled(bool enabled);

  // Test-only. Call with nullptr to clear.
  static void SetErrorSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetInfoSink(Sink sink);

 private:
  static std::mutex mutex_;
  static bool debug_forced_;
  static Sink error_sink_;
  static Sink warn_sink_;
  static Sink info_sink_;
};

}  // namespace ferry::util

#endif  // FERRY_UTIL_LOGGER_HPP_
