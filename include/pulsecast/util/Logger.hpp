// Repository: Pulsecast
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission so concurrent threads never interleave.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_UTIL_LOGGER_HPP_
#define PULSECAST_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace pulsecast::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Callers are the player worker, the command dispatcher, the
// accept/reader threads of the stream transport, the cooperative loop and
// gRPC handlers.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when PULSECAST_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable: malformed commands, evictions)
// Error → stderr (load failures, persistence failures)
//
// Test-only: SetWarnSink / SetErrorSink install a callback invoked for every
// Warn() / Error() line in addition to stderr.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only. Call with nullptr to clear.
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

  static bool DebugEnabled();

 private:
  static std::mutex mutex_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace pulsecast::util

#endif  // PULSECAST_UTIL_LOGGER_HPP_
