// Repository: MediaForge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; lines never interleave across threads.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_UTIL_LOGGER_HPP_
#define MEDIAFORGE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace mediaforge::util {

// One static mutex serialises every line across chunk workers, transcode
// groups, delivery threads and gRPC handlers. Each line is written whole,
// terminated with '\n' and flushed.
//
// Info  -> stdout
// Debug -> stdout, only when MEDIAFORGE_DEBUG is set at startup
// Warn  -> stderr
// Error -> stderr (failed jobs, failed deliveries, failed pipelines)
//
// Tests install a sink per level to observe lines; nullptr clears it.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetErrorSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetInfoSink(Sink sink);

 private:
  enum class Level { kDebug, kInfo, kWarn, kError };
  static constexpr int kLevelCount = 4;

  static void SetSink(Level level, Sink sink);
  static void Emit(Level level, const std::string& line);

  static std::mutex mutex_;
  static Sink sinks_[kLevelCount];
};

}  // namespace mediaforge::util

#endif  // MEDIAFORGE_UTIL_LOGGER_HPP_
