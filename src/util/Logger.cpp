// Repository: MediaForge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; lines never interleave across threads.
// Copyright (c) 2026 MediaForge

#include "mediaforge/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace mediaforge::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::sinks_[Logger::kLevelCount];

namespace {

bool DebugEnabled() {
  static const bool enabled = std::getenv("MEDIAFORGE_DEBUG") != nullptr;
  return enabled;
}

}  // namespace

void Logger::SetSink(Level level, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[static_cast<int>(level)] = std::move(sink);
}

void Logger::Emit(Level level, const std::string& line) {
  std::ostream& out = (level == Level::kWarn || level == Level::kError) ? std::cerr : std::cout;
  std::lock_guard<std::mutex> lock(mutex_);
  const Sink& sink = sinks_[static_cast<int>(level)];
  if (sink) sink(line);
  out << line << '\n';
  out.flush();
}

void Logger::Info(const std::string& line) { Emit(Level::kInfo, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(Level::kDebug, line);
}

void Logger::Warn(const std::string& line) { Emit(Level::kWarn, line); }

void Logger::Error(const std::string& line) { Emit(Level::kError, line); }

void Logger::SetErrorSink(Sink sink) { SetSink(Level::kError, std::move(sink)); }

void Logger::SetWarnSink(Sink sink) { SetSink(Level::kWarn, std::move(sink)); }

void Logger::SetInfoSink(Sink sink) { SetSink(Level::kInfo, std::move(sink)); }

}  // namespace mediaforge::util
