// Repository: MediaForge
// Component: Stale upload sweeper implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/upload/StaleSessionSweeper.hpp"

#include <chrono>
#include <exception>
#include <string>

#include "mediaforge/util/Logger.hpp"

namespace mediaforge::upload {

StaleSessionSweeper::StaleSessionSweeper(UploadSessionManager& manager, int64_t interval_ms)
    : manager_(manager), interval_ms_(interval_ms) {}

StaleSessionSweeper::~StaleSessionSweeper() {
  Stop();
}

void StaleSessionSweeper::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) return;
  stop_requested_ = false;
  thread_ = std::thread(&StaleSessionSweeper::Run, this);
}

void StaleSessionSweeper::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

int64_t StaleSessionSweeper::SweepCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sweeps_;
}

void StaleSessionSweeper::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                 [this] { return stop_requested_; });
    if (stop_requested_) break;
    lock.unlock();
    try {
      manager_.CleanupStaleSessions();
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[StaleSessionSweeper] sweep failed: ") + e.what());
    }
    if (on_tick_) {
      try {
        on_tick_();
      } catch (const std::exception& e) {
        util::Logger::Error(std::string("[StaleSessionSweeper] tick callback failed: ") +
                            e.what());
      }
    }
    lock.lock();
    ++sweeps_;
  }
}

}  // namespace mediaforge::upload
