// Repository: MediaForge
// Component: Stale upload sweeper
// Purpose: Background thread that periodically reaps abandoned uploads.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_UPLOAD_STALE_SESSION_SWEEPER_HPP_
#define MEDIAFORGE_UPLOAD_STALE_SESSION_SWEEPER_HPP_

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

#include "mediaforge/upload/UploadSessionManager.hpp"

namespace mediaforge::upload {

// Each tick runs CleanupStaleSessions and then the optional tick callback,
// which the server uses to evict finished pipelines on the same cadence.
class StaleSessionSweeper {
 public:
  using TickCallback = std::function<void()>;

  StaleSessionSweeper(UploadSessionManager& manager, int64_t interval_ms);
  ~StaleSessionSweeper();

  StaleSessionSweeper(const StaleSessionSweeper&) = delete;
  StaleSessionSweeper& operator=(const StaleSessionSweeper&) = delete;

  // Set before Start().
  void SetTickCallback(TickCallback callback) { on_tick_ = std::move(callback); }

  void Start();
  // Idempotent. Wakes the thread and joins it.
  void Stop();

  int64_t SweepCount() const;

 private:
  void Run();

  UploadSessionManager& manager_;
  int64_t interval_ms_;
  TickCallback on_tick_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  int64_t sweeps_ = 0;
  std::thread thread_;
};

}  // namespace mediaforge::upload

#endif  // MEDIAFORGE_UPLOAD_STALE_SESSION_SWEEPER_HPP_
