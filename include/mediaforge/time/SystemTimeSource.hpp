// Repository: MediaForge
// Component: System Time Source
// Purpose: Production ITimeSource backed by the system clock.
// Copyright (c) 2026 MediaForge

#pragma once
#include "mediaforge/time/ITimeSource.hpp"
#include <chrono>

namespace mediaforge::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace mediaforge::time
