// Repository: MediaForge
// Component: Time Source Interface
// Purpose: Injectable wall clock for session activity, throughput and staleness.
// Copyright (c) 2026 MediaForge

#pragma once
#include <cstdint>

namespace mediaforge::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace mediaforge::time
