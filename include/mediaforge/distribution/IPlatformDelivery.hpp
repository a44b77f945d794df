// Repository: MediaForge
// Component: Platform delivery interface
// Purpose: Pushes one asset's variant set to one destination platform.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_DISTRIBUTION_I_PLATFORM_DELIVERY_HPP_
#define MEDIAFORGE_DISTRIBUTION_I_PLATFORM_DELIVERY_HPP_

#include <string>

#include "mediaforge/core/Types.hpp"
#include "mediaforge/distribution/TierPolicy.hpp"

namespace mediaforge::distribution {

class IPlatformDelivery {
 public:
  virtual ~IPlatformDelivery() = default;

  // Returns the platform's id for the imported media. Throws
  // PipelineError(kPlatformDeliveryFailure) when the platform refuses or
  // cannot be reached. Called concurrently for different platforms.
  virtual std::string Deliver(const PlatformInfo& platform, const MediaAsset& asset) = 0;
};

}  // namespace mediaforge::distribution

#endif  // MEDIAFORGE_DISTRIBUTION_I_PLATFORM_DELIVERY_HPP_
