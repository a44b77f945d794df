// Repository: MediaForge
// Component: Distribution Fan-out
// Purpose: Delivers one asset's variants to several platforms in parallel.
//          Each platform is its own failure domain: a failed delivery is
//          logged and recorded on that platform's target only.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_DISTRIBUTION_DISTRIBUTION_FANOUT_HPP_
#define MEDIAFORGE_DISTRIBUTION_DISTRIBUTION_FANOUT_HPP_

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mediaforge/config/PipelineConfig.hpp"
#include "mediaforge/core/Types.hpp"
#include "mediaforge/distribution/IPlatformDelivery.hpp"
#include "mediaforge/distribution/TierPolicy.hpp"
#include "mediaforge/storage/IPipelineRepository.hpp"
#include "mediaforge/time/ITimeSource.hpp"

namespace mediaforge::distribution {

struct DistributionReport {
  std::string asset_id;
  std::vector<DistributionTarget> targets;  // In the order requested
  int delivered = 0;
  int failed = 0;
};

class DistributionFanout {
 public:
  using TargetCallback = std::function<void(const DistributionTarget&)>;

  DistributionFanout(const config::PipelineConfig& config,
                     std::shared_ptr<storage::IPipelineRepository> repository,
                     std::shared_ptr<const TierPolicy> tiers,
                     std::shared_ptr<IPlatformDelivery> delivery,
                     std::shared_ptr<time::ITimeSource> time_source);

  // Invoked once per target when it reaches delivered or failed, on the
  // delivering thread. May be replaced while deliveries are running.
  void SetTargetCallback(TargetCallback callback);

  // Blocks until every platform has been attempted. Platform failures never
  // propagate; only an unknown asset throws PipelineError(kAssetNotFound).
  DistributionReport DistributeToPlatforms(const std::string& asset_id,
                                           const std::vector<std::string>& platform_ids);

  // Re-attempts only the platforms whose stored target is not yet
  // delivered or failed (crash recovery).
  DistributionReport ResumeDistribution(const std::string& asset_id,
                                        const std::vector<std::string>& platform_ids);

 private:
  void DeliverOne(const MediaAsset& asset, DistributionTarget& target);

  int delivery_attempts_;
  std::shared_ptr<storage::IPipelineRepository> repository_;
  std::shared_ptr<const TierPolicy> tiers_;
  std::shared_ptr<IPlatformDelivery> delivery_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::mutex callback_mutex_;
  TargetCallback on_target_;  // Guarded by callback_mutex_
};

}  // namespace mediaforge::distribution

#endif  // MEDIAFORGE_DISTRIBUTION_DISTRIBUTION_FANOUT_HPP_
