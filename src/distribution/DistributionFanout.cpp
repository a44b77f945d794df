// Repository: MediaForge
// Component: Distribution Fan-out implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/distribution/DistributionFanout.hpp"

#include <algorithm>
#include <map>
#include <thread>
#include <utility>

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/util/Logger.hpp"

namespace mediaforge::distribution {

DistributionFanout::DistributionFanout(const config::PipelineConfig& config,
                                       std::shared_ptr<storage::IPipelineRepository> repository,
                                       std::shared_ptr<const TierPolicy> tiers,
                                       std::shared_ptr<IPlatformDelivery> delivery,
                                       std::shared_ptr<time::ITimeSource> time_source)
    : delivery_attempts_(std::max(1, config.delivery_attempts)),
      repository_(std::move(repository)),
      tiers_(std::move(tiers)),
      delivery_(std::move(delivery)),
      time_source_(std::move(time_source)) {}

void DistributionFanout::SetTargetCallback(TargetCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_target_ = std::move(callback);
}

DistributionReport DistributionFanout::DistributeToPlatforms(
    const std::string& asset_id, const std::vector<std::string>& platform_ids) {
  auto asset = repository_->GetAsset(asset_id);
  if (!asset) {
    throw PipelineError(ErrorCode::kAssetNotFound, "asset not found: " + asset_id);
  }

  util::Logger::Info("[DistributionFanout] Distributing " + asset_id + " to " +
                     std::to_string(platform_ids.size()) + " platform(s)");

  DistributionReport report;
  report.asset_id = asset_id;
  report.targets.reserve(platform_ids.size());
  for (const auto& id : platform_ids) {
    DistributionTarget target;
    target.asset_id = asset_id;
    target.platform_id = id;
    target.status = DeliveryStatus::kPending;
    target.updated_at_ms = time_source_->NowUtcMs();
    repository_->PutTarget(target);
    report.targets.push_back(std::move(target));
  }

  // Each worker owns exactly one slot of report.targets.
  std::vector<std::thread> workers;
  workers.reserve(report.targets.size());
  for (auto& target : report.targets) {
    workers.emplace_back([this, &asset, &target] { DeliverOne(*asset, target); });
  }
  for (auto& t : workers) t.join();

  for (const auto& target : report.targets) {
    if (target.status == DeliveryStatus::kDelivered) {
      ++report.delivered;
    } else {
      ++report.failed;
    }
  }
  util::Logger::Info("[DistributionFanout] " + asset_id + ": " +
                     std::to_string(report.delivered) + " delivered, " +
                     std::to_string(report.failed) + " failed");
  return report;
}

DistributionReport DistributionFanout::ResumeDistribution(
    const std::string& asset_id, const std::vector<std::string>& platform_ids) {
  std::map<std::string, DeliveryStatus> stored;
  for (const auto& target : repository_->ListTargets(asset_id)) {
    stored[target.platform_id] = target.status;
  }
  std::vector<std::string> remaining;
  for (const auto& id : platform_ids) {
    auto it = stored.find(id);
    if (it == stored.end() || it->second == DeliveryStatus::kPending) remaining.push_back(id);
  }
  return DistributeToPlatforms(asset_id, remaining);
}

void DistributionFanout::DeliverOne(const MediaAsset& asset, DistributionTarget& target) {
  auto platform = tiers_->FindPlatform(target.platform_id);
  if (!platform) {
    util::Logger::Warn("[DistributionFanout] Platform not found: " + target.platform_id);
    target.status = DeliveryStatus::kFailed;
    target.error_message = "unknown platform";
  } else {
    while (target.attempts < delivery_attempts_) {
      ++target.attempts;
      try {
        target.remote_id = delivery_->Deliver(*platform, asset);
        target.status = DeliveryStatus::kDelivered;
        target.error_message.clear();
        util::Logger::Info("[DistributionFanout] Distributed " + asset.asset_id + " to " +
                           platform->name);
        break;
      } catch (const std::exception& e) {
        target.status = DeliveryStatus::kFailed;
        target.error_message = e.what();
        util::Logger::Error("[DistributionFanout] Failed to distribute " + asset.asset_id +
                            " to " + platform->name + " (attempt " +
                            std::to_string(target.attempts) + "): " + e.what());
      }
    }
  }
  target.updated_at_ms = time_source_->NowUtcMs();
  repository_->PutTarget(target);
  TargetCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = on_target_;
  }
  if (callback) callback(target);
}

}  // namespace mediaforge::distribution
