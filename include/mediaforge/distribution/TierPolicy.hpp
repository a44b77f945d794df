// Repository: MediaForge
// Component: Tier Policy
// Purpose: Static platform catalog and subscription-tier limits. A platform
//          is eligible when its required tier ranks at or below the
//          creator's tier, so every tier sees a superset of the tiers below.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_DISTRIBUTION_TIER_POLICY_HPP_
#define MEDIAFORGE_DISTRIBUTION_TIER_POLICY_HPP_

#include <optional>
#include <string>
#include <vector>

namespace mediaforge::distribution {

struct PlatformInfo {
  std::string id;
  std::string name;
  std::string base_url;
  std::string ingest_endpoint;  // host:port of the PlatformIngest service
  bool enabled = true;
  std::string required_tier;
};

struct TierInfo {
  std::string tier;
  int rank = 0;
  int max_platforms = 0;
  std::vector<PlatformInfo> available_platforms;
  std::vector<std::string> benefits;
};

class TierPolicy {
 public:
  // Built-in catalog of sixteen platforms.
  TierPolicy();
  // Custom catalog; every required_tier must be a known tier name.
  explicit TierPolicy(std::vector<PlatformInfo> platforms);

  // Tier names lowest rank first.
  static const std::vector<std::string>& TierNames();
  static bool IsKnownTier(const std::string& tier);

  // Throw PipelineError(kInvalidArgument) for an unknown tier.
  static int TierRank(const std::string& tier);
  static int MaxPlatforms(const std::string& tier);

  // Enabled platforms the tier may use, in catalog order.
  std::vector<PlatformInfo> GetAvailablePlatforms(const std::string& tier) const;

  // Requested ids that are eligible for `tier`, in the caller's order,
  // duplicates removed, truncated to the tier maximum.
  std::vector<std::string> ValidatePlatformSelection(const std::vector<std::string>& requested,
                                                     const std::string& tier) const;

  TierInfo GetTierInfo(const std::string& tier) const;

  std::optional<PlatformInfo> FindPlatform(const std::string& platform_id) const;
  const std::vector<PlatformInfo>& AllPlatforms() const { return platforms_; }

  // `base` (or `fallback` when empty) with `premium` prepended for tiers
  // ranked diamond and above, unless already present.
  static std::vector<std::string> PresetsForTier(const std::string& tier,
                                                 const std::vector<std::string>& base,
                                                 const std::vector<std::string>& fallback,
                                                 const std::string& premium);

 private:
  std::vector<PlatformInfo> platforms_;
};

}  // namespace mediaforge::distribution

#endif  // MEDIAFORGE_DISTRIBUTION_TIER_POLICY_HPP_
