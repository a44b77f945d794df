// Repository: MediaForge
// Component: Tier Policy implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/distribution/TierPolicy.hpp"

#include <algorithm>
#include <set>

#include "mediaforge/core/Errors.hpp"

namespace mediaforge::distribution {

namespace {

struct TierLimits {
  const char* name;
  int rank;
  int max_platforms;
};

constexpr TierLimits kTiers[] = {
    {"silver", 1, 1},  {"gold", 2, 3},  {"platinum", 3, 5},
    {"diamond", 4, 8}, {"elite", 5, 12}, {"royalty", 6, 16},
};

constexpr int kPremiumPresetRank = 4;  // diamond

const TierLimits* FindTier(const std::string& tier) {
  for (const auto& t : kTiers) {
    if (tier == t.name) return &t;
  }
  return nullptr;
}

const TierLimits& RequireTier(const std::string& tier) {
  const TierLimits* t = FindTier(tier);
  if (t == nullptr) {
    throw PipelineError(ErrorCode::kInvalidArgument, "unknown tier: '" + tier + "'");
  }
  return *t;
}

PlatformInfo MakePlatform(const char* id, const char* name, const char* host, const char* tier) {
  PlatformInfo p;
  p.id = id;
  p.name = name;
  p.base_url = std::string("https://") + host;
  p.ingest_endpoint = std::string("ingest.") + host + ":443";
  p.enabled = true;
  p.required_tier = tier;
  return p;
}

std::vector<PlatformInfo> BuiltInCatalog() {
  return {
      MakePlatform("boyfanz", "BoyFanz", "boyfanz.com", "silver"),
      MakePlatform("girlfanz", "GirlFanz", "girlfanz.com", "silver"),
      MakePlatform("pupfanz", "PupFanz", "pupfanz.com", "gold"),
      MakePlatform("transfanz", "TransFanz", "transfanz.com", "gold"),
      MakePlatform("taboofanz", "TabooFanz", "taboofanz.com", "gold"),
      MakePlatform("fanztube", "FanzTube", "fanz.tube", "platinum"),
      MakePlatform("fanzclips", "FanzClips", "fanzclips.com", "platinum"),
      MakePlatform("cougarfanz", "CougarFanz", "cougarfanz.com", "platinum"),
      MakePlatform("milfanz", "MILFanz", "milfanz.com", "diamond"),
      MakePlatform("daddyfanz", "DaddyFanz", "daddyfanz.com", "diamond"),
      MakePlatform("gayfanz", "GayFanz", "gayfanz.com", "diamond"),
      MakePlatform("bearfanz", "BearFanz", "bearfanz.com", "diamond"),
      MakePlatform("fanzlive", "FanzLive", "fanzlive.com", "elite"),
      MakePlatform("fanzpremium", "FanzPremium", "fanzpremium.com", "elite"),
      MakePlatform("fanzexclusive", "FanzExclusive", "fanzexclusive.com", "elite"),
      MakePlatform("fanzroyalty", "FanzRoyalty", "fanzroyalty.com", "royalty"),
  };
}

std::vector<std::string> BenefitsFor(const std::string& tier) {
  if (tier == "silver") {
    return {"1 platform", "Basic quality (1080p, 720p, 480p)", "Standard upload speed"};
  }
  if (tier == "gold") {
    return {"3 platforms", "Enhanced quality (1080p, 720p, 480p, 360p)", "Priority transcoding"};
  }
  if (tier == "platinum") {
    return {"5 platforms", "High quality (1080p, 720p, 480p, 360p, 240p)", "Fast transcoding"};
  }
  if (tier == "diamond") {
    return {"8 platforms", "4K quality support", "Ultra-fast transcoding",
            "Priority distribution"};
  }
  if (tier == "elite") {
    return {"12 platforms", "4K quality + HDR", "Instant transcoding", "Exclusive platforms"};
  }
  return {"All 16 platforms", "Maximum quality", "Dedicated processing",
          "All exclusive platforms"};
}

}  // namespace

TierPolicy::TierPolicy() : platforms_(BuiltInCatalog()) {}

TierPolicy::TierPolicy(std::vector<PlatformInfo> platforms) : platforms_(std::move(platforms)) {
  for (const auto& p : platforms_) RequireTier(p.required_tier);
}

const std::vector<std::string>& TierPolicy::TierNames() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& t : kTiers) out.emplace_back(t.name);
    return out;
  }();
  return names;
}

bool TierPolicy::IsKnownTier(const std::string& tier) {
  return FindTier(tier) != nullptr;
}

int TierPolicy::TierRank(const std::string& tier) {
  return RequireTier(tier).rank;
}

int TierPolicy::MaxPlatforms(const std::string& tier) {
  return RequireTier(tier).max_platforms;
}

std::vector<PlatformInfo> TierPolicy::GetAvailablePlatforms(const std::string& tier) const {
  const int rank = TierRank(tier);
  std::vector<PlatformInfo> out;
  for (const auto& p : platforms_) {
    if (p.enabled && TierRank(p.required_tier) <= rank) out.push_back(p);
  }
  return out;
}

std::vector<std::string> TierPolicy::ValidatePlatformSelection(
    const std::vector<std::string>& requested, const std::string& tier) const {
  const size_t max = static_cast<size_t>(MaxPlatforms(tier));
  std::set<std::string> eligible;
  for (const auto& p : GetAvailablePlatforms(tier)) eligible.insert(p.id);

  std::vector<std::string> allowed;
  std::set<std::string> taken;
  for (const auto& id : requested) {
    if (allowed.size() >= max) break;
    if (eligible.count(id) == 0 || !taken.insert(id).second) continue;
    allowed.push_back(id);
  }
  return allowed;
}

TierInfo TierPolicy::GetTierInfo(const std::string& tier) const {
  const TierLimits& limits = RequireTier(tier);
  TierInfo info;
  info.tier = tier;
  info.rank = limits.rank;
  info.max_platforms = limits.max_platforms;
  info.available_platforms = GetAvailablePlatforms(tier);
  info.benefits = BenefitsFor(tier);
  return info;
}

std::optional<PlatformInfo> TierPolicy::FindPlatform(const std::string& platform_id) const {
  for (const auto& p : platforms_) {
    if (p.id == platform_id) return p;
  }
  return std::nullopt;
}

std::vector<std::string> TierPolicy::PresetsForTier(const std::string& tier,
                                                    const std::vector<std::string>& base,
                                                    const std::vector<std::string>& fallback,
                                                    const std::string& premium) {
  std::vector<std::string> presets = base.empty() ? fallback : base;
  if (TierRank(tier) >= kPremiumPresetRank && !premium.empty() &&
      std::find(presets.begin(), presets.end(), premium) == presets.end()) {
    presets.insert(presets.begin(), premium);
  }
  return presets;
}

}  // namespace mediaforge::distribution
