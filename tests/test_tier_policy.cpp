// Repository: MediaForge
// Component: Tier policy unit tests

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/distribution/TierPolicy.hpp"

namespace mediaforge::distribution {
namespace {

std::set<std::string> Ids(const std::vector<PlatformInfo>& platforms) {
  std::set<std::string> out;
  for (const auto& p : platforms) out.insert(p.id);
  return out;
}

TEST(TierPolicyTest, TierLimits) {
  const std::vector<std::string> expected = {"silver",  "gold",  "platinum",
                                             "diamond", "elite", "royalty"};
  EXPECT_EQ(TierPolicy::TierNames(), expected);
  EXPECT_EQ(TierPolicy::MaxPlatforms("silver"), 1);
  EXPECT_EQ(TierPolicy::MaxPlatforms("gold"), 3);
  EXPECT_EQ(TierPolicy::MaxPlatforms("platinum"), 5);
  EXPECT_EQ(TierPolicy::MaxPlatforms("diamond"), 8);
  EXPECT_EQ(TierPolicy::MaxPlatforms("elite"), 12);
  EXPECT_EQ(TierPolicy::MaxPlatforms("royalty"), 16);
  EXPECT_LT(TierPolicy::TierRank("silver"), TierPolicy::TierRank("royalty"));
}

TEST(TierPolicyTest, UnknownTierIsInvalidArgument) {
  EXPECT_FALSE(TierPolicy::IsKnownTier("bronze"));
  try {
    TierPolicy::MaxPlatforms("bronze");
    FAIL() << "expected PipelineError";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kInvalidArgument);
  }
  TierPolicy policy;
  EXPECT_THROW(policy.GetAvailablePlatforms("Gold"), PipelineError);
}

TEST(TierPolicyTest, AvailablePlatformsGrowMonotonically) {
  TierPolicy policy;
  EXPECT_EQ(policy.AllPlatforms().size(), 16u);
  EXPECT_EQ(policy.GetAvailablePlatforms("silver").size(), 2u);
  EXPECT_EQ(policy.GetAvailablePlatforms("royalty").size(), 16u);

  std::set<std::string> previous;
  for (const auto& tier : TierPolicy::TierNames()) {
    const auto current = Ids(policy.GetAvailablePlatforms(tier));
    for (const auto& id : previous) {
      EXPECT_EQ(current.count(id), 1u) << id << " missing from " << tier;
    }
    previous = current;
  }
}

TEST(TierPolicyTest, GoldSelectionFiltersAndTruncatesInCallerOrder) {
  TierPolicy policy;
  // fanztube requires platinum; the other four are gold-eligible.
  const std::vector<std::string> requested = {"taboofanz", "fanztube", "boyfanz", "pupfanz",
                                              "girlfanz"};
  const auto allowed = policy.ValidatePlatformSelection(requested, "gold");
  EXPECT_EQ(allowed, (std::vector<std::string>{"taboofanz", "boyfanz", "pupfanz"}));
}

TEST(TierPolicyTest, SelectionDropsDuplicatesAndUnknownIds) {
  TierPolicy policy;
  const auto allowed = policy.ValidatePlatformSelection(
      {"boyfanz", "nosuchplatform", "boyfanz", "girlfanz"}, "platinum");
  EXPECT_EQ(allowed, (std::vector<std::string>{"boyfanz", "girlfanz"}));
  EXPECT_TRUE(policy.ValidatePlatformSelection({}, "royalty").empty());
}

TEST(TierPolicyTest, DisabledPlatformsAreNeverEligible) {
  std::vector<PlatformInfo> catalog(2);
  catalog[0].id = "alpha";
  catalog[0].required_tier = "silver";
  catalog[1].id = "beta";
  catalog[1].required_tier = "silver";
  catalog[1].enabled = false;
  TierPolicy policy(catalog);

  EXPECT_EQ(Ids(policy.GetAvailablePlatforms("royalty")), (std::set<std::string>{"alpha"}));
  EXPECT_TRUE(policy.ValidatePlatformSelection({"beta"}, "royalty").empty());
}

TEST(TierPolicyTest, CustomCatalogRejectsUnknownTier) {
  std::vector<PlatformInfo> catalog(1);
  catalog[0].id = "alpha";
  catalog[0].required_tier = "bronze";
  EXPECT_THROW(TierPolicy policy(catalog), PipelineError);
}

TEST(TierPolicyTest, TierInfoCarriesBenefits) {
  TierPolicy policy;
  const TierInfo info = policy.GetTierInfo("diamond");
  EXPECT_EQ(info.tier, "diamond");
  EXPECT_EQ(info.max_platforms, 8);
  EXPECT_EQ(info.available_platforms.size(), 12u);
  EXPECT_FALSE(info.benefits.empty());
}

TEST(TierPolicyTest, FindPlatform) {
  TierPolicy policy;
  auto p = policy.FindPlatform("fanzroyalty");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->required_tier, "royalty");
  EXPECT_EQ(p->ingest_endpoint, "ingest.fanzroyalty.com:443");
  EXPECT_FALSE(policy.FindPlatform("nope").has_value());
}

TEST(TierPolicyTest, PremiumPresetForDiamondAndAbove) {
  const std::vector<std::string> fallback = {"1080p", "720p"};
  EXPECT_EQ(TierPolicy::PresetsForTier("gold", {}, fallback, "4k"), fallback);
  EXPECT_EQ(TierPolicy::PresetsForTier("diamond", {}, fallback, "4k"),
            (std::vector<std::string>{"4k", "1080p", "720p"}));
  EXPECT_EQ(TierPolicy::PresetsForTier("royalty", {"4k", "480p"}, fallback, "4k"),
            (std::vector<std::string>{"4k", "480p"}));
  EXPECT_EQ(TierPolicy::PresetsForTier("elite", {"480p"}, fallback, ""),
            (std::vector<std::string>{"480p"}));
}

}  // namespace
}  // namespace mediaforge::distribution
