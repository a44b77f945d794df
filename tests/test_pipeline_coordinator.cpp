// Repository: MediaForge
// Component: Pipeline coordinator unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "fixtures/EventRecorder.h"
#include "fixtures/ForensicServiceStub.h"
#include "fixtures/InMemoryChunkStoreStub.h"
#include "fixtures/PlatformDeliveryStub.h"
#include "fixtures/ScriptedTranscodeRunner.h"
#include "mediaforge/core/Errors.hpp"
#include "mediaforge/pipeline/PipelineCoordinator.hpp"
#include "mediaforge/storage/InMemoryPipelineRepository.hpp"
#include "mediaforge/storage/LocalObjectPublisher.hpp"
#include "support/DeterministicTimeSource.h"
#include "support/TempDir.h"

namespace mediaforge::pipeline {
namespace {

using tests::fixtures::EventRecorder;
using tests::fixtures::ForensicServiceStub;
using tests::fixtures::InMemoryChunkStoreStub;
using tests::fixtures::PlatformDeliveryStub;
using tests::fixtures::ScriptedTranscodeRunner;
using tests::support::DeterministicTimeSource;
using tests::support::TempDir;

constexpr auto kWait = std::chrono::seconds(10);
const std::string kPayload = "abcdefghij";  // Three chunks of 4, 4 and 2 bytes

class PipelineCoordinatorTest : public ::testing::Test {
 protected:
  PipelineCoordinatorTest() : scratch_("coordinator") {}

  void SetUp() override {
    config_.chunk_size_bytes = 4;
    config_.work_dir = scratch_.Sub("work");
    config_.publish_root = scratch_.Sub("cdn");
    config_.public_base_url = "https://cdn.test";
    config_.transcode_parallelism = 2;

    repository_ = std::make_shared<storage::InMemoryPipelineRepository>();
    store_ = std::make_shared<InMemoryChunkStoreStub>();
    forensics_ = std::make_shared<ForensicServiceStub>();
    runner_ = std::make_shared<ScriptedTranscodeRunner>();
    delivery_ = std::make_shared<PlatformDeliveryStub>();
    recorder_ = std::make_shared<EventRecorder>();
    events_ = std::make_shared<PipelineEventBus>();
    events_->Subscribe([this](const PipelineEvent& e) { recorder_->OnEvent(e); });
    time_ = std::make_shared<DeterministicTimeSource>();
    Build();
  }

  void TearDown() override { TearDownComponents(); }

  void Build() {
    auto tiers = std::make_shared<const distribution::TierPolicy>();
    auto publisher = std::make_shared<storage::LocalObjectPublisher>(config_.publish_root,
                                                                     config_.public_base_url);
    uploads_ = std::make_shared<upload::UploadSessionManager>(config_, store_, repository_,
                                                              forensics_, time_);
    transcoder_ = std::make_shared<transcode::TranscodingOrchestrator>(
        config_, repository_, runner_, forensics_, publisher, nullptr, time_);
    fanout_ = std::make_shared<distribution::DistributionFanout>(config_, repository_, tiers,
                                                                 delivery_, time_);
    coordinator_ = std::make_unique<PipelineCoordinator>(config_, repository_, uploads_,
                                                         transcoder_, fanout_, tiers, events_,
                                                         recorder_, time_);
    transcoder_->Start();
  }

  void TearDownComponents() {
    if (transcoder_) transcoder_->Stop();
    if (coordinator_) coordinator_->Shutdown();
    coordinator_.reset();
    transcoder_.reset();
  }

  StartPipelineRequest Request(const std::string& tier,
                               std::vector<std::string> platforms = {}) const {
    StartPipelineRequest request;
    request.filename = "clip.mp4";
    request.total_size = static_cast<int64_t>(kPayload.size());
    request.owner = {"creator-1", "boyfanz", "tenant-1"};
    request.tier = tier;
    request.platform_selection = std::move(platforms);
    return request;
  }

  void UploadAll(const std::string& upload_id) {
    for (int64_t i = 0; i * 4 < static_cast<int64_t>(kPayload.size()); ++i) {
      const auto result = coordinator_->UploadChunk(upload_id, i, kPayload.substr(i * 4, 4));
      ASSERT_TRUE(result.success) << result.error;
    }
  }

  // Waits for the transcode batch (if any) and every distribution worker.
  PipelineStatus Settle(const std::string& upload_id) {
    auto status = coordinator_->GetPipelineStatus(upload_id);
    EXPECT_TRUE(status.has_value());
    if (status && !status->record.transcode_batch_id.empty()) {
      EXPECT_TRUE(transcoder_->WaitForBatch(status->record.transcode_batch_id, kWait));
    }
    coordinator_->WaitForIdle();
    return *coordinator_->GetPipelineStatus(upload_id);
  }

  static CompleteUploadOptions NoTranscode() {
    CompleteUploadOptions options;
    options.auto_transcode = false;
    return options;
  }

  TempDir scratch_;
  config::PipelineConfig config_;
  std::shared_ptr<storage::InMemoryPipelineRepository> repository_;
  std::shared_ptr<InMemoryChunkStoreStub> store_;
  std::shared_ptr<ForensicServiceStub> forensics_;
  std::shared_ptr<ScriptedTranscodeRunner> runner_;
  std::shared_ptr<PlatformDeliveryStub> delivery_;
  std::shared_ptr<EventRecorder> recorder_;
  std::shared_ptr<PipelineEventBus> events_;
  std::shared_ptr<DeterministicTimeSource> time_;

  std::shared_ptr<upload::UploadSessionManager> uploads_;
  std::shared_ptr<transcode::TranscodingOrchestrator> transcoder_;
  std::shared_ptr<distribution::DistributionFanout> fanout_;
  std::unique_ptr<PipelineCoordinator> coordinator_;
};

TEST_F(PipelineCoordinatorTest, StartReportsChunkingAndTierLimits) {
  const auto result = coordinator_->StartPipeline(
      Request("gold", {"taboofanz", "fanztube", "boyfanz", "pupfanz", "girlfanz"}));

  EXPECT_FALSE(result.upload_id.empty());
  EXPECT_EQ(result.asset_id, "pending_" + result.upload_id);
  EXPECT_EQ(result.chunk_size, 4);
  EXPECT_EQ(result.total_chunks, 3);
  EXPECT_EQ(result.max_platforms, 3);
  EXPECT_EQ(result.available_platforms.size(), 5u);
  EXPECT_EQ(result.distribution_platforms,
            (std::vector<std::string>{"taboofanz", "boyfanz", "pupfanz"}));

  const auto status = coordinator_->GetPipelineStatus(result.upload_id);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->record.stage, PipelineStage::kUploading);
  EXPECT_EQ(status->record.tier, "gold");
  EXPECT_EQ(recorder_->Count(PipelineEventType::kPipelineStarted), 1u);
  ASSERT_TRUE(repository_->GetPipeline(result.upload_id).has_value());
}

TEST_F(PipelineCoordinatorTest, EmptySelectionUsesOwnerPlatform) {
  const auto result = coordinator_->StartPipeline(Request("silver"));
  EXPECT_EQ(result.distribution_platforms, std::vector<std::string>{"boyfanz"});
  EXPECT_EQ(result.max_platforms, 1);
}

TEST_F(PipelineCoordinatorTest, UnknownTierIsRejectedBeforeAnySessionExists) {
  try {
    coordinator_->StartPipeline(Request("bronze"));
    FAIL() << "expected kInvalidArgument";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kInvalidArgument);
  }
  EXPECT_TRUE(uploads_->ListActiveSessions().empty());
  EXPECT_TRUE(repository_->ListPipelines().empty());
}

TEST_F(PipelineCoordinatorTest, UploadProgressIsReportedWhileUploading) {
  const auto result = coordinator_->StartPipeline(Request("silver"));
  ASSERT_TRUE(coordinator_->UploadChunk(result.upload_id, 0, "abcd").success);

  const auto status = coordinator_->GetPipelineStatus(result.upload_id);
  ASSERT_TRUE(status.has_value());
  EXPECT_GT(status->upload_progress, 0.0);
  EXPECT_LT(status->upload_progress, 100.0);
  EXPECT_TRUE(status->targets.empty());
  EXPECT_EQ(recorder_->Count(PipelineEventType::kChunkStored), 1u);

  // Re-sending the same chunk is not a new chunk.
  ASSERT_TRUE(coordinator_->UploadChunk(result.upload_id, 0, "abcd").already_present);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kChunkStored), 1u);
}

TEST_F(PipelineCoordinatorTest, SkippingTranscodeGoesStraightToDistribution) {
  const auto result = coordinator_->StartPipeline(Request("gold", {"boyfanz", "pupfanz"}));
  UploadAll(result.upload_id);

  const std::string asset_id = coordinator_->CompleteUpload(result.upload_id, NoTranscode());
  EXPECT_EQ(asset_id.rfind("asset_", 0), 0u);

  const auto status = Settle(result.upload_id);
  EXPECT_EQ(status.record.stage, PipelineStage::kComplete);
  EXPECT_EQ(status.record.asset_id, asset_id);
  EXPECT_TRUE(status.record.upload_complete);
  EXPECT_FALSE(status.record.transcode_complete);
  EXPECT_TRUE(status.record.distribution_complete);
  EXPECT_TRUE(status.record.transcode_batch_id.empty());
  EXPECT_DOUBLE_EQ(status.upload_progress, 100.0);
  ASSERT_EQ(status.targets.size(), 2u);
  for (const auto& target : status.targets) {
    EXPECT_EQ(target.status, DeliveryStatus::kDelivered) << target.platform_id;
  }
  EXPECT_TRUE(runner_->Calls().empty());

  EXPECT_EQ(recorder_->Count(PipelineEventType::kUploadCompleted), 1u);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kPlatformDelivered), 2u);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kTranscodeQueued), 0u);
  EXPECT_EQ(recorder_->AuditCount(PipelineEventType::kUploadCompleted), 1u);
  EXPECT_EQ(recorder_->AuditCount(PipelineEventType::kPlatformDelivered), 0u);

  const auto events = recorder_->Events();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().type, PipelineEventType::kStageChanged);
  EXPECT_EQ(events.back().stage, "complete");
}

TEST_F(PipelineCoordinatorTest, FullPipelineTranscodesThenDistributes) {
  const auto result = coordinator_->StartPipeline(Request("gold", {"boyfanz", "taboofanz"}));
  UploadAll(result.upload_id);

  CompleteUploadOptions options;
  options.presets = {"720p", "480p"};
  const std::string asset_id = coordinator_->CompleteUpload(result.upload_id, options);

  const auto status = Settle(result.upload_id);
  EXPECT_EQ(status.record.stage, PipelineStage::kComplete);
  EXPECT_TRUE(status.record.transcode_complete);
  EXPECT_TRUE(status.record.distribution_complete);
  EXPECT_EQ(status.record.presets, (std::vector<std::string>{"720p", "480p"}));
  EXPECT_DOUBLE_EQ(status.transcode_progress, 100.0);
  EXPECT_EQ(status.targets.size(), 2u);

  const auto asset = repository_->GetAsset(asset_id);
  ASSERT_TRUE(asset.has_value());
  EXPECT_EQ(asset->processing_status, ProcessingStatus::kCompleted);
  EXPECT_EQ(asset->quality_variants.size(), 2u);
  EXPECT_FALSE(asset->manifest_url.empty());
  EXPECT_EQ(status.record.forensic_signature, asset->forensic_signature);

  // The signature minted at upload completion is the one injected.
  for (const auto& injection : forensics_->Injections()) {
    EXPECT_EQ(injection.signature_id, asset->forensic_signature);
  }

  EXPECT_EQ(recorder_->Count(PipelineEventType::kTranscodeQueued), 1u);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kJobCompleted), 2u);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kTranscodeFinished), 1u);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kPlatformDelivered), 2u);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kPipelineFailed), 0u);
}

TEST_F(PipelineCoordinatorTest, HighTiersGetThePremiumPreset) {
  const auto result = coordinator_->StartPipeline(Request("diamond"));
  UploadAll(result.upload_id);
  CompleteUploadOptions options;
  options.presets = {"720p"};
  coordinator_->CompleteUpload(result.upload_id, options);

  const auto status = Settle(result.upload_id);
  EXPECT_EQ(status.record.presets, (std::vector<std::string>{"4k", "720p"}));
}

TEST_F(PipelineCoordinatorTest, OneFailingPlatformStillCompletesThePipeline) {
  delivery_->FailAlways("pupfanz");
  const auto result = coordinator_->StartPipeline(Request("gold", {"boyfanz", "pupfanz"}));
  UploadAll(result.upload_id);
  coordinator_->CompleteUpload(result.upload_id, NoTranscode());

  const auto status = Settle(result.upload_id);
  EXPECT_EQ(status.record.stage, PipelineStage::kComplete);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kPlatformDelivered), 1u);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kPlatformFailed), 1u);
  EXPECT_EQ(recorder_->AuditCount(PipelineEventType::kPlatformFailed), 1u);
}

TEST_F(PipelineCoordinatorTest, AllVariantsFailingFailsThePipelineInTranscoding) {
  runner_->FailPreset("720p");
  runner_->FailPreset("480p");
  const auto result = coordinator_->StartPipeline(Request("silver"));
  UploadAll(result.upload_id);
  CompleteUploadOptions options;
  options.presets = {"720p", "480p"};
  coordinator_->CompleteUpload(result.upload_id, options);

  const auto status = Settle(result.upload_id);
  EXPECT_EQ(status.record.stage, PipelineStage::kFailed);
  ASSERT_TRUE(status.record.failed_stage.has_value());
  EXPECT_EQ(*status.record.failed_stage, PipelineStage::kTranscoding);
  EXPECT_FALSE(status.record.error.empty());
  EXPECT_EQ(delivery_->TotalAttempts(), 0);
  EXPECT_EQ(recorder_->AuditCount(PipelineEventType::kJobFailed), 2u);
  EXPECT_EQ(recorder_->AuditCount(PipelineEventType::kPipelineFailed), 1u);
}

TEST_F(PipelineCoordinatorTest, CancelFailsThePipeline) {
  const auto result = coordinator_->StartPipeline(Request("silver"));
  ASSERT_TRUE(coordinator_->UploadChunk(result.upload_id, 0, "abcd").success);

  EXPECT_TRUE(coordinator_->CancelUpload(result.upload_id));

  const auto status = coordinator_->GetPipelineStatus(result.upload_id);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->record.stage, PipelineStage::kFailed);
  EXPECT_EQ(status->record.failed_stage, PipelineStage::kUploading);
  EXPECT_EQ(status->record.error, "upload cancelled");
  EXPECT_EQ(recorder_->AuditCount(PipelineEventType::kUploadCancelled), 1u);
  EXPECT_EQ(recorder_->AuditCount(PipelineEventType::kPipelineFailed), 1u);
  EXPECT_FALSE(coordinator_->CancelUpload(result.upload_id));
}

TEST_F(PipelineCoordinatorTest, PausedUploadRejectsChunksUntilResumed) {
  const auto result = coordinator_->StartPipeline(Request("silver"));
  ASSERT_TRUE(coordinator_->PauseUpload(result.upload_id));
  try {
    coordinator_->UploadChunk(result.upload_id, 0, "abcd");
    FAIL() << "expected kSessionPaused";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kSessionPaused);
  }
  ASSERT_TRUE(coordinator_->ResumeUpload(result.upload_id));
  EXPECT_TRUE(coordinator_->UploadChunk(result.upload_id, 0, "abcd").success);
}

TEST_F(PipelineCoordinatorTest, CompletingTwiceIsAnIllegalTransition) {
  const auto result = coordinator_->StartPipeline(Request("silver"));
  UploadAll(result.upload_id);
  coordinator_->CompleteUpload(result.upload_id, NoTranscode());
  Settle(result.upload_id);

  try {
    coordinator_->CompleteUpload(result.upload_id, NoTranscode());
    FAIL() << "expected kIllegalTransition";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kIllegalTransition);
  }
}

TEST_F(PipelineCoordinatorTest, IncompleteUploadLeavesPipelineUploading) {
  const auto result = coordinator_->StartPipeline(Request("silver"));
  ASSERT_TRUE(coordinator_->UploadChunk(result.upload_id, 0, "abcd").success);
  try {
    coordinator_->CompleteUpload(result.upload_id, NoTranscode());
    FAIL() << "expected kUploadIncomplete";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kUploadIncomplete);
  }
  EXPECT_EQ(coordinator_->GetPipelineStatus(result.upload_id)->record.stage,
            PipelineStage::kUploading);
}

TEST_F(PipelineCoordinatorTest, FinalizeFailureFailsThePipeline) {
  store_->SetFailComplete(true);
  const auto result = coordinator_->StartPipeline(Request("silver"));
  UploadAll(result.upload_id);
  try {
    coordinator_->CompleteUpload(result.upload_id, NoTranscode());
    FAIL() << "expected kUploadFinalizeFailure";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kUploadFinalizeFailure);
  }
  const auto status = coordinator_->GetPipelineStatus(result.upload_id);
  EXPECT_EQ(status->record.stage, PipelineStage::kFailed);
  EXPECT_EQ(status->record.failed_stage, PipelineStage::kUploading);
}

TEST_F(PipelineCoordinatorTest, UnknownPipeline) {
  EXPECT_FALSE(coordinator_->GetPipelineStatus("upload_missing").has_value());
  try {
    coordinator_->CompleteUpload("upload_missing", NoTranscode());
    FAIL() << "expected kPipelineNotFound";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kPipelineNotFound);
  }
}

TEST_F(PipelineCoordinatorTest, RecoveryResumesDistributionAndFailsLostUploads) {
  MediaAsset asset;
  asset.asset_id = "asset_recovered";
  asset.owner = {"creator-1", "boyfanz", "tenant-1"};
  asset.processing_status = ProcessingStatus::kCompleted;
  repository_->PutAsset(asset);

  DistributionTarget delivered;
  delivered.asset_id = asset.asset_id;
  delivered.platform_id = "boyfanz";
  delivered.status = DeliveryStatus::kDelivered;
  repository_->PutTarget(delivered);

  PipelineRecord distributing;
  distributing.upload_id = "upload_dist";
  distributing.asset_id = asset.asset_id;
  distributing.owner = asset.owner;
  distributing.tier = "gold";
  distributing.stage = PipelineStage::kDistributing;
  distributing.upload_complete = true;
  distributing.auto_transcode = false;
  distributing.distribution_platforms = {"boyfanz", "pupfanz"};
  repository_->PutPipeline(distributing);

  PipelineRecord lost;
  lost.upload_id = "upload_lost";
  lost.asset_id = "pending_upload_lost";
  lost.tier = "silver";
  lost.stage = PipelineStage::kUploading;
  repository_->PutPipeline(lost);

  // A fresh process over the same repository.
  TearDownComponents();
  Build();

  EXPECT_EQ(coordinator_->RecoverInFlight(), 1);
  coordinator_->WaitForIdle();

  const auto resumed = coordinator_->GetPipelineStatus("upload_dist");
  ASSERT_TRUE(resumed.has_value());
  EXPECT_EQ(resumed->record.stage, PipelineStage::kComplete);
  EXPECT_EQ(delivery_->Attempts("boyfanz"), 0);
  EXPECT_EQ(delivery_->Attempts("pupfanz"), 1);

  const auto failed = coordinator_->GetPipelineStatus("upload_lost");
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->record.stage, PipelineStage::kFailed);
  EXPECT_EQ(failed->record.failed_stage, PipelineStage::kUploading);
}

TEST_F(PipelineCoordinatorTest, RecoveryRebuildsVariantsOfAnInterruptedTranscode) {
  MediaAsset asset;
  asset.asset_id = "asset_mid_transcode";
  asset.owner = {"creator-1", "boyfanz", "tenant-1"};
  asset.storage_location = scratch_.Sub("objects") + "/asset_mid_transcode.mp4";
  asset.forensic_signature = "SIG-RESTART";
  asset.processing_status = ProcessingStatus::kProcessing;
  QualityVariant stale;
  stale.quality = "720p";
  stale.url = "https://cdn.test/stale/720p.mp4";
  asset.quality_variants = {stale};
  asset.manifest_url = "https://cdn.test/stale/master.m3u8";
  repository_->PutAsset(asset);

  PipelineRecord transcoding;
  transcoding.upload_id = "upload_mid_transcode";
  transcoding.asset_id = asset.asset_id;
  transcoding.owner = asset.owner;
  transcoding.tier = "gold";
  transcoding.stage = PipelineStage::kTranscoding;
  transcoding.forensic_signature = asset.forensic_signature;
  transcoding.upload_complete = true;
  transcoding.presets = {"720p"};
  transcoding.output_mode = OutputMode::kHls;
  transcoding.distribution_platforms = {"boyfanz"};
  transcoding.transcode_batch_id = "batch_before_restart";
  repository_->PutPipeline(transcoding);

  TearDownComponents();
  Build();

  EXPECT_EQ(coordinator_->RecoverInFlight(), 1);
  const auto queued = coordinator_->GetPipelineStatus("upload_mid_transcode");
  ASSERT_TRUE(queued.has_value());
  EXPECT_NE(queued->record.transcode_batch_id, "batch_before_restart");

  const auto status = Settle("upload_mid_transcode");
  EXPECT_EQ(status.record.stage, PipelineStage::kComplete);
  EXPECT_TRUE(status.record.transcode_complete);
  EXPECT_EQ(runner_->Calls().size(), 1u);
  EXPECT_EQ(delivery_->Attempts("boyfanz"), 1);

  const auto rebuilt = repository_->GetAsset(asset.asset_id);
  ASSERT_TRUE(rebuilt.has_value());
  EXPECT_EQ(rebuilt->processing_status, ProcessingStatus::kCompleted);
  ASSERT_EQ(rebuilt->quality_variants.size(), 1u);
  EXPECT_EQ(rebuilt->quality_variants[0].quality, "720p");
  EXPECT_NE(rebuilt->quality_variants[0].url, stale.url);
  EXPECT_NE(rebuilt->manifest_url, asset.manifest_url);
  EXPECT_EQ(recorder_->Count(PipelineEventType::kTranscodeQueued), 1u);
}

TEST_F(PipelineCoordinatorTest, FinishedPipelinesAreEvictedAfterRetention) {
  TearDownComponents();
  config_.pipeline_retention_ms = 60000;
  Build();

  const auto done = coordinator_->StartPipeline(Request("silver"));
  UploadAll(done.upload_id);
  coordinator_->CompleteUpload(done.upload_id, NoTranscode());
  EXPECT_EQ(Settle(done.upload_id).record.stage, PipelineStage::kComplete);

  const auto uploading = coordinator_->StartPipeline(Request("silver"));

  time_->AdvanceMs(59999);
  EXPECT_EQ(coordinator_->EvictTerminalPipelines(), 0);
  EXPECT_TRUE(coordinator_->GetPipelineStatus(done.upload_id).has_value());

  time_->AdvanceMs(1);
  EXPECT_EQ(coordinator_->EvictTerminalPipelines(), 1);
  EXPECT_FALSE(coordinator_->GetPipelineStatus(done.upload_id).has_value());

  // In-flight pipelines are never evicted, however old.
  time_->AdvanceMs(10 * 60000);
  EXPECT_EQ(coordinator_->EvictTerminalPipelines(), 0);
  EXPECT_TRUE(coordinator_->GetPipelineStatus(uploading.upload_id).has_value());

  // The durable record outlives the in-memory entry.
  ASSERT_TRUE(repository_->GetPipeline(done.upload_id).has_value());
}

TEST_F(PipelineCoordinatorTest, RecoverySkipsFinishedPipelinesPastRetention) {
  PipelineRecord old_record;
  old_record.upload_id = "upload_old";
  old_record.asset_id = "asset_old";
  old_record.tier = "silver";
  old_record.stage = PipelineStage::kComplete;
  old_record.upload_complete = true;
  old_record.updated_at_ms = time_->NowUtcMs() - config_.pipeline_retention_ms - 1;
  repository_->PutPipeline(old_record);

  PipelineRecord recent = old_record;
  recent.upload_id = "upload_recent";
  recent.asset_id = "asset_recent";
  recent.updated_at_ms = time_->NowUtcMs() - 1000;
  repository_->PutPipeline(recent);

  TearDownComponents();
  Build();

  EXPECT_EQ(coordinator_->RecoverInFlight(), 0);
  EXPECT_FALSE(coordinator_->GetPipelineStatus("upload_old").has_value());
  EXPECT_TRUE(coordinator_->GetPipelineStatus("upload_recent").has_value());
}

}  // namespace
}  // namespace mediaforge::pipeline
