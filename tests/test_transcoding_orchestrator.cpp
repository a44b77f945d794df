// Repository: MediaForge
// Component: Transcoding orchestrator unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "fixtures/ForensicServiceStub.h"
#include "fixtures/ScriptedTranscodeRunner.h"
#include "mediaforge/core/Errors.hpp"
#include "mediaforge/storage/InMemoryPipelineRepository.hpp"
#include "mediaforge/storage/LocalObjectPublisher.hpp"
#include "mediaforge/transcode/TranscodingOrchestrator.hpp"
#include "mediaforge/util/FileUtil.hpp"
#include "support/DeterministicTimeSource.h"
#include "support/TempDir.h"

namespace mediaforge::transcode {
namespace {

using tests::fixtures::ForensicServiceStub;
using tests::fixtures::ScriptedTranscodeRunner;
using tests::support::DeterministicTimeSource;
using tests::support::TempDir;

constexpr auto kWait = std::chrono::seconds(10);

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

class TranscodingOrchestratorTest : public ::testing::Test {
 protected:
  TranscodingOrchestratorTest() : scratch_("transcode") {}

  void SetUp() override {
    config_.work_dir = scratch_.Sub("work");
    config_.publish_root = scratch_.Sub("cdn");
    config_.public_base_url = "https://cdn.test";
    config_.transcode_parallelism = 3;
    repository_ = std::make_shared<storage::InMemoryPipelineRepository>();
    runner_ = std::make_shared<ScriptedTranscodeRunner>();
    forensics_ = std::make_shared<ForensicServiceStub>();
    publisher_ = std::make_shared<storage::LocalObjectPublisher>(config_.publish_root,
                                                                 config_.public_base_url);
    time_ = std::make_shared<DeterministicTimeSource>();

    MediaAsset asset;
    asset.asset_id = "asset_1";
    asset.owner = {"creator-1", "boyfanz", "tenant-1"};
    asset.storage_location = "/objects/uploads/u1/clip.mp4";
    asset.forensic_signature = "SIG-ASSET-1";
    repository_->PutAsset(asset);
  }

  void TearDown() override {
    if (orchestrator_) orchestrator_->Stop();
  }

  void StartOrchestrator() {
    orchestrator_ = std::make_unique<TranscodingOrchestrator>(
        config_, repository_, runner_, forensics_, publisher_, nullptr, time_);
    orchestrator_->SetCompletionCallback([this](const BatchOutcome& outcome) {
      std::lock_guard<std::mutex> lock(mutex_);
      outcomes_[outcome.batch_id] = outcome;
    });
    orchestrator_->SetJobCallback([this](const TranscodingJob& job, JobEvent event) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (event == JobEvent::kProgress || event == JobEvent::kCompleted) {
        progress_[job.job_id].push_back(job.progress_percent);
      }
    });
    orchestrator_->Start();
  }

  TranscodeRequest Request(std::vector<std::string> presets,
                           OutputMode mode = OutputMode::kHls) const {
    TranscodeRequest request;
    request.asset_id = "asset_1";
    request.source_location = "/objects/uploads/u1/clip.mp4";
    request.presets = std::move(presets);
    request.signature_id = "SIG-ASSET-1";
    request.signature_payload = {{"creator_id", "creator-1"}, {"platform_id", "boyfanz"}};
    request.target_platforms = {"boyfanz", "girlfanz"};
    request.output_mode = mode;
    return request;
  }

  BatchOutcome RunToCompletion(const TranscodeRequest& request) {
    const std::string batch_id = orchestrator_->QueueTranscoding(request);
    EXPECT_TRUE(orchestrator_->WaitForBatch(batch_id, kWait));
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_[batch_id];
  }

  TempDir scratch_;
  config::PipelineConfig config_;
  std::shared_ptr<storage::InMemoryPipelineRepository> repository_;
  std::shared_ptr<ScriptedTranscodeRunner> runner_;
  std::shared_ptr<ForensicServiceStub> forensics_;
  std::shared_ptr<storage::LocalObjectPublisher> publisher_;
  std::shared_ptr<DeterministicTimeSource> time_;
  std::unique_ptr<TranscodingOrchestrator> orchestrator_;

  std::mutex mutex_;
  std::map<std::string, BatchOutcome> outcomes_;
  std::map<std::string, std::vector<int>> progress_;
};

TEST(MeanProgressTest, ArithmeticMeanOverAllJobs) {
  std::vector<TranscodingJob> jobs(3);
  jobs[0].progress_percent = 100;
  jobs[1].progress_percent = 50;
  jobs[2].progress_percent = 0;
  EXPECT_DOUBLE_EQ(MeanProgress(jobs), 50.0);
  jobs.pop_back();
  EXPECT_DOUBLE_EQ(MeanProgress(jobs), 75.0);
  EXPECT_DOUBLE_EQ(MeanProgress({}), 0.0);
}

TEST_F(TranscodingOrchestratorTest, UnknownPresetsAreSkipped) {
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"1080p", "720p", "bogus", "720p"}));

  EXPECT_EQ(outcome.succeeded, 2);
  EXPECT_EQ(outcome.failed, 0);
  EXPECT_EQ(outcome.asset_status, ProcessingStatus::kCompleted);
  EXPECT_EQ(outcome.target_platforms, (std::vector<std::string>{"boyfanz", "girlfanz"}));
  ASSERT_EQ(outcome.variants.size(), 2u);
  EXPECT_EQ(outcome.variants[0].quality, "1080p");
  EXPECT_EQ(outcome.variants[0].url, "https://cdn.test/media/asset_1/1080p.mp4");
  EXPECT_EQ(outcome.variants[1].quality, "720p");
  EXPECT_EQ(runner_->Calls().size(), 2u);

  const auto status = orchestrator_->GetJobStatus(outcome.batch_id);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->total_variants, 2);
  EXPECT_EQ(status->completed, 2);
  EXPECT_TRUE(status->finished);
  EXPECT_DOUBLE_EQ(status->overall_progress, 100.0);
}

TEST_F(TranscodingOrchestratorTest, CompletedBatchUpdatesAssetAndPublishesManifest) {
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"1080p", "480p"}));

  const auto asset = repository_->GetAsset("asset_1");
  ASSERT_TRUE(asset.has_value());
  EXPECT_EQ(asset->processing_status, ProcessingStatus::kCompleted);
  EXPECT_EQ(asset->quality_variants.size(), 2u);
  EXPECT_EQ(outcome.manifest_url, "https://cdn.test/media/asset_1/master.m3u8");
  EXPECT_EQ(asset->manifest_url, outcome.manifest_url);

  const std::string playlist = ReadFile(publisher_->PathFor("media/asset_1/master.m3u8"));
  EXPECT_NE(playlist.find("RESOLUTION=1920x1080"), std::string::npos);
  EXPECT_NE(playlist.find("https://cdn.test/media/asset_1/480p.mp4"), std::string::npos);
  EXPECT_GT(util::FileSize(publisher_->PathFor("media/asset_1/480p.mp4")), 0);
  // Scratch output is removed once published.
  EXPECT_FALSE(util::PathExists(util::JoinPath(config_.work_dir, "asset_1/master.m3u8")));
}

TEST_F(TranscodingOrchestratorTest, EveryVariantCarriesTheAssetSignature) {
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"720p", "360p"}));

  const auto injections = forensics_->Injections();
  ASSERT_EQ(injections.size(), 2u);
  for (const auto& injection : injections) {
    EXPECT_EQ(injection.signature_id, "SIG-ASSET-1");
    EXPECT_EQ(injection.payload.at("asset_id"), "asset_1");
    EXPECT_EQ(injection.payload.at("creator_id"), "creator-1");
  }
  for (const auto& job : repository_->ListJobs(outcome.batch_id)) {
    EXPECT_TRUE(job.watermark_applied);
  }
}

TEST_F(TranscodingOrchestratorTest, PartialFailureStillCompletesAsset) {
  runner_->FailPreset("720p", 187);
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"1080p", "720p", "480p"}));

  EXPECT_EQ(outcome.succeeded, 2);
  EXPECT_EQ(outcome.failed, 1);
  EXPECT_EQ(outcome.asset_status, ProcessingStatus::kCompleted);
  EXPECT_EQ(repository_->GetAsset("asset_1")->quality_variants.size(), 2u);

  for (const auto& job : repository_->ListJobs(outcome.batch_id)) {
    if (job.preset.key == "720p") {
      EXPECT_EQ(job.status, JobStatus::kFailed);
      EXPECT_EQ(job.error_message, "encoder exited with code 187");
    } else {
      EXPECT_EQ(job.status, JobStatus::kCompleted);
    }
  }
  const std::string playlist = ReadFile(publisher_->PathFor("media/asset_1/master.m3u8"));
  EXPECT_EQ(playlist.find("720p"), std::string::npos);
}

TEST_F(TranscodingOrchestratorTest, AllVariantsFailingFailsAsset) {
  runner_->FailPreset("1080p");
  runner_->FailPreset("720p");
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"1080p", "720p"}));

  EXPECT_EQ(outcome.succeeded, 0);
  EXPECT_EQ(outcome.asset_status, ProcessingStatus::kFailed);
  EXPECT_EQ(outcome.error, "all 2 variant(s) failed");
  EXPECT_TRUE(outcome.manifest_url.empty());
  const auto asset = repository_->GetAsset("asset_1");
  EXPECT_EQ(asset->processing_status, ProcessingStatus::kFailed);
  EXPECT_TRUE(asset->quality_variants.empty());
}

TEST_F(TranscodingOrchestratorTest, MissingOutputFileFailsJob) {
  ScriptedTranscodeRunner::Script silent;
  silent.write_output = false;
  runner_->SetScript("480p", silent);
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"480p"}));
  EXPECT_EQ(outcome.asset_status, ProcessingStatus::kFailed);
  EXPECT_EQ(repository_->ListJobs(outcome.batch_id)[0].error_message,
            "encoder produced no output file");
}

TEST_F(TranscodingOrchestratorTest, SignatureFailureFailsJob) {
  forensics_->SetFailInject(true);
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"480p"}));
  EXPECT_EQ(outcome.failed, 1);
  const auto job = repository_->ListJobs(outcome.batch_id)[0];
  EXPECT_EQ(job.status, JobStatus::kFailed);
  EXPECT_FALSE(job.watermark_applied);
}

TEST_F(TranscodingOrchestratorTest, NoValidPresetsFailsImmediately) {
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"bogus", "8k"}));
  EXPECT_EQ(outcome.succeeded, 0);
  EXPECT_EQ(outcome.failed, 0);
  EXPECT_EQ(outcome.asset_status, ProcessingStatus::kFailed);
  EXPECT_EQ(outcome.error, "no valid quality presets requested");
  EXPECT_TRUE(runner_->Calls().empty());
}

TEST_F(TranscodingOrchestratorTest, UnknownAssetIsRejected) {
  StartOrchestrator();
  TranscodeRequest request = Request({"720p"});
  request.asset_id = "asset_missing";
  try {
    orchestrator_->QueueTranscoding(request);
    FAIL() << "expected kAssetNotFound";
  } catch (const PipelineError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kAssetNotFound);
  }
  EXPECT_FALSE(orchestrator_->GetJobStatus("transcode_unknown").has_value());
}

TEST_F(TranscodingOrchestratorTest, Mp4ModeSkipsManifest) {
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"720p"}, OutputMode::kMp4));
  EXPECT_EQ(outcome.asset_status, ProcessingStatus::kCompleted);
  EXPECT_TRUE(outcome.manifest_url.empty());
}

TEST_F(TranscodingOrchestratorTest, DashModePublishesMpd) {
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"720p"}, OutputMode::kDash));
  EXPECT_EQ(outcome.manifest_url, "https://cdn.test/media/asset_1/manifest.mpd");
  const std::string mpd = ReadFile(publisher_->PathFor("media/asset_1/manifest.mpd"));
  EXPECT_NE(mpd.find("<Representation id=\"720p\""), std::string::npos);
}

TEST_F(TranscodingOrchestratorTest, JobsRunInGroupsOfConfiguredSize) {
  config_.transcode_parallelism = 2;
  ScriptedTranscodeRunner::Script slow;
  slow.delay_ms = 30;
  runner_->SetDefaultScript(slow);
  StartOrchestrator();
  EXPECT_EQ(orchestrator_->GroupSize(), 2);

  const BatchOutcome outcome = RunToCompletion(Request({"1080p", "720p", "480p", "360p", "240p"}));
  EXPECT_EQ(outcome.succeeded, 5);
  EXPECT_LE(runner_->MaxConcurrent(), 2);
  EXPECT_EQ(runner_->Calls().size(), 5u);
}

TEST_F(TranscodingOrchestratorTest, ProgressIsMonotonicPerJob) {
  StartOrchestrator();
  const BatchOutcome outcome = RunToCompletion(Request({"1080p", "720p"}));
  ASSERT_EQ(outcome.succeeded, 2);

  std::lock_guard<std::mutex> lock(mutex_);
  ASSERT_EQ(progress_.size(), 2u);
  for (const auto& [job_id, values] : progress_) {
    ASSERT_FALSE(values.empty());
    for (size_t i = 1; i < values.size(); ++i) {
      EXPECT_GE(values[i], values[i - 1]) << job_id;
    }
    // Scripted output reports 25%, 50% then 100%.
    EXPECT_EQ(values.front(), 25);
    EXPECT_EQ(values.back(), 100);
  }
}

TEST_F(TranscodingOrchestratorTest, QueuedStatusBeforeStart) {
  orchestrator_ = std::make_unique<TranscodingOrchestrator>(
      config_, repository_, runner_, forensics_, publisher_, nullptr, time_);
  const std::string batch_id = orchestrator_->QueueTranscoding(Request({"1080p", "720p"}));

  const auto status = orchestrator_->GetJobStatus(batch_id);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->asset_id, "asset_1");
  EXPECT_EQ(status->queued, 2);
  EXPECT_FALSE(status->finished);
  EXPECT_DOUBLE_EQ(status->overall_progress, 0.0);
  EXPECT_EQ(repository_->GetAsset("asset_1")->processing_status, ProcessingStatus::kProcessing);
  EXPECT_FALSE(orchestrator_->WaitForBatch(batch_id, std::chrono::milliseconds(50)));

  orchestrator_->Start();
  EXPECT_TRUE(orchestrator_->WaitForBatch(batch_id, kWait));
  EXPECT_TRUE(orchestrator_->GetJobStatus(batch_id)->finished);
}

}  // namespace
}  // namespace mediaforge::transcode
