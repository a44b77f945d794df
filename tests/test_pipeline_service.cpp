// Repository: MediaForge
// Component: MediaPipeline gRPC service unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "fixtures/ForensicServiceStub.h"
#include "fixtures/InMemoryChunkStoreStub.h"
#include "fixtures/PlatformDeliveryStub.h"
#include "fixtures/ScriptedTranscodeRunner.h"
#include "mediaforge/storage/InMemoryPipelineRepository.hpp"
#include "mediaforge/storage/LocalObjectPublisher.hpp"
#include "pipeline_service.h"
#include "support/DeterministicTimeSource.h"
#include "support/TempDir.h"

namespace mediaforge::service {
namespace {

namespace pb = mediaforge::api::v1;

using tests::fixtures::ForensicServiceStub;
using tests::fixtures::InMemoryChunkStoreStub;
using tests::fixtures::PlatformDeliveryStub;
using tests::fixtures::ScriptedTranscodeRunner;
using tests::support::DeterministicTimeSource;
using tests::support::TempDir;

TEST(ToGrpcCodeTest, MapsEveryErrorFamily) {
  EXPECT_EQ(ToGrpcCode(ErrorCode::kSessionNotFound), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kPipelineNotFound), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kAssetNotFound), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kInvalidChunkIndex), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kInvalidArgument), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kInvalidPlatformSelection),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kUnknownPreset), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kSessionPaused), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kUploadIncomplete), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kIllegalTransition), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kBackingStoreUnavailable), grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kUploadFinalizeFailure), grpc::StatusCode::INTERNAL);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kSubprocessFailure), grpc::StatusCode::INTERNAL);
  EXPECT_EQ(ToGrpcCode(ErrorCode::kInternal), grpc::StatusCode::INTERNAL);
}

class MediaPipelineServiceTest : public ::testing::Test {
 protected:
  MediaPipelineServiceTest() : scratch_("service") {}

  void SetUp() override {
    config_.chunk_size_bytes = 4;
    config_.work_dir = scratch_.Sub("work");
    config_.publish_root = scratch_.Sub("cdn");
    config_.public_base_url = "https://cdn.test";

    auto repository = std::make_shared<storage::InMemoryPipelineRepository>();
    auto forensics = std::make_shared<ForensicServiceStub>();
    auto time = std::make_shared<DeterministicTimeSource>();
    auto tiers = std::make_shared<const distribution::TierPolicy>();
    store_ = std::make_shared<InMemoryChunkStoreStub>();
    uploads_ = std::make_shared<upload::UploadSessionManager>(config_, store_, repository,
                                                              forensics, time);
    transcoder_ = std::make_shared<transcode::TranscodingOrchestrator>(
        config_, repository, std::make_shared<ScriptedTranscodeRunner>(), forensics,
        std::make_shared<storage::LocalObjectPublisher>(config_.publish_root,
                                                        config_.public_base_url),
        nullptr, time);
    auto fanout = std::make_shared<distribution::DistributionFanout>(
        config_, repository, tiers, std::make_shared<PlatformDeliveryStub>(), time);
    events_ = std::make_shared<pipeline::PipelineEventBus>();
    coordinator_ = std::make_shared<pipeline::PipelineCoordinator>(
        config_, repository, uploads_, transcoder_, fanout, tiers, events_, nullptr, time);
    transcoder_->Start();
    service_ = std::make_unique<MediaPipelineImpl>(coordinator_, uploads_, transcoder_, tiers,
                                                   events_);
  }

  void TearDown() override {
    service_->Shutdown();
    transcoder_->Stop();
    coordinator_->Shutdown();
  }

  pb::StartPipelineResponse Start(const std::string& tier) {
    pb::StartPipelineRequest request;
    request.set_filename("clip.mp4");
    request.set_total_size(10);
    request.mutable_owner()->set_owner_id("creator-1");
    request.mutable_owner()->set_platform_id("boyfanz");
    request.set_tier(tier);
    pb::StartPipelineResponse response;
    const grpc::Status status = service_->StartPipeline(nullptr, &request, &response);
    EXPECT_TRUE(status.ok()) << status.error_message();
    return response;
  }

  grpc::Status Chunk(const std::string& upload_id, int64_t index, const std::string& data,
                     pb::UploadChunkResponse* response) {
    pb::UploadChunkRequest request;
    request.set_upload_id(upload_id);
    request.set_chunk_index(index);
    request.set_data(data);
    return service_->UploadChunk(nullptr, &request, response);
  }

  TempDir scratch_;
  config::PipelineConfig config_;
  std::shared_ptr<InMemoryChunkStoreStub> store_;
  std::shared_ptr<upload::UploadSessionManager> uploads_;
  std::shared_ptr<transcode::TranscodingOrchestrator> transcoder_;
  std::shared_ptr<pipeline::PipelineEventBus> events_;
  std::shared_ptr<pipeline::PipelineCoordinator> coordinator_;
  std::unique_ptr<MediaPipelineImpl> service_;
};

TEST_F(MediaPipelineServiceTest, StartPipelineFillsResponse) {
  const auto response = Start("silver");
  EXPECT_FALSE(response.upload_id().empty());
  EXPECT_EQ(response.asset_id(), "pending_" + response.upload_id());
  EXPECT_EQ(response.chunk_size(), 4);
  EXPECT_EQ(response.total_chunks(), 3);
  EXPECT_EQ(response.max_platforms(), 1);
  EXPECT_EQ(response.available_platforms_size(), 2);
  ASSERT_EQ(response.distribution_platforms_size(), 1);
  EXPECT_EQ(response.distribution_platforms(0), "boyfanz");
}

TEST_F(MediaPipelineServiceTest, UnknownTierIsInvalidArgument) {
  pb::StartPipelineRequest request;
  request.set_filename("clip.mp4");
  request.set_total_size(10);
  request.set_tier("bronze");
  pb::StartPipelineResponse response;
  EXPECT_EQ(service_->StartPipeline(nullptr, &request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MediaPipelineServiceTest, UploadChunkReportsContractViolationsAsStatus) {
  const auto started = Start("silver");

  pb::UploadChunkResponse ok;
  ASSERT_TRUE(Chunk(started.upload_id(), 0, "abcd", &ok).ok());
  EXPECT_TRUE(ok.success());
  EXPECT_FALSE(ok.etag().empty());
  EXPECT_EQ(ok.chunk_hash().size(), 64u);

  pb::UploadChunkResponse out_of_range;
  EXPECT_EQ(Chunk(started.upload_id(), 7, "abcd", &out_of_range).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);

  pb::UploadChunkResponse unknown;
  EXPECT_EQ(Chunk("upload_missing", 0, "abcd", &unknown).error_code(),
            grpc::StatusCode::NOT_FOUND);
}

TEST_F(MediaPipelineServiceTest, CompleteUploadPreconditions) {
  const auto started = Start("silver");
  pb::UploadChunkResponse chunk;
  ASSERT_TRUE(Chunk(started.upload_id(), 0, "abcd", &chunk).ok());

  pb::CompleteUploadRequest request;
  request.set_upload_id(started.upload_id());
  request.set_skip_transcode(true);
  pb::CompleteUploadResponse response;
  EXPECT_EQ(service_->CompleteUpload(nullptr, &request, &response).error_code(),
            grpc::StatusCode::FAILED_PRECONDITION);

  request.set_output_mode("webm");
  EXPECT_EQ(service_->CompleteUpload(nullptr, &request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MediaPipelineServiceTest, PipelineStatusForUnknownIdIsNotFoundFlag) {
  pb::GetPipelineStatusRequest request;
  request.set_upload_id("upload_missing");
  pb::GetPipelineStatusResponse response;
  ASSERT_TRUE(service_->GetPipelineStatus(nullptr, &request, &response).ok());
  EXPECT_FALSE(response.found());
  EXPECT_TRUE(response.stage().empty());
}

TEST_F(MediaPipelineServiceTest, PipelineStatusAfterCancel) {
  const auto started = Start("silver");
  pb::UploadControlRequest control;
  control.set_upload_id(started.upload_id());
  pb::UploadControlResponse cancelled;
  ASSERT_TRUE(service_->CancelUpload(nullptr, &control, &cancelled).ok());
  EXPECT_TRUE(cancelled.success());

  pb::GetPipelineStatusRequest request;
  request.set_upload_id(started.upload_id());
  pb::GetPipelineStatusResponse response;
  ASSERT_TRUE(service_->GetPipelineStatus(nullptr, &request, &response).ok());
  EXPECT_TRUE(response.found());
  EXPECT_EQ(response.stage(), "failed");
  EXPECT_EQ(response.failed_stage(), "uploading");
  EXPECT_EQ(response.error(), "upload cancelled");
}

TEST_F(MediaPipelineServiceTest, UploadProgressAndControl) {
  const auto started = Start("silver");
  pb::UploadChunkResponse chunk;
  ASSERT_TRUE(Chunk(started.upload_id(), 2, "ij", &chunk).ok());

  pb::GetUploadProgressRequest request;
  request.set_upload_id(started.upload_id());
  pb::UploadProgress progress;
  ASSERT_TRUE(service_->GetUploadProgress(nullptr, &request, &progress).ok());
  EXPECT_EQ(progress.status(), "active");
  EXPECT_EQ(progress.uploaded_chunks(), 1);
  EXPECT_EQ(progress.total_chunks(), 3);
  ASSERT_EQ(progress.missing_chunks_size(), 2);
  EXPECT_EQ(progress.missing_chunks(0), 0);
  EXPECT_EQ(progress.missing_chunks(1), 1);

  pb::UploadControlRequest control;
  control.set_upload_id(started.upload_id());
  pb::UploadControlResponse paused;
  ASSERT_TRUE(service_->PauseUpload(nullptr, &control, &paused).ok());
  EXPECT_TRUE(paused.success());
  EXPECT_EQ(Chunk(started.upload_id(), 0, "abcd", &chunk).error_code(),
            grpc::StatusCode::FAILED_PRECONDITION);

  pb::UploadControlResponse resumed;
  ASSERT_TRUE(service_->ResumeUpload(nullptr, &control, &resumed).ok());
  EXPECT_TRUE(resumed.success());

  request.set_upload_id("upload_missing");
  EXPECT_EQ(service_->GetUploadProgress(nullptr, &request, &progress).error_code(),
            grpc::StatusCode::NOT_FOUND);
}

TEST_F(MediaPipelineServiceTest, UnknownTranscodeBatchIsNotFound) {
  pb::GetTranscodeStatusRequest request;
  request.set_batch_id("batch_missing");
  pb::TranscodeStatus response;
  EXPECT_EQ(service_->GetTranscodeStatus(nullptr, &request, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);
}

TEST_F(MediaPipelineServiceTest, TierQueries) {
  pb::GetAvailablePlatformsRequest platforms_request;
  platforms_request.set_tier("platinum");
  pb::GetAvailablePlatformsResponse platforms;
  ASSERT_TRUE(service_->GetAvailablePlatforms(nullptr, &platforms_request, &platforms).ok());
  EXPECT_EQ(platforms.platforms_size(), 8);
  EXPECT_EQ(platforms.max_platforms(), 5);

  pb::GetTierInfoRequest info_request;
  info_request.set_tier("royalty");
  pb::TierInfo info;
  ASSERT_TRUE(service_->GetTierInfo(nullptr, &info_request, &info).ok());
  EXPECT_EQ(info.tier(), "royalty");
  EXPECT_EQ(info.max_platforms(), 16);
  EXPECT_EQ(info.available_platforms_size(), 16);

  info_request.set_tier("bronze");
  EXPECT_EQ(service_->GetTierInfo(nullptr, &info_request, &info).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

}  // namespace
}  // namespace mediaforge::service
