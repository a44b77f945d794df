// Repository: MediaForge
// Component: MediaPipeline gRPC Service Implementation
// Purpose: Thin adapter from the MediaPipeline RPCs to the coordinator,
//          upload manager, orchestrator and tier policy.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_PIPELINE_SERVICE_H_
#define MEDIAFORGE_PIPELINE_SERVICE_H_

#include <atomic>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "media_pipeline.grpc.pb.h"
#include "media_pipeline.pb.h"
#include "mediaforge/core/Errors.hpp"
#include "mediaforge/distribution/TierPolicy.hpp"
#include "mediaforge/pipeline/PipelineCoordinator.hpp"
#include "mediaforge/pipeline/PipelineEventBus.hpp"
#include "mediaforge/transcode/TranscodingOrchestrator.hpp"
#include "mediaforge/upload/UploadSessionManager.hpp"

namespace mediaforge {
namespace service {

// NOT_FOUND, INVALID_ARGUMENT, FAILED_PRECONDITION, UNAVAILABLE or INTERNAL.
grpc::StatusCode ToGrpcCode(ErrorCode code);

class MediaPipelineImpl final : public api::v1::MediaPipeline::Service {
 public:
  MediaPipelineImpl(std::shared_ptr<pipeline::PipelineCoordinator> coordinator,
                    std::shared_ptr<upload::UploadSessionManager> uploads,
                    std::shared_ptr<transcode::TranscodingOrchestrator> transcoder,
                    std::shared_ptr<const distribution::TierPolicy> tiers,
                    std::shared_ptr<pipeline::PipelineEventBus> events);
  ~MediaPipelineImpl() override;

  MediaPipelineImpl(const MediaPipelineImpl&) = delete;
  MediaPipelineImpl& operator=(const MediaPipelineImpl&) = delete;

  grpc::Status StartPipeline(grpc::ServerContext* context,
                             const api::v1::StartPipelineRequest* request,
                             api::v1::StartPipelineResponse* response) override;

  grpc::Status UploadChunk(grpc::ServerContext* context,
                           const api::v1::UploadChunkRequest* request,
                           api::v1::UploadChunkResponse* response) override;

  grpc::Status CompleteUpload(grpc::ServerContext* context,
                              const api::v1::CompleteUploadRequest* request,
                              api::v1::CompleteUploadResponse* response) override;

  grpc::Status GetPipelineStatus(grpc::ServerContext* context,
                                 const api::v1::GetPipelineStatusRequest* request,
                                 api::v1::GetPipelineStatusResponse* response) override;

  grpc::Status PauseUpload(grpc::ServerContext* context,
                           const api::v1::UploadControlRequest* request,
                           api::v1::UploadControlResponse* response) override;

  grpc::Status ResumeUpload(grpc::ServerContext* context,
                            const api::v1::UploadControlRequest* request,
                            api::v1::UploadControlResponse* response) override;

  grpc::Status CancelUpload(grpc::ServerContext* context,
                            const api::v1::UploadControlRequest* request,
                            api::v1::UploadControlResponse* response) override;

  grpc::Status GetUploadProgress(grpc::ServerContext* context,
                                 const api::v1::GetUploadProgressRequest* request,
                                 api::v1::UploadProgress* response) override;

  grpc::Status GetTranscodeStatus(grpc::ServerContext* context,
                                  const api::v1::GetTranscodeStatusRequest* request,
                                  api::v1::TranscodeStatus* response) override;

  grpc::Status GetAvailablePlatforms(grpc::ServerContext* context,
                                     const api::v1::GetAvailablePlatformsRequest* request,
                                     api::v1::GetAvailablePlatformsResponse* response) override;

  grpc::Status GetTierInfo(grpc::ServerContext* context,
                           const api::v1::GetTierInfoRequest* request,
                           api::v1::TierInfo* response) override;

  // Streams events until the client cancels or Shutdown() is called.
  grpc::Status SubscribePipelineEvents(
      grpc::ServerContext* context, const api::v1::SubscribePipelineEventsRequest* request,
      grpc::ServerWriter<api::v1::PipelineEvent>* writer) override;

  // Ends every open event stream so the server can drain.
  void Shutdown();

 private:
  std::shared_ptr<pipeline::PipelineCoordinator> coordinator_;
  std::shared_ptr<upload::UploadSessionManager> uploads_;
  std::shared_ptr<transcode::TranscodingOrchestrator> transcoder_;
  std::shared_ptr<const distribution::TierPolicy> tiers_;
  std::shared_ptr<pipeline::PipelineEventBus> events_;

  std::atomic<bool> shutdown_{false};
};

}  // namespace service
}  // namespace mediaforge

#endif  // MEDIAFORGE_PIPELINE_SERVICE_H_
