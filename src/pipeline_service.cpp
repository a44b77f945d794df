// Repository: MediaForge
// Component: MediaPipeline gRPC Service Implementation
// Purpose: Converts between wire messages and pipeline types; maps
//          PipelineError codes onto gRPC status codes.
// Copyright (c) 2026 MediaForge

#include "pipeline_service.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>

#include "mediaforge/util/Logger.hpp"

namespace mediaforge {
namespace service {

namespace pb = mediaforge::api::v1;

namespace {

constexpr auto kStreamPollInterval = std::chrono::milliseconds(200);
constexpr std::size_t kMaxQueuedStreamEvents = 1024;

// Runs an RPC body and turns exceptions into a status.
template <typename Fn>
grpc::Status Guarded(const char* rpc, Fn&& body) {
  try {
    return body();
  } catch (const PipelineError& e) {
    util::Logger::Warn(std::string("[") + rpc + "] " + ErrorCodeName(e.code()) + ": " + e.what());
    return grpc::Status(ToGrpcCode(e.code()), e.what());
  } catch (const std::invalid_argument& e) {
    util::Logger::Warn(std::string("[") + rpc + "] invalid argument: " + e.what());
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[") + rpc + "] " + e.what());
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

void FillPlatform(const distribution::PlatformInfo& in, pb::Platform* out) {
  out->set_id(in.id);
  out->set_name(in.name);
  out->set_base_url(in.base_url);
  out->set_required_tier(in.required_tier);
  out->set_enabled(in.enabled);
}

void FillEvent(const pipeline::PipelineEvent& in, pb::PipelineEvent* out) {
  out->set_type(pipeline::ToString(in.type));
  out->set_upload_id(in.upload_id);
  out->set_asset_id(in.asset_id);
  out->set_batch_id(in.batch_id);
  out->set_job_id(in.job_id);
  out->set_platform_id(in.platform_id);
  out->set_stage(in.stage);
  out->set_progress(in.progress);
  out->set_message(in.message);
  out->set_emitted_utc_ms(in.emitted_utc_ms);
}

struct StreamQueue {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<pipeline::PipelineEvent> events;
  uint64_t dropped = 0;
};

}  // namespace

grpc::StatusCode ToGrpcCode(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSessionNotFound:
    case ErrorCode::kPipelineNotFound:
    case ErrorCode::kAssetNotFound:
      return grpc::StatusCode::NOT_FOUND;
    case ErrorCode::kInvalidChunkIndex:
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kInvalidPlatformSelection:
    case ErrorCode::kUnknownPreset:
      return grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorCode::kSessionPaused:
    case ErrorCode::kUploadIncomplete:
    case ErrorCode::kIllegalTransition:
      return grpc::StatusCode::FAILED_PRECONDITION;
    case ErrorCode::kBackingStoreUnavailable:
      return grpc::StatusCode::UNAVAILABLE;
    default:
      return grpc::StatusCode::INTERNAL;
  }
}

MediaPipelineImpl::MediaPipelineImpl(std::shared_ptr<pipeline::PipelineCoordinator> coordinator,
                                     std::shared_ptr<upload::UploadSessionManager> uploads,
                                     std::shared_ptr<transcode::TranscodingOrchestrator> transcoder,
                                     std::shared_ptr<const distribution::TierPolicy> tiers,
                                     std::shared_ptr<pipeline::PipelineEventBus> events)
    : coordinator_(std::move(coordinator)),
      uploads_(std::move(uploads)),
      transcoder_(std::move(transcoder)),
      tiers_(std::move(tiers)),
      events_(std::move(events)) {
  util::Logger::Info("[MediaPipelineImpl] Service initialized");
}

MediaPipelineImpl::~MediaPipelineImpl() {
  util::Logger::Info("[MediaPipelineImpl] Service shutting down");
}

void MediaPipelineImpl::Shutdown() {
  shutdown_.store(true, std::memory_order_release);
}

grpc::Status MediaPipelineImpl::StartPipeline(grpc::ServerContext* /*context*/,
                                              const pb::StartPipelineRequest* request,
                                              pb::StartPipelineResponse* response) {
  return Guarded("StartPipeline", [&] {
    util::Logger::Info("[StartPipeline] Request received: filename=" + request->filename() +
                       ", size=" + std::to_string(request->total_size()) +
                       ", tier=" + request->tier());
    pipeline::StartPipelineRequest in;
    in.filename = request->filename();
    in.total_size = request->total_size();
    in.mime_type = request->mime_type();
    in.owner.owner_id = request->owner().owner_id();
    in.owner.platform_id = request->owner().platform_id();
    in.owner.tenant_id = request->owner().tenant_id();
    in.tier = request->tier();
    in.platform_selection.assign(request->platform_selection().begin(),
                                 request->platform_selection().end());

    const auto result = coordinator_->StartPipeline(in);
    response->set_upload_id(result.upload_id);
    response->set_asset_id(result.asset_id);
    response->set_chunk_size(result.chunk_size);
    response->set_total_chunks(result.total_chunks);
    for (const auto& p : result.available_platforms) {
      FillPlatform(p, response->add_available_platforms());
    }
    for (const auto& id : result.distribution_platforms) {
      response->add_distribution_platforms(id);
    }
    response->set_max_platforms(result.max_platforms);
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::UploadChunk(grpc::ServerContext* /*context*/,
                                            const pb::UploadChunkRequest* request,
                                            pb::UploadChunkResponse* response) {
  return Guarded("UploadChunk", [&] {
    util::Logger::Debug("[UploadChunk] upload_id=" + request->upload_id() +
                        ", index=" + std::to_string(request->chunk_index()) +
                        ", bytes=" + std::to_string(request->data().size()));
    const auto result =
        coordinator_->UploadChunk(request->upload_id(), request->chunk_index(), request->data());
    response->set_success(result.success);
    response->set_etag(result.etag);
    response->set_chunk_hash(result.chunk_hash);
    response->set_already_present(result.already_present);
    response->set_message(result.error);
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::CompleteUpload(grpc::ServerContext* /*context*/,
                                               const pb::CompleteUploadRequest* request,
                                               pb::CompleteUploadResponse* response) {
  return Guarded("CompleteUpload", [&] {
    util::Logger::Info("[CompleteUpload] Request received: upload_id=" + request->upload_id());
    pipeline::CompleteUploadOptions options;
    options.meta.width = request->width();
    options.meta.height = request->height();
    options.meta.duration_ms = request->duration_ms();
    options.auto_transcode = !request->skip_transcode();
    options.presets.assign(request->presets().begin(), request->presets().end());
    if (!request->output_mode().empty()) {
      options.output_mode = ParseOutputMode(request->output_mode());
      if (!options.output_mode) {
        throw PipelineError(ErrorCode::kInvalidArgument,
                            "unknown output mode: '" + request->output_mode() + "'");
      }
    }
    response->set_asset_id(coordinator_->CompleteUpload(request->upload_id(), options));
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::GetPipelineStatus(grpc::ServerContext* /*context*/,
                                                  const pb::GetPipelineStatusRequest* request,
                                                  pb::GetPipelineStatusResponse* response) {
  return Guarded("GetPipelineStatus", [&] {
    const auto status = coordinator_->GetPipelineStatus(request->upload_id());
    response->set_found(status.has_value());
    if (!status) return grpc::Status::OK;

    const PipelineRecord& r = status->record;
    response->set_upload_id(r.upload_id);
    response->set_asset_id(r.asset_id);
    response->set_stage(ToString(r.stage));
    if (r.failed_stage) response->set_failed_stage(ToString(*r.failed_stage));
    response->set_error(r.error);
    response->set_upload_progress(status->upload_progress);
    response->set_transcode_progress(status->transcode_progress);
    for (const auto& id : r.distribution_platforms) response->add_distribution_platforms(id);
    response->set_transcode_batch_id(r.transcode_batch_id);
    response->set_forensic_signature(r.forensic_signature);
    for (const auto& t : status->targets) {
      auto* out = response->add_targets();
      out->set_platform_id(t.platform_id);
      out->set_status(ToString(t.status));
      out->set_attempts(t.attempts);
      out->set_remote_id(t.remote_id);
      out->set_error_message(t.error_message);
    }
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::PauseUpload(grpc::ServerContext* /*context*/,
                                            const pb::UploadControlRequest* request,
                                            pb::UploadControlResponse* response) {
  return Guarded("PauseUpload", [&] {
    response->set_success(coordinator_->PauseUpload(request->upload_id()));
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::ResumeUpload(grpc::ServerContext* /*context*/,
                                             const pb::UploadControlRequest* request,
                                             pb::UploadControlResponse* response) {
  return Guarded("ResumeUpload", [&] {
    response->set_success(coordinator_->ResumeUpload(request->upload_id()));
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::CancelUpload(grpc::ServerContext* /*context*/,
                                             const pb::UploadControlRequest* request,
                                             pb::UploadControlResponse* response) {
  return Guarded("CancelUpload", [&] {
    util::Logger::Info("[CancelUpload] Request received: upload_id=" + request->upload_id());
    response->set_success(coordinator_->CancelUpload(request->upload_id()));
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::GetUploadProgress(grpc::ServerContext* /*context*/,
                                                  const pb::GetUploadProgressRequest* request,
                                                  pb::UploadProgress* response) {
  return Guarded("GetUploadProgress", [&] {
    const auto progress = uploads_->GetProgress(request->upload_id());
    if (!progress) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND,
                          "upload session not found: " + request->upload_id());
    }
    response->set_upload_id(progress->upload_id);
    response->set_status(ToString(progress->status));
    response->set_percent(progress->percent);
    response->set_uploaded_chunks(progress->uploaded_chunks);
    response->set_total_chunks(progress->total_chunks);
    response->set_bytes_transferred(progress->bytes_transferred);
    response->set_total_bytes(progress->total_bytes);
    response->set_estimated_seconds_remaining(progress->estimated_seconds_remaining);
    response->set_bytes_per_second(progress->bytes_per_second);
    for (int64_t index : progress->missing_chunks) response->add_missing_chunks(index);
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::GetTranscodeStatus(grpc::ServerContext* /*context*/,
                                                   const pb::GetTranscodeStatusRequest* request,
                                                   pb::TranscodeStatus* response) {
  return Guarded("GetTranscodeStatus", [&] {
    const auto status = transcoder_->GetJobStatus(request->batch_id());
    if (!status) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND,
                          "transcode batch not found: " + request->batch_id());
    }
    response->set_batch_id(status->batch_id);
    response->set_asset_id(status->asset_id);
    response->set_total_variants(status->total_variants);
    response->set_completed(status->completed);
    response->set_failed(status->failed);
    response->set_processing(status->processing);
    response->set_queued(status->queued);
    response->set_overall_progress(status->overall_progress);
    response->set_finished(status->finished);
    for (const auto& job : status->jobs) {
      auto* out = response->add_jobs();
      out->set_job_id(job.job_id);
      out->set_preset(job.preset.key);
      out->set_status(ToString(job.status));
      out->set_progress_percent(job.progress_percent);
      out->set_output_location(job.output_location);
      out->set_output_size_bytes(job.output_size_bytes);
      out->set_watermark_applied(job.watermark_applied);
      out->set_error_message(job.error_message);
    }
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::GetAvailablePlatforms(
    grpc::ServerContext* /*context*/, const pb::GetAvailablePlatformsRequest* request,
    pb::GetAvailablePlatformsResponse* response) {
  return Guarded("GetAvailablePlatforms", [&] {
    for (const auto& p : tiers_->GetAvailablePlatforms(request->tier())) {
      FillPlatform(p, response->add_platforms());
    }
    response->set_max_platforms(distribution::TierPolicy::MaxPlatforms(request->tier()));
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::GetTierInfo(grpc::ServerContext* /*context*/,
                                            const pb::GetTierInfoRequest* request,
                                            pb::TierInfo* response) {
  return Guarded("GetTierInfo", [&] {
    const auto info = tiers_->GetTierInfo(request->tier());
    response->set_tier(info.tier);
    response->set_rank(info.rank);
    response->set_max_platforms(info.max_platforms);
    for (const auto& p : info.available_platforms) {
      FillPlatform(p, response->add_available_platforms());
    }
    for (const auto& b : info.benefits) response->add_benefits(b);
    return grpc::Status::OK;
  });
}

grpc::Status MediaPipelineImpl::SubscribePipelineEvents(
    grpc::ServerContext* context, const pb::SubscribePipelineEventsRequest* request,
    grpc::ServerWriter<pb::PipelineEvent>* writer) {
  const std::string filter = request->upload_id();
  util::Logger::Info("[SubscribePipelineEvents] Subscriber attached" +
                     (filter.empty() ? std::string() : " for " + filter));

  auto queue = std::make_shared<StreamQueue>();
  const auto subscription = events_->Subscribe([queue, filter](const pipeline::PipelineEvent& e) {
    if (!filter.empty() && e.upload_id != filter) return;
    {
      std::lock_guard<std::mutex> lock(queue->mutex);
      if (queue->events.size() >= kMaxQueuedStreamEvents) {
        queue->events.pop_front();
        ++queue->dropped;
      }
      queue->events.push_back(e);
    }
    queue->cv.notify_one();
  });

  bool writer_open = true;
  while (writer_open && !shutdown_.load(std::memory_order_acquire) && !context->IsCancelled()) {
    std::deque<pipeline::PipelineEvent> batch;
    {
      std::unique_lock<std::mutex> lock(queue->mutex);
      queue->cv.wait_for(lock, kStreamPollInterval, [&] { return !queue->events.empty(); });
      batch.swap(queue->events);
    }
    for (const auto& event : batch) {
      pb::PipelineEvent out;
      FillEvent(event, &out);
      if (!writer->Write(out)) {
        writer_open = false;
        break;
      }
    }
  }
  events_->Unsubscribe(subscription);

  uint64_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(queue->mutex);
    dropped = queue->dropped;
  }
  util::Logger::Info("[SubscribePipelineEvents] Subscriber detached (" + std::to_string(dropped) +
                     " event(s) dropped)");
  return grpc::Status::OK;
}

}  // namespace service
}  // namespace mediaforge
