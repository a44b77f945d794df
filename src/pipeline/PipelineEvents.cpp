// Repository: MediaForge
// Component: Pipeline events
// Copyright (c) 2026 MediaForge

#include "mediaforge/pipeline/PipelineEvents.hpp"

namespace mediaforge::pipeline {

namespace {

constexpr PipelineEventType kAllTypes[] = {
    PipelineEventType::kPipelineStarted,   PipelineEventType::kChunkStored,
    PipelineEventType::kUploadCompleted,   PipelineEventType::kUploadCancelled,
    PipelineEventType::kTranscodeQueued,   PipelineEventType::kJobProgress,
    PipelineEventType::kJobCompleted,      PipelineEventType::kJobFailed,
    PipelineEventType::kTranscodeFinished, PipelineEventType::kPlatformDelivered,
    PipelineEventType::kPlatformFailed,    PipelineEventType::kStageChanged,
    PipelineEventType::kPipelineFailed,
};

}  // namespace

const char* ToString(PipelineEventType type) {
  switch (type) {
    case PipelineEventType::kPipelineStarted: return "PIPELINE_STARTED";
    case PipelineEventType::kChunkStored: return "CHUNK_STORED";
    case PipelineEventType::kUploadCompleted: return "UPLOAD_COMPLETED";
    case PipelineEventType::kUploadCancelled: return "UPLOAD_CANCELLED";
    case PipelineEventType::kTranscodeQueued: return "TRANSCODE_QUEUED";
    case PipelineEventType::kJobProgress: return "JOB_PROGRESS";
    case PipelineEventType::kJobCompleted: return "JOB_COMPLETED";
    case PipelineEventType::kJobFailed: return "JOB_FAILED";
    case PipelineEventType::kTranscodeFinished: return "TRANSCODE_FINISHED";
    case PipelineEventType::kPlatformDelivered: return "PLATFORM_DELIVERED";
    case PipelineEventType::kPlatformFailed: return "PLATFORM_FAILED";
    case PipelineEventType::kStageChanged: return "STAGE_CHANGED";
    case PipelineEventType::kPipelineFailed: return "PIPELINE_FAILED";
  }
  return "UNKNOWN";
}

std::optional<PipelineEventType> ParsePipelineEventType(const std::string& name) {
  for (PipelineEventType type : kAllTypes) {
    if (name == ToString(type)) return type;
  }
  return std::nullopt;
}

bool IsAuditable(PipelineEventType type) {
  switch (type) {
    case PipelineEventType::kUploadCompleted:
    case PipelineEventType::kUploadCancelled:
    case PipelineEventType::kJobFailed:
    case PipelineEventType::kPlatformFailed:
    case PipelineEventType::kPipelineFailed:
      return true;
    default:
      return false;
  }
}

}  // namespace mediaforge::pipeline
