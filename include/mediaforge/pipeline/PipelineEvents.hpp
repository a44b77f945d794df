// Repository: MediaForge
// Component: Pipeline events
// Purpose: Notifications emitted by the coordinator as uploads, transcodes
//          and deliveries progress. Delivered through PipelineEventBus.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_PIPELINE_PIPELINE_EVENTS_HPP_
#define MEDIAFORGE_PIPELINE_PIPELINE_EVENTS_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace mediaforge::pipeline {

enum class PipelineEventType {
  kPipelineStarted,
  kChunkStored,
  kUploadCompleted,
  kUploadCancelled,
  kTranscodeQueued,
  kJobProgress,
  kJobCompleted,
  kJobFailed,
  kTranscodeFinished,
  kPlatformDelivered,
  kPlatformFailed,
  kStageChanged,
  kPipelineFailed,
};

// "PIPELINE_STARTED", "CHUNK_STORED", ...
const char* ToString(PipelineEventType type);
std::optional<PipelineEventType> ParsePipelineEventType(const std::string& name);

// Failures, cancellations and completed uploads go to the audit sink.
bool IsAuditable(PipelineEventType type);

struct PipelineEvent {
  PipelineEventType type = PipelineEventType::kPipelineStarted;
  std::string upload_id;
  std::string asset_id;
  std::string batch_id;
  std::string job_id;
  std::string platform_id;
  std::string stage;        // Current pipeline stage name
  double progress = 0.0;    // Percent, where meaningful
  std::string message;
  int64_t emitted_utc_ms = 0;
};

}  // namespace mediaforge::pipeline

#endif  // MEDIAFORGE_PIPELINE_PIPELINE_EVENTS_HPP_
