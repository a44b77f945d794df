// Repository: MediaForge
// Component: Pipeline data model
// Copyright (c) 2026 MediaForge

#include "mediaforge/core/Types.hpp"

namespace mediaforge {

const char* ToString(SessionStatus s) {
  switch (s) {
    case SessionStatus::kActive: return "active";
    case SessionStatus::kPaused: return "paused";
    case SessionStatus::kCompleted: return "completed";
    case SessionStatus::kFailed: return "failed";
  }
  return "failed";
}

const char* ToString(ProcessingStatus s) {
  switch (s) {
    case ProcessingStatus::kPending: return "pending";
    case ProcessingStatus::kProcessing: return "processing";
    case ProcessingStatus::kCompleted: return "completed";
    case ProcessingStatus::kFailed: return "failed";
  }
  return "failed";
}

const char* ToString(JobStatus s) {
  switch (s) {
    case JobStatus::kQueued: return "queued";
    case JobStatus::kProcessing: return "processing";
    case JobStatus::kCompleted: return "completed";
    case JobStatus::kFailed: return "failed";
  }
  return "failed";
}

const char* ToString(DeliveryStatus s) {
  switch (s) {
    case DeliveryStatus::kPending: return "pending";
    case DeliveryStatus::kDelivered: return "delivered";
    case DeliveryStatus::kFailed: return "failed";
  }
  return "failed";
}

const char* ToString(OutputMode m) {
  switch (m) {
    case OutputMode::kMp4: return "mp4";
    case OutputMode::kHls: return "hls";
    case OutputMode::kDash: return "dash";
  }
  return "mp4";
}

const char* ToString(PipelineStage s) {
  switch (s) {
    case PipelineStage::kUploading: return "uploading";
    case PipelineStage::kTranscoding: return "transcoding";
    case PipelineStage::kDistributing: return "distributing";
    case PipelineStage::kComplete: return "complete";
    case PipelineStage::kFailed: return "failed";
  }
  return "failed";
}

std::optional<SessionStatus> ParseSessionStatus(const std::string& name) {
  if (name == "active") return SessionStatus::kActive;
  if (name == "paused") return SessionStatus::kPaused;
  if (name == "completed") return SessionStatus::kCompleted;
  if (name == "failed") return SessionStatus::kFailed;
  return std::nullopt;
}

std::optional<ProcessingStatus> ParseProcessingStatus(const std::string& name) {
  if (name == "pending") return ProcessingStatus::kPending;
  if (name == "processing") return ProcessingStatus::kProcessing;
  if (name == "completed") return ProcessingStatus::kCompleted;
  if (name == "failed") return ProcessingStatus::kFailed;
  return std::nullopt;
}

std::optional<JobStatus> ParseJobStatus(const std::string& name) {
  if (name == "queued") return JobStatus::kQueued;
  if (name == "processing") return JobStatus::kProcessing;
  if (name == "completed") return JobStatus::kCompleted;
  if (name == "failed") return JobStatus::kFailed;
  return std::nullopt;
}

std::optional<DeliveryStatus> ParseDeliveryStatus(const std::string& name) {
  if (name == "pending") return DeliveryStatus::kPending;
  if (name == "delivered") return DeliveryStatus::kDelivered;
  if (name == "failed") return DeliveryStatus::kFailed;
  return std::nullopt;
}

std::optional<OutputMode> ParseOutputMode(const std::string& name) {
  if (name == "mp4") return OutputMode::kMp4;
  if (name == "hls") return OutputMode::kHls;
  if (name == "dash") return OutputMode::kDash;
  return std::nullopt;
}

std::optional<PipelineStage> ParsePipelineStage(const std::string& name) {
  if (name == "uploading") return PipelineStage::kUploading;
  if (name == "transcoding") return PipelineStage::kTranscoding;
  if (name == "distributing") return PipelineStage::kDistributing;
  if (name == "complete") return PipelineStage::kComplete;
  if (name == "failed") return PipelineStage::kFailed;
  return std::nullopt;
}

}  // namespace mediaforge
