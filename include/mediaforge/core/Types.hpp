// Repository: MediaForge
// Component: Pipeline data model
// Purpose: Upload sessions, media assets, transcoding jobs, variants,
//          distribution targets and pipeline records. Plain value types;
//          ownership and mutation rules live in the managing components.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_CORE_TYPES_HPP_
#define MEDIAFORGE_CORE_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mediaforge {

enum class SessionStatus { kActive, kPaused, kCompleted, kFailed };
enum class ProcessingStatus { kPending, kProcessing, kCompleted, kFailed };
enum class JobStatus { kQueued, kProcessing, kCompleted, kFailed };
enum class DeliveryStatus { kPending, kDelivered, kFailed };
enum class OutputMode { kMp4, kHls, kDash };
enum class PipelineStage { kUploading, kTranscoding, kDistributing, kComplete, kFailed };

const char* ToString(SessionStatus s);
const char* ToString(ProcessingStatus s);
const char* ToString(JobStatus s);
const char* ToString(DeliveryStatus s);
const char* ToString(OutputMode m);
const char* ToString(PipelineStage s);

// Parsers return nullopt for unrecognised names.
std::optional<SessionStatus> ParseSessionStatus(const std::string& name);
std::optional<ProcessingStatus> ParseProcessingStatus(const std::string& name);
std::optional<JobStatus> ParseJobStatus(const std::string& name);
std::optional<DeliveryStatus> ParseDeliveryStatus(const std::string& name);
std::optional<OutputMode> ParseOutputMode(const std::string& name);
std::optional<PipelineStage> ParsePipelineStage(const std::string& name);

inline bool IsTerminal(JobStatus s) {
  return s == JobStatus::kCompleted || s == JobStatus::kFailed;
}

inline bool IsTerminal(PipelineStage s) {
  return s == PipelineStage::kComplete || s == PipelineStage::kFailed;
}

// Who owns an upload: creator, their home platform, their tenant.
struct OwnerMeta {
  std::string owner_id;
  std::string platform_id;
  std::string tenant_id;
};

struct ChunkRecord {
  std::string etag;        // Storage-assigned integrity token
  std::string chunk_hash;  // SHA-256 of the chunk bytes
  int64_t size_bytes = 0;
};

// One per in-flight upload.
// Invariants: every key of `chunks` is in [0, total_chunks);
// backing_upload_id is assigned before the first chunk and never changes.
struct UploadSession {
  std::string upload_id;
  std::string filename;
  std::string mime_type;
  OwnerMeta owner;
  int64_t total_size = 0;
  int64_t chunk_size = 0;
  int64_t total_chunks = 0;
  std::map<int64_t, ChunkRecord> chunks;  // chunk index → landed chunk
  SessionStatus status = SessionStatus::kActive;
  int64_t started_at_ms = 0;
  int64_t last_activity_at_ms = 0;
  std::string backing_upload_id;
  std::string object_key;

  int64_t UploadedCount() const { return static_cast<int64_t>(chunks.size()); }
  bool HasChunk(int64_t index) const { return chunks.count(index) != 0; }
  bool IsComplete() const { return UploadedCount() == total_chunks; }

  int64_t BytesTransferred() const {
    int64_t total = 0;
    for (const auto& [index, chunk] : chunks) total += chunk.size_bytes;
    return total;
  }
};

// Immutable output of a completed transcoding job.
struct QualityVariant {
  std::string quality;
  std::string url;
  int32_t width = 0;
  int32_t height = 0;
  int32_t bitrate_kbps = 0;
  int64_t file_size = 0;
  std::string codec;
};

// Durable raw object created when an upload session completes.
struct MediaAsset {
  std::string asset_id;
  OwnerMeta owner;
  std::string origin_filename;
  std::string content_hash;
  int64_t size_bytes = 0;
  std::string mime_type;
  std::string storage_location;
  std::string forensic_signature;
  std::vector<QualityVariant> quality_variants;
  ProcessingStatus processing_status = ProcessingStatus::kPending;
  std::string manifest_url;
  int32_t width = 0;
  int32_t height = 0;
  int64_t duration_ms = 0;
  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

// Named encode target.
struct QualityPreset {
  std::string key;    // "1080p"
  std::string label;  // "1080p Full HD"
  int32_t width = 0;
  int32_t height = 0;
  int32_t video_kbps = 0;
  int32_t audio_kbps = 0;
  int32_t maxrate_kbps = 0;
  int32_t bufsize_kbps = 0;
  int32_t fps = 0;
};

// One per (asset, preset).
// progress_percent never decreases while processing; terminal states are final.
struct TranscodingJob {
  std::string job_id;
  std::string batch_id;
  std::string asset_id;
  QualityPreset preset;
  std::string codec = "h264";
  JobStatus status = JobStatus::kQueued;
  int32_t progress_percent = 0;
  std::string output_location;
  int64_t output_size_bytes = 0;
  bool watermark_applied = false;
  std::string error_message;
  int64_t started_at_ms = 0;
  int64_t completed_at_ms = 0;
};

struct DistributionTarget {
  std::string asset_id;
  std::string platform_id;
  DeliveryStatus status = DeliveryStatus::kPending;
  int32_t attempts = 0;
  std::string remote_id;
  std::string error_message;
  int64_t updated_at_ms = 0;
};

// Provenance record written when an asset is created.
struct ForensicRecord {
  std::string asset_id;
  std::string signature_id;
  std::string owner_id;
  std::string platform_id;
  int64_t created_at_ms = 0;
};

// Per-upload pipeline state owned by the coordinator.
struct PipelineRecord {
  std::string upload_id;
  std::string asset_id;
  OwnerMeta owner;
  std::string tier;
  PipelineStage stage = PipelineStage::kUploading;
  std::optional<PipelineStage> failed_stage;
  std::string error;
  std::string forensic_signature;
  std::vector<std::string> distribution_platforms;
  std::string transcode_batch_id;
  bool auto_transcode = true;
  std::vector<std::string> presets;
  OutputMode output_mode = OutputMode::kHls;
  bool upload_complete = false;
  bool transcode_complete = false;
  bool distribution_complete = false;
  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

}  // namespace mediaforge

#endif  // MEDIAFORGE_CORE_TYPES_HPP_
