// Repository: MediaForge
// Component: Pipeline state <-> protobuf conversion
// Copyright (c) 2026 MediaForge

#include "storage/StateCodec.hpp"

#include <optional>
#include <stdexcept>

namespace mediaforge::storage::codec {

namespace {

template <typename T>
T Require(const std::optional<T>& parsed, const char* field, const std::string& raw) {
  if (!parsed) {
    throw std::invalid_argument(std::string("unknown ") + field + " '" + raw + "'");
  }
  return *parsed;
}

void ToProto(const OwnerMeta& in, pb::OwnerState* out) {
  out->set_owner_id(in.owner_id);
  out->set_platform_id(in.platform_id);
  out->set_tenant_id(in.tenant_id);
}

OwnerMeta FromProto(const pb::OwnerState& in) {
  OwnerMeta out;
  out.owner_id = in.owner_id();
  out.platform_id = in.platform_id();
  out.tenant_id = in.tenant_id();
  return out;
}

void ToProto(const QualityVariant& in, pb::QualityVariantState* out) {
  out->set_quality(in.quality);
  out->set_url(in.url);
  out->set_width(in.width);
  out->set_height(in.height);
  out->set_bitrate_kbps(in.bitrate_kbps);
  out->set_file_size(in.file_size);
  out->set_codec(in.codec);
}

QualityVariant FromProto(const pb::QualityVariantState& in) {
  QualityVariant out;
  out.quality = in.quality();
  out.url = in.url();
  out.width = in.width();
  out.height = in.height();
  out.bitrate_kbps = in.bitrate_kbps();
  out.file_size = in.file_size();
  out.codec = in.codec();
  return out;
}

void ToProto(const QualityPreset& in, pb::QualityPresetState* out) {
  out->set_key(in.key);
  out->set_label(in.label);
  out->set_width(in.width);
  out->set_height(in.height);
  out->set_video_kbps(in.video_kbps);
  out->set_audio_kbps(in.audio_kbps);
  out->set_maxrate_kbps(in.maxrate_kbps);
  out->set_bufsize_kbps(in.bufsize_kbps);
  out->set_fps(in.fps);
}

QualityPreset FromProto(const pb::QualityPresetState& in) {
  QualityPreset out;
  out.key = in.key();
  out.label = in.label();
  out.width = in.width();
  out.height = in.height();
  out.video_kbps = in.video_kbps();
  out.audio_kbps = in.audio_kbps();
  out.maxrate_kbps = in.maxrate_kbps();
  out.bufsize_kbps = in.bufsize_kbps();
  out.fps = in.fps();
  return out;
}

}  // namespace

void ToProto(const UploadSession& in, pb::UploadSessionState* out) {
  out->set_upload_id(in.upload_id);
  out->set_filename(in.filename);
  out->set_mime_type(in.mime_type);
  ToProto(in.owner, out->mutable_owner());
  out->set_total_size(in.total_size);
  out->set_chunk_size(in.chunk_size);
  out->set_total_chunks(in.total_chunks);
  for (const auto& [index, chunk] : in.chunks) {
    auto* c = out->add_chunks();
    c->set_index(index);
    c->set_etag(chunk.etag);
    c->set_chunk_hash(chunk.chunk_hash);
    c->set_size_bytes(chunk.size_bytes);
  }
  out->set_status(ToString(in.status));
  out->set_started_at_ms(in.started_at_ms);
  out->set_last_activity_at_ms(in.last_activity_at_ms);
  out->set_backing_upload_id(in.backing_upload_id);
  out->set_object_key(in.object_key);
}

UploadSession FromProto(const pb::UploadSessionState& in) {
  UploadSession out;
  out.upload_id = in.upload_id();
  out.filename = in.filename();
  out.mime_type = in.mime_type();
  out.owner = FromProto(in.owner());
  out.total_size = in.total_size();
  out.chunk_size = in.chunk_size();
  out.total_chunks = in.total_chunks();
  for (const auto& c : in.chunks()) {
    if (c.index() < 0 || c.index() >= out.total_chunks) {
      throw std::invalid_argument("chunk index out of range: " + std::to_string(c.index()));
    }
    ChunkRecord& chunk = out.chunks[c.index()];
    chunk.etag = c.etag();
    chunk.chunk_hash = c.chunk_hash();
    chunk.size_bytes = c.size_bytes();
  }
  out.status = Require(ParseSessionStatus(in.status()), "session status", in.status());
  out.started_at_ms = in.started_at_ms();
  out.last_activity_at_ms = in.last_activity_at_ms();
  out.backing_upload_id = in.backing_upload_id();
  out.object_key = in.object_key();
  return out;
}

void ToProto(const MediaAsset& in, pb::MediaAssetState* out) {
  out->set_asset_id(in.asset_id);
  ToProto(in.owner, out->mutable_owner());
  out->set_origin_filename(in.origin_filename);
  out->set_content_hash(in.content_hash);
  out->set_size_bytes(in.size_bytes);
  out->set_mime_type(in.mime_type);
  out->set_storage_location(in.storage_location);
  out->set_forensic_signature(in.forensic_signature);
  for (const auto& v : in.quality_variants) ToProto(v, out->add_quality_variants());
  out->set_processing_status(ToString(in.processing_status));
  out->set_manifest_url(in.manifest_url);
  out->set_width(in.width);
  out->set_height(in.height);
  out->set_duration_ms(in.duration_ms);
  out->set_created_at_ms(in.created_at_ms);
  out->set_updated_at_ms(in.updated_at_ms);
}

MediaAsset FromProto(const pb::MediaAssetState& in) {
  MediaAsset out;
  out.asset_id = in.asset_id();
  out.owner = FromProto(in.owner());
  out.origin_filename = in.origin_filename();
  out.content_hash = in.content_hash();
  out.size_bytes = in.size_bytes();
  out.mime_type = in.mime_type();
  out.storage_location = in.storage_location();
  out.forensic_signature = in.forensic_signature();
  for (const auto& v : in.quality_variants()) out.quality_variants.push_back(FromProto(v));
  out.processing_status = Require(ParseProcessingStatus(in.processing_status()),
                                  "processing status", in.processing_status());
  out.manifest_url = in.manifest_url();
  out.width = in.width();
  out.height = in.height();
  out.duration_ms = in.duration_ms();
  out.created_at_ms = in.created_at_ms();
  out.updated_at_ms = in.updated_at_ms();
  return out;
}

void ToProto(const TranscodingJob& in, pb::TranscodingJobState* out) {
  out->set_job_id(in.job_id);
  out->set_batch_id(in.batch_id);
  out->set_asset_id(in.asset_id);
  ToProto(in.preset, out->mutable_preset());
  out->set_codec(in.codec);
  out->set_status(ToString(in.status));
  out->set_progress_percent(in.progress_percent);
  out->set_output_location(in.output_location);
  out->set_output_size_bytes(in.output_size_bytes);
  out->set_watermark_applied(in.watermark_applied);
  out->set_error_message(in.error_message);
  out->set_started_at_ms(in.started_at_ms);
  out->set_completed_at_ms(in.completed_at_ms);
}

TranscodingJob FromProto(const pb::TranscodingJobState& in) {
  TranscodingJob out;
  out.job_id = in.job_id();
  out.batch_id = in.batch_id();
  out.asset_id = in.asset_id();
  out.preset = FromProto(in.preset());
  out.codec = in.codec();
  out.status = Require(ParseJobStatus(in.status()), "job status", in.status());
  out.progress_percent = in.progress_percent();
  out.output_location = in.output_location();
  out.output_size_bytes = in.output_size_bytes();
  out.watermark_applied = in.watermark_applied();
  out.error_message = in.error_message();
  out.started_at_ms = in.started_at_ms();
  out.completed_at_ms = in.completed_at_ms();
  return out;
}

void ToProto(const DistributionTarget& in, pb::DistributionTargetState* out) {
  out->set_asset_id(in.asset_id);
  out->set_platform_id(in.platform_id);
  out->set_status(ToString(in.status));
  out->set_attempts(in.attempts);
  out->set_remote_id(in.remote_id);
  out->set_error_message(in.error_message);
  out->set_updated_at_ms(in.updated_at_ms);
}

DistributionTarget FromProto(const pb::DistributionTargetState& in) {
  DistributionTarget out;
  out.asset_id = in.asset_id();
  out.platform_id = in.platform_id();
  out.status = Require(ParseDeliveryStatus(in.status()), "delivery status", in.status());
  out.attempts = in.attempts();
  out.remote_id = in.remote_id();
  out.error_message = in.error_message();
  out.updated_at_ms = in.updated_at_ms();
  return out;
}

void ToProto(const ForensicRecord& in, pb::ForensicRecordState* out) {
  out->set_asset_id(in.asset_id);
  out->set_signature_id(in.signature_id);
  out->set_owner_id(in.owner_id);
  out->set_platform_id(in.platform_id);
  out->set_created_at_ms(in.created_at_ms);
}

ForensicRecord FromProto(const pb::ForensicRecordState& in) {
  ForensicRecord out;
  out.asset_id = in.asset_id();
  out.signature_id = in.signature_id();
  out.owner_id = in.owner_id();
  out.platform_id = in.platform_id();
  out.created_at_ms = in.created_at_ms();
  return out;
}

void ToProto(const PipelineRecord& in, pb::PipelineRecordState* out) {
  out->set_upload_id(in.upload_id);
  out->set_asset_id(in.asset_id);
  ToProto(in.owner, out->mutable_owner());
  out->set_tier(in.tier);
  out->set_stage(ToString(in.stage));
  if (in.failed_stage) out->set_failed_stage(ToString(*in.failed_stage));
  out->set_error(in.error);
  out->set_forensic_signature(in.forensic_signature);
  for (const auto& p : in.distribution_platforms) out->add_distribution_platforms(p);
  out->set_transcode_batch_id(in.transcode_batch_id);
  out->set_auto_transcode(in.auto_transcode);
  for (const auto& p : in.presets) out->add_presets(p);
  out->set_output_mode(ToString(in.output_mode));
  out->set_upload_complete(in.upload_complete);
  out->set_transcode_complete(in.transcode_complete);
  out->set_distribution_complete(in.distribution_complete);
  out->set_created_at_ms(in.created_at_ms);
  out->set_updated_at_ms(in.updated_at_ms);
}

PipelineRecord FromProto(const pb::PipelineRecordState& in) {
  PipelineRecord out;
  out.upload_id = in.upload_id();
  out.asset_id = in.asset_id();
  out.owner = FromProto(in.owner());
  out.tier = in.tier();
  out.stage = Require(ParsePipelineStage(in.stage()), "pipeline stage", in.stage());
  if (!in.failed_stage().empty()) {
    out.failed_stage = Require(ParsePipelineStage(in.failed_stage()), "pipeline stage",
                               in.failed_stage());
  }
  out.error = in.error();
  out.forensic_signature = in.forensic_signature();
  out.distribution_platforms.assign(in.distribution_platforms().begin(),
                                    in.distribution_platforms().end());
  out.transcode_batch_id = in.transcode_batch_id();
  out.auto_transcode = in.auto_transcode();
  out.presets.assign(in.presets().begin(), in.presets().end());
  out.output_mode = Require(ParseOutputMode(in.output_mode()), "output mode", in.output_mode());
  out.upload_complete = in.upload_complete();
  out.transcode_complete = in.transcode_complete();
  out.distribution_complete = in.distribution_complete();
  out.created_at_ms = in.created_at_ms();
  out.updated_at_ms = in.updated_at_ms();
  return out;
}

}  // namespace mediaforge::storage::codec
