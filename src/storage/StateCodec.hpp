// Repository: MediaForge
// Component: Pipeline state <-> protobuf conversion
// Purpose: Maps the in-memory model onto pipeline_state.proto messages for
//          the journal. FromProto throws std::invalid_argument on unknown
//          enum names so a damaged record is rejected as a whole.
// Copyright (c) 2026 MediaForge

#pragma once

#include "mediaforge/core/Types.hpp"
#include "pipeline_state.pb.h"

namespace mediaforge::storage::codec {

namespace pb = ::mediaforge::state::v1;

void ToProto(const UploadSession& in, pb::UploadSessionState* out);
void ToProto(const MediaAsset& in, pb::MediaAssetState* out);
void ToProto(const TranscodingJob& in, pb::TranscodingJobState* out);
void ToProto(const DistributionTarget& in, pb::DistributionTargetState* out);
void ToProto(const ForensicRecord& in, pb::ForensicRecordState* out);
void ToProto(const PipelineRecord& in, pb::PipelineRecordState* out);

UploadSession FromProto(const pb::UploadSessionState& in);
MediaAsset FromProto(const pb::MediaAssetState& in);
TranscodingJob FromProto(const pb::TranscodingJobState& in);
DistributionTarget FromProto(const pb::DistributionTargetState& in);
ForensicRecord FromProto(const pb::ForensicRecordState& in);
PipelineRecord FromProto(const pb::PipelineRecordState& in);

}  // namespace mediaforge::storage::codec
