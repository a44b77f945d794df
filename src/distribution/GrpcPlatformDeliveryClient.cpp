// Repository: MediaForge
// Component: gRPC platform delivery client implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/distribution/GrpcPlatformDeliveryClient.hpp"

#include <chrono>

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/util/Logger.hpp"

namespace mediaforge::distribution {

namespace proto = mediaforge::ingest::v1;

GrpcPlatformDeliveryClient::GrpcPlatformDeliveryClient(
    std::map<std::string, std::string> endpoint_overrides, int64_t deadline_ms)
    : endpoint_overrides_(std::move(endpoint_overrides)), deadline_ms_(deadline_ms) {}

proto::ImportMediaRequest GrpcPlatformDeliveryClient::BuildRequest(const MediaAsset& asset) {
  proto::ImportMediaRequest request;
  request.set_asset_id(asset.asset_id);
  request.set_manifest_url(asset.manifest_url);
  for (const auto& v : asset.quality_variants) {
    auto* pv = request.add_variants();
    pv->set_quality(v.quality);
    pv->set_url(v.url);
    pv->set_width(v.width);
    pv->set_height(v.height);
    pv->set_bitrate_kbps(v.bitrate_kbps);
    pv->set_file_size(v.file_size);
    pv->set_codec(v.codec);
  }
  auto& metadata = *request.mutable_metadata();
  metadata["filename"] = asset.origin_filename;
  metadata["duration_ms"] = std::to_string(asset.duration_ms);
  metadata["forensic_signature"] = asset.forensic_signature;
  metadata["creator_id"] = asset.owner.owner_id;
  return request;
}

proto::PlatformIngest::Stub* GrpcPlatformDeliveryClient::StubFor(const std::string& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = stubs_.find(endpoint);
  if (it != stubs_.end()) return it->second.get();
  auto channel = grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
  channels_[endpoint] = channel;
  auto& stub = stubs_[endpoint];
  stub = proto::PlatformIngest::NewStub(channel);
  return stub.get();
}

std::string GrpcPlatformDeliveryClient::Deliver(const PlatformInfo& platform,
                                                const MediaAsset& asset) {
  auto override_it = endpoint_overrides_.find(platform.id);
  const std::string endpoint =
      override_it != endpoint_overrides_.end() ? override_it->second : platform.ingest_endpoint;
  if (endpoint.empty()) {
    throw PipelineError(ErrorCode::kPlatformDeliveryFailure,
                        "no ingest endpoint configured for " + platform.id);
  }

  proto::PlatformIngest::Stub* stub = StubFor(endpoint);
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() +
                       std::chrono::milliseconds(deadline_ms_));
  proto::ImportMediaResponse response;
  grpc::Status status = stub->ImportMedia(&context, BuildRequest(asset), &response);
  if (!status.ok()) {
    throw PipelineError(ErrorCode::kPlatformDeliveryFailure,
                        platform.name + " ImportMedia failed: " + status.error_message());
  }
  if (!response.accepted()) {
    throw PipelineError(ErrorCode::kPlatformDeliveryFailure,
                        platform.name + " rejected import: " + response.message());
  }
  util::Logger::Debug("[GrpcPlatformDeliveryClient] " + platform.id + " accepted " +
                      asset.asset_id + " as " + response.remote_id());
  return response.remote_id();
}

}  // namespace mediaforge::distribution
