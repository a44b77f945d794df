// Repository: MediaForge
// Component: gRPC platform delivery client
// Purpose: Calls PlatformIngest.ImportMedia on the destination platform.
//          One channel per endpoint, created on first use and reused.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_DISTRIBUTION_GRPC_PLATFORM_DELIVERY_CLIENT_HPP_
#define MEDIAFORGE_DISTRIBUTION_GRPC_PLATFORM_DELIVERY_CLIENT_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>
#include "platform_ingest.grpc.pb.h"

#include "mediaforge/distribution/IPlatformDelivery.hpp"

namespace mediaforge::distribution {

class GrpcPlatformDeliveryClient : public IPlatformDelivery {
 public:
  // `endpoint_overrides` maps platform id to host:port and wins over the
  // catalog's ingest_endpoint.
  GrpcPlatformDeliveryClient(std::map<std::string, std::string> endpoint_overrides,
                             int64_t deadline_ms = 30000);

  std::string Deliver(const PlatformInfo& platform, const MediaAsset& asset) override;

  static ingest::v1::ImportMediaRequest BuildRequest(const MediaAsset& asset);

 private:
  ingest::v1::PlatformIngest::Stub* StubFor(const std::string& endpoint);

  std::map<std::string, std::string> endpoint_overrides_;
  int64_t deadline_ms_;

  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<grpc::Channel>> channels_;
  std::map<std::string, std::unique_ptr<ingest::v1::PlatformIngest::Stub>> stubs_;
};

}  // namespace mediaforge::distribution

#endif  // MEDIAFORGE_DISTRIBUTION_GRPC_PLATFORM_DELIVERY_CLIENT_HPP_
