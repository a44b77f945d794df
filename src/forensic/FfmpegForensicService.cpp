// Repository: MediaForge
// Component: Container-tag forensic marking implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/forensic/FfmpegForensicService.hpp"

#include <cstdio>
#include <map>

#include <unistd.h>

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/util/Ids.hpp"
#include "mediaforge/util/Logger.hpp"

namespace mediaforge::forensic {

FfmpegForensicService::FfmpegForensicService(std::string signature_prefix,
                                             transcode::EncoderOptions encoder,
                                             std::shared_ptr<transcode::ITranscodeRunner> runner,
                                             std::shared_ptr<transcode::IMediaProbe> probe)
    : prefix_(std::move(signature_prefix)),
      encoder_(std::move(encoder)),
      runner_(std::move(runner)),
      probe_(std::move(probe)) {}

std::string FfmpegForensicService::GenerateSignature() {
  return prefix_ + "-" + util::RandomHexUpper(10);
}

void FfmpegForensicService::InjectSignature(const std::string& file_location,
                                            const std::string& signature_id,
                                            const SignaturePayload& payload) {
  std::map<std::string, std::string> tags = payload;
  tags[kSignatureTag] = signature_id;
  tags["protected"] = "true";

  const std::string signed_path = file_location + ".signed.mp4";
  const auto args = transcode::BuildMetadataArgs(encoder_, file_location, signed_path, tags);
  int exit_code = 0;
  try {
    exit_code = runner_->Run(args, nullptr);
  } catch (const std::exception& e) {
    unlink(signed_path.c_str());
    throw PipelineError(ErrorCode::kSignatureInjectionFailure,
                        std::string("signature remux failed to start: ") + e.what());
  }
  if (exit_code != 0) {
    unlink(signed_path.c_str());
    throw PipelineError(ErrorCode::kSignatureInjectionFailure,
                        "signature remux exited with code " + std::to_string(exit_code));
  }
  if (std::rename(signed_path.c_str(), file_location.c_str()) != 0) {
    unlink(signed_path.c_str());
    throw PipelineError(ErrorCode::kSignatureInjectionFailure,
                        "cannot replace " + file_location + " with signed copy");
  }
  util::Logger::Info("[ForensicService] Signature injected: " + signature_id);
}

std::optional<std::string> FfmpegForensicService::ExtractSignature(
    const std::string& file_location) {
  if (!probe_) return std::nullopt;
  auto probed = probe_->Probe(file_location);
  if (!probed) return std::nullopt;
  auto it = probed->tags.find(kSignatureTag);
  if (it == probed->tags.end()) return std::nullopt;
  return it->second;
}

}  // namespace mediaforge::forensic
