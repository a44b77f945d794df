// Repository: MediaForge
// Component: Container-tag forensic marking
// Purpose: Signatures are "<prefix>-" + 20 uppercase hex characters, written
//          as container metadata by an encoder remux and read back by probe.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_FORENSIC_FFMPEG_FORENSIC_SERVICE_HPP_
#define MEDIAFORGE_FORENSIC_FFMPEG_FORENSIC_SERVICE_HPP_

#include <memory>
#include <optional>
#include <string>

#include "mediaforge/forensic/IForensicService.hpp"
#include "mediaforge/transcode/FfmpegCommandBuilder.hpp"
#include "mediaforge/transcode/ITranscodeRunner.hpp"
#include "mediaforge/transcode/MediaProbe.hpp"

namespace mediaforge::forensic {

constexpr const char* kSignatureTag = "forensic_signature";

class FfmpegForensicService : public IForensicService {
 public:
  FfmpegForensicService(std::string signature_prefix, transcode::EncoderOptions encoder,
                        std::shared_ptr<transcode::ITranscodeRunner> runner,
                        std::shared_ptr<transcode::IMediaProbe> probe);

  std::string GenerateSignature() override;
  void InjectSignature(const std::string& file_location, const std::string& signature_id,
                       const SignaturePayload& payload) override;
  std::optional<std::string> ExtractSignature(const std::string& file_location) override;

 private:
  std::string prefix_;
  transcode::EncoderOptions encoder_;
  std::shared_ptr<transcode::ITranscodeRunner> runner_;
  std::shared_ptr<transcode::IMediaProbe> probe_;
};

}  // namespace mediaforge::forensic

#endif  // MEDIAFORGE_FORENSIC_FFMPEG_FORENSIC_SERVICE_HPP_
