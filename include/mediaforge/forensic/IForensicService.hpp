// Repository: MediaForge
// Component: Forensic signature service interface
// Purpose: Black-box provenance marking: generate an opaque signature id,
//          embed it into a media file, read it back.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_FORENSIC_I_FORENSIC_SERVICE_HPP_
#define MEDIAFORGE_FORENSIC_I_FORENSIC_SERVICE_HPP_

#include <map>
#include <optional>
#include <string>

namespace mediaforge::forensic {

// Extra tags written next to the signature (creator, asset, timestamp...).
using SignaturePayload = std::map<std::string, std::string>;

class IForensicService {
 public:
  virtual ~IForensicService() = default;

  virtual std::string GenerateSignature() = 0;

  // Embeds `signature_id` and `payload` into the file in place. The file is
  // either fully marked or left untouched. Throws
  // PipelineError(kSignatureInjectionFailure).
  virtual void InjectSignature(const std::string& file_location,
                               const std::string& signature_id,
                               const SignaturePayload& payload) = 0;

  // nullopt if the file carries no signature or cannot be read.
  virtual std::optional<std::string> ExtractSignature(const std::string& file_location) = 0;
};

}  // namespace mediaforge::forensic

#endif  // MEDIAFORGE_FORENSIC_I_FORENSIC_SERVICE_HPP_
