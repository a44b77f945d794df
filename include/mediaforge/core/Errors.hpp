// Repository: MediaForge
// Component: Pipeline error taxonomy
// Purpose: Error codes for upload, transcode and distribution failures and
//          the exception type that carries them across component boundaries.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_CORE_ERRORS_HPP_
#define MEDIAFORGE_CORE_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace mediaforge {

enum class ErrorCode {
  // Upload side
  kSessionNotFound,
  kInvalidChunkIndex,
  kSessionPaused,
  kUploadIncomplete,
  kBackingStoreUnavailable,
  kUploadFinalizeFailure,
  // Transcode side
  kUnknownPreset,
  kSubprocessFailure,
  kSignatureInjectionFailure,
  // Distribution side
  kInvalidPlatformSelection,
  kPlatformDeliveryFailure,
  // Cross-cutting
  kAssetNotFound,
  kPipelineNotFound,
  kInvalidArgument,
  kIllegalTransition,
  kInternal,
};

// Stable, upper-snake name used in logs and on the wire.
const char* ErrorCodeName(ErrorCode code);

// Thrown for contract violations. Per-unit recoverable failures (a chunk
// write, a single transcode job, one platform delivery) are reported in
// result structs instead.
class PipelineError : public std::runtime_error {
 public:
  PipelineError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace mediaforge

#endif  // MEDIAFORGE_CORE_ERRORS_HPP_
