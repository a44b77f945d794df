// Repository: MediaForge
// Component: Pipeline error taxonomy
// Copyright (c) 2026 MediaForge

#include "mediaforge/core/Errors.hpp"

namespace mediaforge {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSessionNotFound: return "SESSION_NOT_FOUND";
    case ErrorCode::kInvalidChunkIndex: return "INVALID_CHUNK_INDEX";
    case ErrorCode::kSessionPaused: return "SESSION_PAUSED";
    case ErrorCode::kUploadIncomplete: return "UPLOAD_INCOMPLETE";
    case ErrorCode::kBackingStoreUnavailable: return "BACKING_STORE_UNAVAILABLE";
    case ErrorCode::kUploadFinalizeFailure: return "UPLOAD_FINALIZE_FAILURE";
    case ErrorCode::kUnknownPreset: return "UNKNOWN_PRESET";
    case ErrorCode::kSubprocessFailure: return "SUBPROCESS_FAILURE";
    case ErrorCode::kSignatureInjectionFailure: return "SIGNATURE_INJECTION_FAILURE";
    case ErrorCode::kInvalidPlatformSelection: return "INVALID_PLATFORM_SELECTION";
    case ErrorCode::kPlatformDeliveryFailure: return "PLATFORM_DELIVERY_FAILURE";
    case ErrorCode::kAssetNotFound: return "ASSET_NOT_FOUND";
    case ErrorCode::kPipelineNotFound: return "PIPELINE_NOT_FOUND";
    case ErrorCode::kInvalidArgument: return "INVALID_ARGUMENT";
    case ErrorCode::kIllegalTransition: return "ILLEGAL_TRANSITION";
    case ErrorCode::kInternal: return "INTERNAL";
  }
  return "INTERNAL";
}

}  // namespace mediaforge
