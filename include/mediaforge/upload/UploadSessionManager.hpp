// Repository: MediaForge
// Component: Upload Session Manager
// Purpose: Chunked, resumable uploads. Owns per-upload chunk bookkeeping,
//          pause/resume/cancel and progress, drives the chunk store and
//          produces the raw MediaAsset once every chunk has landed.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_UPLOAD_UPLOAD_SESSION_MANAGER_HPP_
#define MEDIAFORGE_UPLOAD_UPLOAD_SESSION_MANAGER_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mediaforge/config/PipelineConfig.hpp"
#include "mediaforge/core/Types.hpp"
#include "mediaforge/forensic/IForensicService.hpp"
#include "mediaforge/storage/IChunkStore.hpp"
#include "mediaforge/storage/IPipelineRepository.hpp"
#include "mediaforge/time/ITimeSource.hpp"

namespace mediaforge::upload {

struct InitializeUploadResult {
  std::string upload_id;
  int64_t chunk_size = 0;
  int64_t total_chunks = 0;
};

struct ChunkUploadResult {
  bool success = false;
  std::string etag;        // Empty on failure
  std::string chunk_hash;  // Always set
  bool already_present = false;
  std::string error;
};

struct ChunkPayload {
  int64_t index = 0;
  std::string data;
};

struct BatchUploadResult {
  int successful = 0;
  int failed = 0;
  std::vector<int64_t> failed_indices;  // Ascending
};

// Caller-supplied facts about the media, recorded on the asset.
struct AssetMeta {
  int32_t width = 0;
  int32_t height = 0;
  int64_t duration_ms = 0;
};

struct UploadProgress {
  std::string upload_id;
  SessionStatus status = SessionStatus::kActive;
  double percent = 0.0;
  int64_t uploaded_chunks = 0;
  int64_t total_chunks = 0;
  int64_t bytes_transferred = 0;
  int64_t total_bytes = 0;
  int64_t estimated_seconds_remaining = 0;
  double bytes_per_second = 0.0;
  std::vector<int64_t> missing_chunks;
};

// Counts chunks for a file: ceil(total_size / chunk_size).
int64_t ComputeTotalChunks(int64_t total_size, int64_t chunk_size);

// MIME type from the filename extension; application/octet-stream otherwise.
std::string MimeTypeForFilename(const std::string& filename);

class UploadSessionManager {
 public:
  // Called after a session is discarded by cancel or staleness cleanup.
  using SessionEndedCallback =
      std::function<void(const std::string& upload_id, const std::string& reason)>;

  UploadSessionManager(const config::PipelineConfig& config,
                       std::shared_ptr<storage::IChunkStore> store,
                       std::shared_ptr<storage::IPipelineRepository> repository,
                       std::shared_ptr<forensic::IForensicService> forensics,
                       std::shared_ptr<time::ITimeSource> time_source);

  UploadSessionManager(const UploadSessionManager&) = delete;
  UploadSessionManager& operator=(const UploadSessionManager&) = delete;

  void SetSessionEndedCallback(SessionEndedCallback callback);

  // Throws PipelineError: kInvalidArgument (size <= 0, empty filename),
  // kBackingStoreUnavailable (multipart transaction could not be opened).
  InitializeUploadResult InitializeUpload(const std::string& filename, int64_t total_size,
                                          const std::string& mime_type,
                                          const OwnerMeta& owner);

  // Throws PipelineError: kSessionNotFound, kSessionPaused, kInvalidChunkIndex,
  // kInvalidArgument (wrong chunk length). A storage failure is returned as
  // success=false with the session untouched.
  ChunkUploadResult UploadChunk(const std::string& upload_id, int64_t chunk_index,
                                const std::string& data);

  // At most chunk_parallelism chunks in flight; the rest wait for a free slot.
  // Contract violations on individual chunks count as failures.
  BatchUploadResult UploadChunksBatch(const std::string& upload_id,
                                      const std::vector<ChunkPayload>& chunks);

  // Finalizes the object, hashes it, signs it and creates the MediaAsset.
  // Throws PipelineError: kSessionNotFound, kUploadIncomplete,
  // kUploadFinalizeFailure (the transaction is aborted and the session
  // dropped without a session-ended callback).
  std::string CompleteUpload(const std::string& upload_id, const AssetMeta& meta);

  // Return false if the session is unknown or not in the expected state.
  bool PauseUpload(const std::string& upload_id);
  bool ResumeUpload(const std::string& upload_id);
  bool CancelUpload(const std::string& upload_id);

  std::optional<UploadProgress> GetProgress(const std::string& upload_id) const;
  std::optional<UploadSession> GetSession(const std::string& upload_id) const;

  // Active and paused sessions.
  std::vector<UploadSession> ListActiveSessions() const;

  // Cancels sessions idle longer than the staleness threshold. Returns count.
  int CleanupStaleSessions();

  // Reloads active/paused sessions from the repository. Returns count.
  int RestoreSessions();

  const config::PipelineConfig& config() const { return config_; }

 private:
  UploadSession& RequireSessionLocked(const std::string& upload_id);
  void DiscardSession(const std::string& upload_id, const std::string& reason);

  config::PipelineConfig config_;
  std::shared_ptr<storage::IChunkStore> store_;
  std::shared_ptr<storage::IPipelineRepository> repository_;
  std::shared_ptr<forensic::IForensicService> forensics_;
  std::shared_ptr<time::ITimeSource> time_source_;

  mutable std::mutex mutex_;
  std::map<std::string, UploadSession> sessions_;
  SessionEndedCallback on_session_ended_;
};

}  // namespace mediaforge::upload

#endif  // MEDIAFORGE_UPLOAD_UPLOAD_SESSION_MANAGER_HPP_
