// Repository: MediaForge
// Component: Upload Session Manager implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/upload/UploadSessionManager.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <thread>

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/util/Ids.hpp"
#include "mediaforge/util/Logger.hpp"
#include "mediaforge/util/Sha256.hpp"

namespace mediaforge::upload {

namespace {

// Filenames become the last segment of the object key.
std::string SanitizeFilename(const std::string& filename) {
  std::string out;
  out.reserve(filename.size());
  for (char c : filename) {
    const unsigned char uc = static_cast<unsigned char>(c);
    out += (std::isalnum(uc) || c == '.' || c == '-' || c == '_') ? c : '_';
  }
  if (out.empty() || out == "." || out == "..") return "source";
  return out;
}

int64_t ExpectedChunkLength(const UploadSession& session, int64_t index) {
  if (index + 1 < session.total_chunks) return session.chunk_size;
  return session.total_size - (session.total_chunks - 1) * session.chunk_size;
}

bool IsOpen(SessionStatus status) {
  return status == SessionStatus::kActive || status == SessionStatus::kPaused;
}

}  // namespace

int64_t ComputeTotalChunks(int64_t total_size, int64_t chunk_size) {
  if (total_size <= 0 || chunk_size <= 0) return 0;
  return (total_size + chunk_size - 1) / chunk_size;
}

std::string MimeTypeForFilename(const std::string& filename) {
  static const std::map<std::string, std::string> kTypes = {
      {"mp4", "video/mp4"},       {"webm", "video/webm"},  {"mov", "video/quicktime"},
      {"avi", "video/x-msvideo"}, {"jpg", "image/jpeg"},   {"jpeg", "image/jpeg"},
      {"png", "image/png"},       {"gif", "image/gif"},    {"mp3", "audio/mpeg"},
      {"wav", "audio/wav"},
  };
  const size_t dot = filename.find_last_of('.');
  if (dot == std::string::npos) return "application/octet-stream";
  std::string ext = filename.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = kTypes.find(ext);
  return it == kTypes.end() ? "application/octet-stream" : it->second;
}

UploadSessionManager::UploadSessionManager(
    const config::PipelineConfig& config, std::shared_ptr<storage::IChunkStore> store,
    std::shared_ptr<storage::IPipelineRepository> repository,
    std::shared_ptr<forensic::IForensicService> forensics,
    std::shared_ptr<time::ITimeSource> time_source)
    : config_(config),
      store_(std::move(store)),
      repository_(std::move(repository)),
      forensics_(std::move(forensics)),
      time_source_(std::move(time_source)) {}

void UploadSessionManager::SetSessionEndedCallback(SessionEndedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_session_ended_ = std::move(callback);
}

InitializeUploadResult UploadSessionManager::InitializeUpload(const std::string& filename,
                                                              int64_t total_size,
                                                              const std::string& mime_type,
                                                              const OwnerMeta& owner) {
  if (filename.empty()) {
    throw PipelineError(ErrorCode::kInvalidArgument, "filename is required");
  }
  if (total_size <= 0) {
    throw PipelineError(ErrorCode::kInvalidArgument,
                        "total size must be positive, got " + std::to_string(total_size));
  }

  UploadSession session;
  session.upload_id = util::GenerateId("upload");
  session.filename = filename;
  session.mime_type = mime_type.empty() ? MimeTypeForFilename(filename) : mime_type;
  session.owner = owner;
  session.total_size = total_size;
  session.chunk_size = config_.chunk_size_bytes;
  session.total_chunks = ComputeTotalChunks(total_size, config_.chunk_size_bytes);
  session.status = SessionStatus::kActive;
  session.started_at_ms = time_source_->NowUtcMs();
  session.last_activity_at_ms = session.started_at_ms;
  session.object_key = "uploads/" + session.upload_id + "/" + SanitizeFilename(filename);

  const std::map<std::string, std::string> metadata = {
      {"owner_id", owner.owner_id},
      {"platform_id", owner.platform_id},
      {"tenant_id", owner.tenant_id},
      {"filename", filename},
      {"mime_type", session.mime_type},
  };
  try {
    session.backing_upload_id = store_->OpenMultipartTransaction(session.object_key, metadata);
  } catch (const PipelineError&) {
    throw;
  } catch (const std::exception& e) {
    throw PipelineError(ErrorCode::kBackingStoreUnavailable,
                        std::string("cannot open multipart transaction: ") + e.what());
  }

  InitializeUploadResult result{session.upload_id, session.chunk_size, session.total_chunks};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    repository_->PutSession(session);
    sessions_.emplace(session.upload_id, std::move(session));
  }
  util::Logger::Info("[UploadSessionManager] Session initialized: " + result.upload_id + " (" +
                     std::to_string(result.total_chunks) + " chunks)");
  return result;
}

UploadSession& UploadSessionManager::RequireSessionLocked(const std::string& upload_id) {
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end() || !IsOpen(it->second.status)) {
    throw PipelineError(ErrorCode::kSessionNotFound, "upload session not found: " + upload_id);
  }
  return it->second;
}

ChunkUploadResult UploadSessionManager::UploadChunk(const std::string& upload_id,
                                                    int64_t chunk_index,
                                                    const std::string& data) {
  ChunkUploadResult result;
  result.chunk_hash = util::Sha256::HexDigest(data);

  std::string txn_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    UploadSession& session = RequireSessionLocked(upload_id);
    if (session.status == SessionStatus::kPaused) {
      throw PipelineError(ErrorCode::kSessionPaused, "upload session is paused: " + upload_id);
    }
    if (chunk_index < 0 || chunk_index >= session.total_chunks) {
      throw PipelineError(ErrorCode::kInvalidChunkIndex,
                          "chunk index " + std::to_string(chunk_index) + " outside [0, " +
                              std::to_string(session.total_chunks) + ")");
    }
    auto existing = session.chunks.find(chunk_index);
    if (existing != session.chunks.end()) {
      result.success = true;
      result.etag = existing->second.etag;
      result.already_present = true;
      return result;
    }
    const int64_t expected = ExpectedChunkLength(session, chunk_index);
    if (static_cast<int64_t>(data.size()) != expected) {
      throw PipelineError(ErrorCode::kInvalidArgument,
                          "chunk " + std::to_string(chunk_index) + " must be " +
                              std::to_string(expected) + " bytes, got " +
                              std::to_string(data.size()));
    }
    txn_id = session.backing_upload_id;
  }

  std::string etag;
  try {
    etag = store_->PutPart(txn_id, static_cast<int32_t>(chunk_index + 1), data);
  } catch (const std::exception& e) {
    util::Logger::Warn("[UploadSessionManager] Chunk " + std::to_string(chunk_index) + " of " +
                       upload_id + " failed: " + e.what());
    result.error = e.what();
    return result;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end() || !IsOpen(it->second.status) ||
      it->second.backing_upload_id != txn_id) {
    // Cancelled while the write was in flight; the part died with the transaction.
    result.error = "upload session was cancelled";
    return result;
  }
  UploadSession& session = it->second;
  auto existing = session.chunks.find(chunk_index);
  if (existing != session.chunks.end()) {
    result.success = true;
    result.etag = existing->second.etag;
    result.already_present = true;
    return result;
  }
  ChunkRecord& chunk = session.chunks[chunk_index];
  chunk.etag = etag;
  chunk.chunk_hash = result.chunk_hash;
  chunk.size_bytes = static_cast<int64_t>(data.size());
  session.last_activity_at_ms = time_source_->NowUtcMs();
  repository_->PutSession(session);

  util::Logger::Debug("[UploadSessionManager] Chunk " + std::to_string(chunk_index + 1) + "/" +
                      std::to_string(session.total_chunks) + " stored for " + upload_id);
  result.success = true;
  result.etag = etag;
  return result;
}

BatchUploadResult UploadSessionManager::UploadChunksBatch(const std::string& upload_id,
                                                          const std::vector<ChunkPayload>& chunks) {
  BatchUploadResult result;
  if (chunks.empty()) return result;

  std::atomic<size_t> next{0};
  std::mutex result_mutex;
  auto worker = [&]() {
    while (true) {
      const size_t i = next.fetch_add(1);
      if (i >= chunks.size()) return;
      bool ok = false;
      try {
        ok = UploadChunk(upload_id, chunks[i].index, chunks[i].data).success;
      } catch (const PipelineError& e) {
        util::Logger::Warn("[UploadSessionManager] Batch chunk " +
                           std::to_string(chunks[i].index) + " rejected: " + e.what());
      }
      std::lock_guard<std::mutex> lock(result_mutex);
      if (ok) {
        ++result.successful;
      } else {
        ++result.failed;
        result.failed_indices.push_back(chunks[i].index);
      }
    }
  };

  const size_t window = std::min(chunks.size(),
                                 static_cast<size_t>(std::max(1, config_.chunk_parallelism)));
  std::vector<std::thread> workers;
  workers.reserve(window);
  for (size_t i = 0; i < window; ++i) workers.emplace_back(worker);
  for (auto& t : workers) t.join();

  std::sort(result.failed_indices.begin(), result.failed_indices.end());
  return result;
}

std::string UploadSessionManager::CompleteUpload(const std::string& upload_id,
                                                 const AssetMeta& meta) {
  UploadSession snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    UploadSession& session = RequireSessionLocked(upload_id);
    if (!session.IsComplete()) {
      throw PipelineError(ErrorCode::kUploadIncomplete,
                          "upload incomplete: " + std::to_string(session.UploadedCount()) + "/" +
                              std::to_string(session.total_chunks) + " chunks uploaded");
    }
    // Completed is set before finalizing so concurrent chunk writes and
    // cancels see a closed session.
    session.status = SessionStatus::kCompleted;
    snapshot = session;
  }

  std::vector<storage::PartRef> parts;
  parts.reserve(snapshot.chunks.size());
  for (const auto& [index, chunk] : snapshot.chunks) {
    parts.push_back({static_cast<int32_t>(index + 1), chunk.etag});
  }

  std::string location;
  std::string content_hash;
  std::string signature;
  try {
    location = store_->CompleteMultipartTransaction(snapshot.backing_upload_id, parts);
    util::Sha256 hasher;
    store_->ReadObject(location, [&hasher](const char* data, std::size_t len) {
      hasher.Update(data, len);
    });
    content_hash = hasher.FinalHex();
    signature = forensics_->GenerateSignature();
  } catch (const std::exception& e) {
    util::Logger::Error("[UploadSessionManager] Finalize failed for " + upload_id + ": " +
                        e.what());
    // The session cannot be retried; release the parts and forget it so the
    // stale sweep never reports it as cancelled.
    try {
      store_->AbortMultipartTransaction(snapshot.backing_upload_id);
    } catch (const std::exception& abort_error) {
      util::Logger::Warn("[UploadSessionManager] Abort of " + snapshot.backing_upload_id +
                         " failed: " + abort_error.what());
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sessions_.erase(upload_id);
      repository_->DeleteSession(upload_id);
    }
    throw PipelineError(ErrorCode::kUploadFinalizeFailure,
                        std::string("failed to finalize upload: ") + e.what());
  }

  const int64_t now = time_source_->NowUtcMs();
  MediaAsset asset;
  asset.asset_id = util::GenerateId("asset");
  asset.owner = snapshot.owner;
  asset.origin_filename = snapshot.filename;
  asset.content_hash = content_hash;
  asset.size_bytes = snapshot.total_size;
  asset.mime_type = snapshot.mime_type;
  asset.storage_location = location;
  asset.forensic_signature = signature;
  asset.processing_status = ProcessingStatus::kPending;
  asset.width = meta.width;
  asset.height = meta.height;
  asset.duration_ms = meta.duration_ms;
  asset.created_at_ms = now;
  asset.updated_at_ms = now;
  repository_->PutAsset(asset);

  ForensicRecord record;
  record.asset_id = asset.asset_id;
  record.signature_id = signature;
  record.owner_id = snapshot.owner.owner_id;
  record.platform_id = snapshot.owner.platform_id;
  record.created_at_ms = now;
  repository_->PutForensicRecord(record);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(upload_id);
    repository_->DeleteSession(upload_id);
  }
  util::Logger::Info("[UploadSessionManager] Upload completed: " + upload_id + " -> asset " +
                     asset.asset_id);
  return asset.asset_id;
}

bool UploadSessionManager::PauseUpload(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end() || it->second.status != SessionStatus::kActive) return false;
  it->second.status = SessionStatus::kPaused;
  it->second.last_activity_at_ms = time_source_->NowUtcMs();
  repository_->PutSession(it->second);
  return true;
}

bool UploadSessionManager::ResumeUpload(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end() || it->second.status != SessionStatus::kPaused) return false;
  it->second.status = SessionStatus::kActive;
  it->second.last_activity_at_ms = time_source_->NowUtcMs();
  repository_->PutSession(it->second);
  return true;
}

bool UploadSessionManager::CancelUpload(const std::string& upload_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(upload_id);
    // A completed session is being finalized; it is no longer cancellable.
    if (it == sessions_.end() || it->second.status == SessionStatus::kCompleted) return false;
  }
  DiscardSession(upload_id, "cancelled");
  return true;
}

void UploadSessionManager::DiscardSession(const std::string& upload_id,
                                          const std::string& reason) {
  std::string txn_id;
  SessionEndedCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) return;
    txn_id = it->second.backing_upload_id;
    sessions_.erase(it);
    repository_->DeleteSession(upload_id);
    callback = on_session_ended_;
  }
  try {
    store_->AbortMultipartTransaction(txn_id);
  } catch (const std::exception& e) {
    util::Logger::Warn("[UploadSessionManager] Abort of " + txn_id + " failed: " + e.what());
  }
  util::Logger::Info("[UploadSessionManager] Upload " + reason + ": " + upload_id);
  if (callback) callback(upload_id, reason);
}

std::optional<UploadProgress> UploadSessionManager::GetProgress(
    const std::string& upload_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end()) return std::nullopt;
  const UploadSession& session = it->second;

  UploadProgress p;
  p.upload_id = upload_id;
  p.status = session.status;
  p.uploaded_chunks = session.UploadedCount();
  p.total_chunks = session.total_chunks;
  p.bytes_transferred = session.BytesTransferred();
  p.total_bytes = session.total_size;
  p.percent = session.total_chunks > 0
                  ? std::min(100.0, 100.0 * static_cast<double>(p.uploaded_chunks) /
                                        static_cast<double>(session.total_chunks))
                  : 0.0;
  const int64_t elapsed_ms = time_source_->NowUtcMs() - session.started_at_ms;
  if (elapsed_ms > 0) {
    p.bytes_per_second = static_cast<double>(p.bytes_transferred) * 1000.0 /
                         static_cast<double>(elapsed_ms);
  }
  if (p.bytes_per_second > 0.0) {
    p.estimated_seconds_remaining = static_cast<int64_t>(std::ceil(
        static_cast<double>(p.total_bytes - p.bytes_transferred) / p.bytes_per_second));
  }
  for (int64_t i = 0; i < session.total_chunks; ++i) {
    if (!session.HasChunk(i)) p.missing_chunks.push_back(i);
  }
  return p;
}

std::optional<UploadSession> UploadSessionManager::GetSession(const std::string& upload_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

std::vector<UploadSession> UploadSessionManager::ListActiveSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UploadSession> out;
  for (const auto& [id, session] : sessions_) {
    if (IsOpen(session.status)) out.push_back(session);
  }
  return out;
}

int UploadSessionManager::CleanupStaleSessions() {
  std::vector<std::string> stale;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = time_source_->NowUtcMs();
    for (const auto& [id, session] : sessions_) {
      if (session.status == SessionStatus::kCompleted) continue;
      if (now - session.last_activity_at_ms > config_.stale_session_threshold_ms) {
        stale.push_back(id);
      }
    }
  }
  for (const auto& id : stale) DiscardSession(id, "expired");
  if (!stale.empty()) {
    util::Logger::Info("[UploadSessionManager] Cleaned up " + std::to_string(stale.size()) +
                       " stale session(s)");
  }
  return static_cast<int>(stale.size());
}

int UploadSessionManager::RestoreSessions() {
  int restored = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& session : repository_->ListSessions()) {
    if (!IsOpen(session.status) || sessions_.count(session.upload_id) != 0) continue;
    sessions_.emplace(session.upload_id, std::move(session));
    ++restored;
  }
  if (restored > 0) {
    util::Logger::Info("[UploadSessionManager] Restored " + std::to_string(restored) +
                       " upload session(s)");
  }
  return restored;
}

}  // namespace mediaforge::upload
