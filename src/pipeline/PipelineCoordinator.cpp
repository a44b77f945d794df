// Repository: MediaForge
// Component: Pipeline Coordinator implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/pipeline/PipelineCoordinator.hpp"

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/util/Ids.hpp"
#include "mediaforge/util/Logger.hpp"

namespace mediaforge::pipeline {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ", ";
    out += n;
  }
  return out;
}

}  // namespace

PipelineCoordinator::PipelineCoordinator(
    const config::PipelineConfig& config, std::shared_ptr<storage::IPipelineRepository> repository,
    std::shared_ptr<upload::UploadSessionManager> uploads,
    std::shared_ptr<transcode::TranscodingOrchestrator> transcoder,
    std::shared_ptr<distribution::DistributionFanout> fanout,
    std::shared_ptr<const distribution::TierPolicy> tiers, std::shared_ptr<PipelineEventBus> events,
    std::shared_ptr<IAuditSink> audit, std::shared_ptr<time::ITimeSource> time_source)
    : config_(config),
      repository_(std::move(repository)),
      uploads_(std::move(uploads)),
      transcoder_(std::move(transcoder)),
      fanout_(std::move(fanout)),
      tiers_(std::move(tiers)),
      events_(std::move(events)),
      audit_(std::move(audit)),
      time_source_(std::move(time_source)) {
  uploads_->SetSessionEndedCallback(
      [this](const std::string& upload_id, const std::string& reason) {
        OnSessionEnded(upload_id, reason);
      });
  transcoder_->SetJobCallback(
      [this](const TranscodingJob& job, transcode::JobEvent event) { OnJobEvent(job, event); });
  transcoder_->SetCompletionCallback(
      [this](const transcode::BatchOutcome& outcome) { OnTranscodeFinished(outcome); });
  fanout_->SetTargetCallback([this](const DistributionTarget& target) { OnTargetFinished(target); });
}

PipelineCoordinator::~PipelineCoordinator() {
  Shutdown();
}

void PipelineCoordinator::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (shutting_down_) return;
    shutting_down_ = true;
  }
  WaitForIdle();
  uploads_->SetSessionEndedCallback(nullptr);
  transcoder_->SetJobCallback(nullptr);
  transcoder_->SetCompletionCallback(nullptr);
  fanout_->SetTargetCallback(nullptr);
}

void PipelineCoordinator::WaitForIdle() {
  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& w : workers) {
    if (w.thread.joinable()) w.thread.join();
  }
}

StartPipelineResult PipelineCoordinator::StartPipeline(const StartPipelineRequest& request) {
  if (!distribution::TierPolicy::IsKnownTier(request.tier)) {
    throw PipelineError(ErrorCode::kInvalidArgument, "unknown tier: '" + request.tier + "'");
  }

  StartPipelineResult result;
  result.available_platforms = tiers_->GetAvailablePlatforms(request.tier);
  result.max_platforms = distribution::TierPolicy::MaxPlatforms(request.tier);
  const std::vector<std::string> requested =
      request.platform_selection.empty() ? std::vector<std::string>{request.owner.platform_id}
                                         : request.platform_selection;
  result.distribution_platforms = tiers_->ValidatePlatformSelection(requested, request.tier);

  const std::string mime_type = request.mime_type.empty()
                                    ? upload::MimeTypeForFilename(request.filename)
                                    : request.mime_type;
  const auto init =
      uploads_->InitializeUpload(request.filename, request.total_size, mime_type, request.owner);
  result.upload_id = init.upload_id;
  result.chunk_size = init.chunk_size;
  result.total_chunks = init.total_chunks;
  result.asset_id = "pending_" + init.upload_id;

  PipelineEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.record.upload_id = init.upload_id;
    entry.record.asset_id = result.asset_id;
    entry.record.owner = request.owner;
    entry.record.tier = request.tier;
    entry.record.distribution_platforms = result.distribution_platforms;
    entry.record.output_mode = config_.output_mode;
    entry.record.created_at_ms = time_source_->NowUtcMs();
    entry.machine = std::make_unique<PipelineStateMachine>();
    auto& stored = pipelines_[init.upload_id];
    stored = std::move(entry);
    SyncRecordLocked(stored);
    event = MakeEventLocked(PipelineEventType::kPipelineStarted, stored);
    event.message = request.filename;
  }
  Emit(event);

  util::Logger::Info("[PipelineCoordinator] Pipeline started: " + result.upload_id +
                     " for tier: " + request.tier);
  util::Logger::Info("[PipelineCoordinator] Distribution: " +
                     std::to_string(result.distribution_platforms.size()) + "/" +
                     std::to_string(result.max_platforms) + " platforms");
  return result;
}

upload::ChunkUploadResult PipelineCoordinator::UploadChunk(const std::string& upload_id,
                                                           int64_t chunk_index,
                                                           const std::string& data) {
  auto result = uploads_->UploadChunk(upload_id, chunk_index, data);
  if (!result.success || result.already_present) return result;

  const auto progress = uploads_->GetProgress(upload_id);
  std::optional<PipelineEvent> event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(upload_id);
    if (it != pipelines_.end()) {
      event = MakeEventLocked(PipelineEventType::kChunkStored, it->second);
      event->progress = progress ? progress->percent : 0.0;
      event->message = "chunk " + std::to_string(chunk_index);
    }
  }
  if (event) Emit(*event);
  return result;
}

std::string PipelineCoordinator::CompleteUpload(const std::string& upload_id,
                                                const CompleteUploadOptions& options) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = RequireEntryLocked(upload_id);
    if (entry.machine->stage() != PipelineStage::kUploading) {
      throw PipelineError(ErrorCode::kIllegalTransition,
                          "pipeline " + upload_id + " is already " +
                              ToString(entry.machine->stage()));
    }
  }

  std::string asset_id;
  try {
    asset_id = uploads_->CompleteUpload(upload_id, options.meta);
  } catch (const PipelineError& e) {
    if (e.code() == ErrorCode::kUploadFinalizeFailure) FailPipeline(upload_id, e.what());
    throw;
  }

  auto asset = repository_->GetAsset(asset_id);
  if (!asset) {
    FailPipeline(upload_id, "asset record missing after upload");
    throw PipelineError(ErrorCode::kAssetNotFound, "asset not found: " + asset_id);
  }

  std::vector<PipelineEvent> pending;
  bool advanced = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = RequireEntryLocked(upload_id);
    PipelineRecord& record = entry.record;
    record.asset_id = asset_id;
    record.forensic_signature = asset->forensic_signature;
    record.upload_complete = true;
    record.auto_transcode = options.auto_transcode;
    record.output_mode = options.output_mode.value_or(config_.output_mode);
    if (options.auto_transcode) {
      record.presets = distribution::TierPolicy::PresetsForTier(
          record.tier, options.presets, config_.default_presets, config_.premium_preset);
    }
    asset_index_[asset_id] = upload_id;
    PipelineEvent completed = MakeEventLocked(PipelineEventType::kUploadCompleted, entry);
    completed.progress = 100.0;
    completed.message = asset->forensic_signature;
    pending.push_back(completed);

    advanced = options.auto_transcode ? entry.machine->BeginTranscoding()
                                      : entry.machine->SkipTranscoding();
    SyncRecordLocked(entry);
    if (advanced) pending.push_back(MakeEventLocked(PipelineEventType::kStageChanged, entry));
  }
  for (const auto& event : pending) Emit(event);
  util::Logger::Info("[PipelineCoordinator] Upload complete: " + upload_id + " -> " + asset_id);

  if (!advanced) {
    util::Logger::Warn("[PipelineCoordinator] Pipeline " + upload_id +
                       " ended while its upload was completing");
    return asset_id;
  }
  if (options.auto_transcode) {
    QueueTranscodeFor(upload_id, *asset);
  } else {
    StartDistribution(upload_id, false);
  }
  return asset_id;
}

std::optional<PipelineStatus> PipelineCoordinator::GetPipelineStatus(
    const std::string& upload_id) const {
  PipelineStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(upload_id);
    if (it == pipelines_.end()) return std::nullopt;
    status.record = it->second.record;
  }

  if (status.record.upload_complete) {
    status.upload_progress = 100.0;
  } else if (auto progress = uploads_->GetProgress(upload_id)) {
    status.upload_progress = progress->percent;
  }
  if (!status.record.transcode_batch_id.empty()) {
    if (auto batch = transcoder_->GetJobStatus(status.record.transcode_batch_id)) {
      status.transcode_progress = batch->overall_progress;
    }
  }
  if (status.record.upload_complete) {
    status.targets = repository_->ListTargets(status.record.asset_id);
  }
  return status;
}

bool PipelineCoordinator::PauseUpload(const std::string& upload_id) {
  return uploads_->PauseUpload(upload_id);
}

bool PipelineCoordinator::ResumeUpload(const std::string& upload_id) {
  return uploads_->ResumeUpload(upload_id);
}

bool PipelineCoordinator::CancelUpload(const std::string& upload_id) {
  return uploads_->CancelUpload(upload_id);
}

int PipelineCoordinator::RecoverInFlight() {
  const int sessions = uploads_->RestoreSessions();
  const int64_t cutoff = time_source_->NowUtcMs() - config_.pipeline_retention_ms;
  int resumed = 0;
  for (const auto& record : repository_->ListPipelines()) {
    if (IsTerminal(record.stage) && record.updated_at_ms <= cutoff) continue;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (pipelines_.count(record.upload_id) != 0) continue;
      Entry entry;
      entry.record = record;
      entry.machine =
          std::make_unique<PipelineStateMachine>(record.stage, record.failed_stage, record.error);
      if (record.upload_complete) asset_index_[record.asset_id] = record.upload_id;
      pipelines_.emplace(record.upload_id, std::move(entry));
    }

    switch (record.stage) {
      case PipelineStage::kUploading:
        if (!uploads_->GetSession(record.upload_id)) {
          FailPipeline(record.upload_id, "upload session lost across restart");
        }
        break;
      case PipelineStage::kTranscoding: {
        auto asset = repository_->GetAsset(record.asset_id);
        if (!asset) {
          FailPipeline(record.upload_id, "asset " + record.asset_id + " missing on recovery");
          break;
        }
        asset->quality_variants.clear();
        asset->manifest_url.clear();
        asset->processing_status = ProcessingStatus::kPending;
        asset->updated_at_ms = time_source_->NowUtcMs();
        repository_->PutAsset(*asset);
        try {
          QueueTranscodeFor(record.upload_id, *asset);
          ++resumed;
        } catch (const std::exception& e) {
          util::Logger::Error("[PipelineCoordinator] Could not re-queue " + record.upload_id +
                              ": " + e.what());
        }
        break;
      }
      case PipelineStage::kDistributing:
        StartDistribution(record.upload_id, true);
        ++resumed;
        break;
      case PipelineStage::kComplete:
      case PipelineStage::kFailed:
        break;
    }
  }
  util::Logger::Info("[PipelineCoordinator] Recovery: " + std::to_string(sessions) +
                     " upload session(s), " + std::to_string(resumed) +
                     " pipeline(s) resumed");
  return resumed;
}

int PipelineCoordinator::EvictTerminalPipelines() {
  const int64_t cutoff = time_source_->NowUtcMs() - config_.pipeline_retention_ms;
  int evicted = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pipelines_.begin(); it != pipelines_.end();) {
      const PipelineRecord& record = it->second.record;
      if (!IsTerminal(record.stage) || record.updated_at_ms > cutoff) {
        ++it;
        continue;
      }
      auto index = asset_index_.find(record.asset_id);
      if (index != asset_index_.end() && index->second == record.upload_id) {
        asset_index_.erase(index);
      }
      it = pipelines_.erase(it);
      ++evicted;
    }
  }
  if (evicted > 0) {
    util::Logger::Info("[PipelineCoordinator] Evicted " + std::to_string(evicted) +
                       " finished pipeline(s)");
  }
  return evicted;
}

PipelineCoordinator::Entry& PipelineCoordinator::RequireEntryLocked(const std::string& upload_id) {
  auto it = pipelines_.find(upload_id);
  if (it == pipelines_.end()) {
    throw PipelineError(ErrorCode::kPipelineNotFound, "pipeline not found: " + upload_id);
  }
  return it->second;
}

void PipelineCoordinator::SyncRecordLocked(Entry& entry) {
  const auto snapshot = entry.machine->GetSnapshot();
  entry.record.stage = snapshot.stage;
  entry.record.failed_stage = snapshot.failed_stage;
  entry.record.error = snapshot.error;
  entry.record.updated_at_ms = time_source_->NowUtcMs();
  repository_->PutPipeline(entry.record);
}

PipelineEvent PipelineCoordinator::MakeEventLocked(PipelineEventType type,
                                                   const Entry& entry) const {
  PipelineEvent event;
  event.type = type;
  event.upload_id = entry.record.upload_id;
  event.asset_id = entry.record.asset_id;
  event.batch_id = entry.record.transcode_batch_id;
  event.stage = ToString(entry.machine->stage());
  event.emitted_utc_ms = time_source_->NowUtcMs();
  return event;
}

void PipelineCoordinator::Emit(const PipelineEvent& event) {
  if (events_) events_->Publish(event);
  if (audit_ && IsAuditable(event.type)) audit_->Record(event);
}

void PipelineCoordinator::QueueTranscodeFor(const std::string& upload_id,
                                            const MediaAsset& asset) {
  transcode::TranscodeRequest request;
  request.asset_id = asset.asset_id;
  request.source_location = asset.storage_location;
  request.inject_signature = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const PipelineRecord& record = RequireEntryLocked(upload_id).record;
    request.presets = record.presets;
    request.output_mode = record.output_mode;
    request.target_platforms = record.distribution_platforms;
    request.signature_id = record.forensic_signature;
    request.signature_payload["creator_id"] = record.owner.owner_id;
    request.signature_payload["platform_id"] = record.owner.platform_id;
    request.signature_payload["timestamp"] = util::FormatUtcIso8601(time_source_->NowUtcMs());
  }

  std::string batch_id;
  try {
    batch_id = transcoder_->QueueTranscoding(request);
  } catch (const std::exception& e) {
    FailPipeline(upload_id, std::string("could not queue transcoding: ") + e.what());
    throw;
  }

  PipelineEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = RequireEntryLocked(upload_id);
    entry.record.transcode_batch_id = batch_id;
    SyncRecordLocked(entry);
    event = MakeEventLocked(PipelineEventType::kTranscodeQueued, entry);
    event.message = JoinNames(request.presets);
  }
  Emit(event);
  util::Logger::Info("[PipelineCoordinator] Transcoding started: " + batch_id + " (" +
                     JoinNames(request.presets) + ")");
}

void PipelineCoordinator::OnSessionEnded(const std::string& upload_id,
                                         const std::string& reason) {
  PipelineEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(upload_id);
    if (it == pipelines_.end()) return;
    event = MakeEventLocked(PipelineEventType::kUploadCancelled, it->second);
    event.message = reason;
  }
  Emit(event);
  FailPipeline(upload_id, "upload " + reason);
}

void PipelineCoordinator::OnJobEvent(const TranscodingJob& job, transcode::JobEvent kind) {
  PipelineEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = asset_index_.find(job.asset_id);
    if (index == asset_index_.end()) return;
    auto it = pipelines_.find(index->second);
    if (it == pipelines_.end()) return;
    PipelineEventType type = PipelineEventType::kJobProgress;
    if (kind == transcode::JobEvent::kCompleted) type = PipelineEventType::kJobCompleted;
    if (kind == transcode::JobEvent::kFailed) type = PipelineEventType::kJobFailed;
    event = MakeEventLocked(type, it->second);
  }
  event.batch_id = job.batch_id;
  event.job_id = job.job_id;
  event.progress = job.progress_percent;
  event.message = kind == transcode::JobEvent::kFailed ? job.error_message : job.preset.key;
  Emit(event);
}

void PipelineCoordinator::OnTranscodeFinished(const transcode::BatchOutcome& outcome) {
  std::string upload_id;
  std::vector<PipelineEvent> pending;
  bool distribute = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = asset_index_.find(outcome.asset_id);
    if (index == asset_index_.end()) {
      util::Logger::Warn("[PipelineCoordinator] Transcode finished for unknown asset " +
                         outcome.asset_id);
      return;
    }
    upload_id = index->second;
    Entry& entry = RequireEntryLocked(upload_id);
    entry.record.transcode_complete = true;
    PipelineEvent finished = MakeEventLocked(PipelineEventType::kTranscodeFinished, entry);
    finished.batch_id = outcome.batch_id;
    const int total = outcome.succeeded + outcome.failed;
    finished.progress = total > 0 ? 100.0 * outcome.succeeded / total : 0.0;
    finished.message = std::to_string(outcome.succeeded) + " of " + std::to_string(total) +
                       " variant(s) succeeded";
    pending.push_back(finished);

    if (outcome.asset_status == ProcessingStatus::kCompleted &&
        entry.machine->BeginDistribution()) {
      distribute = true;
      pending.push_back(MakeEventLocked(PipelineEventType::kStageChanged, entry));
    }
    SyncRecordLocked(entry);
  }
  for (const auto& event : pending) Emit(event);
  util::Logger::Info("[PipelineCoordinator] Transcoding complete: " + outcome.batch_id);

  if (distribute) {
    StartDistribution(upload_id, false);
  } else if (outcome.asset_status != ProcessingStatus::kCompleted) {
    FailPipeline(upload_id, outcome.error.empty() ? "no variants produced" : outcome.error);
  }
}

void PipelineCoordinator::OnTargetFinished(const DistributionTarget& target) {
  PipelineEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = asset_index_.find(target.asset_id);
    if (index == asset_index_.end()) return;
    auto it = pipelines_.find(index->second);
    if (it == pipelines_.end()) return;
    event = MakeEventLocked(target.status == DeliveryStatus::kDelivered
                                ? PipelineEventType::kPlatformDelivered
                                : PipelineEventType::kPlatformFailed,
                            it->second);
  }
  event.platform_id = target.platform_id;
  event.message =
      target.status == DeliveryStatus::kDelivered ? target.remote_id : target.error_message;
  Emit(event);
}

void PipelineCoordinator::StartDistribution(const std::string& upload_id, bool resume) {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (shutting_down_) {
    util::Logger::Warn("[PipelineCoordinator] Shutting down; distribution for " + upload_id +
                       " left for recovery");
    return;
  }
  ReapWorkersLocked();
  Worker worker;
  worker.done = std::make_shared<std::atomic<bool>>(false);
  auto done = worker.done;
  worker.thread = std::thread([this, upload_id, resume, done] {
    RunDistribution(upload_id, resume);
    done->store(true, std::memory_order_release);
  });
  workers_.push_back(std::move(worker));
}

void PipelineCoordinator::RunDistribution(const std::string& upload_id, bool resume) {
  std::string asset_id;
  std::vector<std::string> platforms;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(upload_id);
    if (it == pipelines_.end()) return;
    asset_id = it->second.record.asset_id;
    platforms = it->second.record.distribution_platforms;
  }

  try {
    if (resume) {
      fanout_->ResumeDistribution(asset_id, platforms);
    } else {
      fanout_->DistributeToPlatforms(asset_id, platforms);
    }
  } catch (const std::exception& e) {
    FailPipeline(upload_id, std::string("distribution failed: ") + e.what());
    return;
  }

  PipelineEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(upload_id);
    if (it == pipelines_.end() || !it->second.machine->Complete()) return;
    it->second.record.distribution_complete = true;
    SyncRecordLocked(it->second);
    event = MakeEventLocked(PipelineEventType::kStageChanged, it->second);
  }
  Emit(event);
  util::Logger::Info("[PipelineCoordinator] Pipeline complete: " + upload_id);
}

void PipelineCoordinator::FailPipeline(const std::string& upload_id, const std::string& error) {
  std::vector<PipelineEvent> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(upload_id);
    if (it == pipelines_.end() || !it->second.machine->Fail(error)) return;
    SyncRecordLocked(it->second);
    pending.push_back(MakeEventLocked(PipelineEventType::kStageChanged, it->second));
    PipelineEvent failed = MakeEventLocked(PipelineEventType::kPipelineFailed, it->second);
    failed.message = error;
    pending.push_back(failed);
  }
  util::Logger::Error("[PipelineCoordinator] Pipeline failed: " + upload_id + ": " + error);
  for (const auto& event : pending) Emit(event);
}

void PipelineCoordinator::ReapWorkersLocked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load(std::memory_order_acquire)) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace mediaforge::pipeline
