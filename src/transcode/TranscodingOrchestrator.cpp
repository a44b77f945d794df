// Repository: MediaForge
// Component: Transcoding Orchestrator implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/transcode/TranscodingOrchestrator.hpp"

#include <algorithm>
#include <set>
#include <unistd.h>

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/transcode/ManifestBuilder.hpp"
#include "mediaforge/transcode/ProgressParser.hpp"
#include "mediaforge/transcode/QualityPresets.hpp"
#include "mediaforge/util/FileUtil.hpp"
#include "mediaforge/util/Ids.hpp"
#include "mediaforge/util/Logger.hpp"

namespace mediaforge::transcode {

double MeanProgress(const std::vector<TranscodingJob>& jobs) {
  if (jobs.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& job : jobs) sum += job.progress_percent;
  return sum / static_cast<double>(jobs.size());
}

TranscodingOrchestrator::TranscodingOrchestrator(
    const config::PipelineConfig& config,
    std::shared_ptr<storage::IPipelineRepository> repository,
    std::shared_ptr<ITranscodeRunner> runner,
    std::shared_ptr<forensic::IForensicService> forensics,
    std::shared_ptr<storage::IObjectPublisher> publisher, std::shared_ptr<IMediaProbe> probe,
    std::shared_ptr<time::ITimeSource> time_source)
    : config_(config),
      encoder_{config.ffmpeg_path, config.gpu_acceleration},
      group_size_(config.ResolvedTranscodeParallelism()),
      repository_(std::move(repository)),
      runner_(std::move(runner)),
      forensics_(std::move(forensics)),
      publisher_(std::move(publisher)),
      probe_(std::move(probe)),
      time_source_(std::move(time_source)) {}

TranscodingOrchestrator::~TranscodingOrchestrator() {
  Stop();
}

void TranscodingOrchestrator::SetCompletionCallback(CompletionCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_complete_ = std::move(callback);
}

void TranscodingOrchestrator::SetJobCallback(JobCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_job_ = std::move(callback);
}

void TranscodingOrchestrator::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (dispatcher_.joinable()) return;
  stop_requested_ = false;
  dispatcher_ = std::thread(&TranscodingOrchestrator::DispatchLoop, this);
  util::Logger::Info("[TranscodingOrchestrator] Started (group size " +
                     std::to_string(group_size_) + ")");
}

void TranscodingOrchestrator::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (dispatcher_.joinable()) dispatcher_.join();
}

std::string TranscodingOrchestrator::QueueTranscoding(const TranscodeRequest& request) {
  auto asset = repository_->GetAsset(request.asset_id);
  if (!asset) {
    throw PipelineError(ErrorCode::kAssetNotFound, "asset not found: " + request.asset_id);
  }

  auto batch = std::make_shared<Batch>();
  batch->batch_id = util::GenerateId("transcode");
  batch->request = request;
  std::set<std::string> seen;
  for (const auto& name : request.presets) {
    auto preset = FindQualityPreset(name);
    if (!preset) {
      util::Logger::Warn("[TranscodingOrchestrator] Skipping unknown preset '" + name + "'");
      continue;
    }
    if (!seen.insert(name).second) continue;
    TranscodingJob job;
    job.job_id = util::GenerateId("job");
    job.batch_id = batch->batch_id;
    job.asset_id = request.asset_id;
    job.preset = *preset;
    job.status = JobStatus::kQueued;
    repository_->PutJob(job);
    batch->jobs.push_back(std::move(job));
  }

  {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    if (auto current = repository_->GetAsset(request.asset_id)) {
      current->processing_status = ProcessingStatus::kProcessing;
      current->updated_at_ms = time_source_->NowUtcMs();
      repository_->PutAsset(*current);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[batch->batch_id] = batch;
    queue_.push_back(batch);
  }
  cv_.notify_all();
  util::Logger::Info("[TranscodingOrchestrator] Queued " + std::to_string(batch->jobs.size()) +
                     " transcoding job(s): " + batch->batch_id);
  return batch->batch_id;
}

std::optional<BatchStatus> TranscodingOrchestrator::GetJobStatus(
    const std::string& batch_id) const {
  BatchStatus status;
  status.batch_id = batch_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(batch_id);
    if (it != active_.end()) {
      status.asset_id = it->second->request.asset_id;
      status.jobs = it->second->jobs;
    }
  }
  // Finished batches are answered from the repository.
  if (status.asset_id.empty()) {
    status.jobs = repository_->ListJobs(batch_id);
    if (status.jobs.empty()) return std::nullopt;
    status.asset_id = status.jobs.front().asset_id;
    status.finished = std::all_of(status.jobs.begin(), status.jobs.end(),
                                  [](const TranscodingJob& j) { return IsTerminal(j.status); });
  }

  status.total_variants = static_cast<int>(status.jobs.size());
  for (const auto& job : status.jobs) {
    switch (job.status) {
      case JobStatus::kCompleted: ++status.completed; break;
      case JobStatus::kFailed: ++status.failed; break;
      case JobStatus::kProcessing: ++status.processing; break;
      case JobStatus::kQueued: ++status.queued; break;
    }
  }
  status.overall_progress = MeanProgress(status.jobs);
  return status;
}

bool TranscodingOrchestrator::WaitForBatch(const std::string& batch_id,
                                           std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this, &batch_id] { return active_.count(batch_id) == 0; });
}

void TranscodingOrchestrator::DispatchLoop() {
  while (true) {
    std::shared_ptr<Batch> batch;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
      if (stop_requested_) break;
      batch = queue_.front();
      queue_.pop_front();
    }
    RunBatch(batch);
  }
}

void TranscodingOrchestrator::RunBatch(const std::shared_ptr<Batch>& batch) {
  const TranscodeRequest& request = batch->request;
  int64_t probed_duration_ms = 0;
  if (probe_ && !batch->jobs.empty()) {
    if (auto probed = probe_->Probe(request.source_location)) {
      probed_duration_ms = probed->duration_ms;
    }
  }

  // Jobs left queued by an earlier Stop() are the only ones still to run.
  std::vector<size_t> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < batch->jobs.size(); ++i) {
      if (batch->jobs[i].status == JobStatus::kQueued) pending.push_back(i);
    }
  }

  const size_t group = static_cast<size_t>(group_size_);
  for (size_t start = 0; start < pending.size(); start += group) {
    const size_t end = std::min(pending.size(), start + group);
    std::vector<std::thread> workers;
    for (size_t i = start; i < end; ++i) {
      workers.emplace_back(&TranscodingOrchestrator::RunJob, this, batch, pending[i],
                           probed_duration_ms);
    }
    for (auto& t : workers) t.join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_ && end < pending.size()) {
      util::Logger::Warn("[TranscodingOrchestrator] Stopping with " +
                         std::to_string(pending.size() - end) + " job(s) of " +
                         batch->batch_id + " still queued");
      queue_.push_front(batch);
      return;
    }
  }

  BatchOutcome outcome = Finalize(batch);
  CompletionCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = on_complete_;
  }
  // The batch counts as finished only after its owner has been told.
  if (callback) {
    try {
      callback(outcome);
    } catch (const std::exception& e) {
      util::Logger::Error("[TranscodingOrchestrator] Completion callback failed for " +
                          batch->batch_id + ": " + e.what());
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(batch->batch_id);
  }
  cv_.notify_all();
}

void TranscodingOrchestrator::RunJob(const std::shared_ptr<Batch>& batch, size_t index,
                                     int64_t probed_duration_ms) {
  const TranscodeRequest& request = batch->request;
  TranscodingJob job;
  JobCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    TranscodingJob& slot = batch->jobs[index];
    slot.status = JobStatus::kProcessing;
    slot.progress_percent = 0;
    slot.started_at_ms = time_source_->NowUtcMs();
    job = slot;
    callback = on_job_;
  }
  repository_->PutJob(job);
  if (callback) callback(job, JobEvent::kStarted);

  const QualityPreset& preset = job.preset;
  const std::string work_dir = util::JoinPath(config_.work_dir, request.asset_id);
  const std::string output = util::JoinPath(work_dir, job.job_id + "_" + preset.key + ".mp4");

  try {
    util::MakeDirs(work_dir);

    ProgressParser parser;
    parser.SetKnownDurationMs(probed_duration_ms);
    const auto args = BuildTranscodeArgs(encoder_, request.source_location, output, preset);
    const int exit_code = runner_->Run(args, [&](const std::string& bytes) {
      if (auto percent = parser.Feed(bytes)) UpdateProgress(batch, index, *percent);
    });
    if (auto percent = parser.Finish()) UpdateProgress(batch, index, *percent);
    if (exit_code != 0) {
      throw PipelineError(ErrorCode::kSubprocessFailure,
                          "encoder exited with code " + std::to_string(exit_code));
    }

    if (request.inject_signature) {
      forensic::SignaturePayload payload = request.signature_payload;
      payload["asset_id"] = request.asset_id;
      forensics_->InjectSignature(output, request.signature_id, payload);
      std::lock_guard<std::mutex> lock(mutex_);
      batch->jobs[index].watermark_applied = true;
    }

    const int64_t size = util::FileSize(output);
    if (size < 0) {
      throw PipelineError(ErrorCode::kSubprocessFailure, "encoder produced no output file");
    }
    const std::string url =
        publisher_->Upload(output, "media/" + request.asset_id + "/" + preset.key + ".mp4");

    QualityVariant variant;
    variant.quality = preset.key;
    variant.url = url;
    variant.width = preset.width;
    variant.height = preset.height;
    variant.bitrate_kbps = preset.video_kbps;
    variant.file_size = size;
    variant.codec = job.codec;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      TranscodingJob& slot = batch->jobs[index];
      slot.output_location = url;
      slot.output_size_bytes = size;
    }
    AppendVariant(request.asset_id, variant);
    FinishJob(batch, index, JobStatus::kCompleted, "");
    util::Logger::Info("[TranscodingOrchestrator] Transcoded " + preset.label + " for " +
                       request.asset_id);
  } catch (const std::exception& e) {
    util::Logger::Error("[TranscodingOrchestrator] Error transcoding " + preset.label + " for " +
                        request.asset_id + ": " + e.what());
    FinishJob(batch, index, JobStatus::kFailed, e.what());
  }
  unlink(output.c_str());
}

void TranscodingOrchestrator::UpdateProgress(const std::shared_ptr<Batch>& batch, size_t index,
                                             int percent) {
  TranscodingJob job;
  JobCallback callback;
  bool persist = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    TranscodingJob& slot = batch->jobs[index];
    if (slot.status != JobStatus::kProcessing || percent <= slot.progress_percent) return;
    persist = (percent / 10) > (slot.progress_percent / 10);
    slot.progress_percent = percent;
    job = slot;
    callback = on_job_;
  }
  if (persist) repository_->PutJob(job);
  if (callback) callback(job, JobEvent::kProgress);
}

void TranscodingOrchestrator::FinishJob(const std::shared_ptr<Batch>& batch, size_t index,
                                        JobStatus status, const std::string& error) {
  TranscodingJob job;
  JobCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    TranscodingJob& slot = batch->jobs[index];
    if (IsTerminal(slot.status)) return;
    slot.status = status;
    slot.completed_at_ms = time_source_->NowUtcMs();
    if (status == JobStatus::kCompleted) {
      slot.progress_percent = 100;
    } else {
      slot.error_message = error;
    }
    job = slot;
    callback = on_job_;
  }
  repository_->PutJob(job);
  if (callback) {
    callback(job, status == JobStatus::kCompleted ? JobEvent::kCompleted : JobEvent::kFailed);
  }
}

void TranscodingOrchestrator::AppendVariant(const std::string& asset_id,
                                            const QualityVariant& variant) {
  std::lock_guard<std::mutex> lock(asset_mutex_);
  auto asset = repository_->GetAsset(asset_id);
  if (!asset) {
    throw PipelineError(ErrorCode::kAssetNotFound, "asset vanished: " + asset_id);
  }
  asset->quality_variants.push_back(variant);
  asset->updated_at_ms = time_source_->NowUtcMs();
  repository_->PutAsset(*asset);
}

BatchOutcome TranscodingOrchestrator::Finalize(const std::shared_ptr<Batch>& batch) {
  BatchOutcome outcome;
  outcome.batch_id = batch->batch_id;
  outcome.asset_id = batch->request.asset_id;
  outcome.target_platforms = batch->request.target_platforms;

  std::vector<TranscodingJob> jobs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs = batch->jobs;
  }
  for (const auto& job : jobs) {
    if (job.status == JobStatus::kCompleted) {
      ++outcome.succeeded;
      QualityVariant v;
      v.quality = job.preset.key;
      v.url = job.output_location;
      v.width = job.preset.width;
      v.height = job.preset.height;
      v.bitrate_kbps = job.preset.video_kbps;
      v.file_size = job.output_size_bytes;
      v.codec = job.codec;
      outcome.variants.push_back(std::move(v));
    } else {
      ++outcome.failed;
    }
  }

  if (outcome.succeeded > 0 && batch->request.output_mode != OutputMode::kMp4) {
    try {
      outcome.manifest_url =
          PublishManifest(outcome.asset_id, batch->request.output_mode, outcome.variants);
    } catch (const std::exception& e) {
      util::Logger::Error("[TranscodingOrchestrator] Manifest publish failed for " +
                          outcome.asset_id + ": " + e.what());
    }
  }

  if (outcome.succeeded > 0) {
    outcome.asset_status = ProcessingStatus::kCompleted;
  } else {
    outcome.asset_status = ProcessingStatus::kFailed;
    outcome.error = jobs.empty() ? "no valid quality presets requested"
                                 : "all " + std::to_string(jobs.size()) + " variant(s) failed";
  }

  {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    if (auto asset = repository_->GetAsset(outcome.asset_id)) {
      asset->processing_status = outcome.asset_status;
      if (!outcome.manifest_url.empty()) asset->manifest_url = outcome.manifest_url;
      asset->updated_at_ms = time_source_->NowUtcMs();
      repository_->PutAsset(*asset);
    }
  }
  util::Logger::Info("[TranscodingOrchestrator] Transcoding complete: " + outcome.batch_id + " (" +
                     std::to_string(outcome.succeeded) + " of " + std::to_string(jobs.size()) +
                     " variant(s))");
  return outcome;
}

std::string TranscodingOrchestrator::PublishManifest(const std::string& asset_id,
                                                     OutputMode mode,
                                                     const std::vector<QualityVariant>& variants) {
  const std::string name = ManifestFileName(mode);
  const std::string body = mode == OutputMode::kHls ? BuildHlsMasterPlaylist(variants)
                                                    : BuildDashManifest(variants);
  const std::string work_dir = util::JoinPath(config_.work_dir, asset_id);
  const std::string local = util::JoinPath(work_dir, name);
  util::MakeDirs(work_dir);
  util::WriteFileAtomic(local, body);
  std::string url;
  try {
    url = publisher_->Upload(local, "media/" + asset_id + "/" + name);
  } catch (...) {
    unlink(local.c_str());
    throw;
  }
  unlink(local.c_str());
  return url;
}

}  // namespace mediaforge::transcode
