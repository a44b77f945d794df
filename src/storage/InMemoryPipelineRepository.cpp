// Repository: MediaForge
// Component: In-process pipeline repository implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/storage/InMemoryPipelineRepository.hpp"


namespace mediaforge::storage {

namespace {

template <typename Map>
std::optional<typename Map::mapped_type> Lookup(const Map& map, const std::string& key) {
  auto it = map.find(key);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

}  // namespace

void InMemoryPipelineRepository::PutSession(const UploadSession& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[session.upload_id] = session;
}

std::optional<UploadSession> InMemoryPipelineRepository::GetSession(
    const std::string& upload_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Lookup(sessions_, upload_id);
}

void InMemoryPipelineRepository::DeleteSession(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.erase(upload_id);
}

std::vector<UploadSession> InMemoryPipelineRepository::ListSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UploadSession> out;
  out.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) out.push_back(session);
  return out;
}

void InMemoryPipelineRepository::PutAsset(const MediaAsset& asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  assets_[asset.asset_id] = asset;
}

std::optional<MediaAsset> InMemoryPipelineRepository::GetAsset(const std::string& asset_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Lookup(assets_, asset_id);
}

void InMemoryPipelineRepository::PutJob(const TranscodingJob& job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (jobs_.count(job.job_id) == 0) {
    batch_jobs_[job.batch_id].push_back(job.job_id);
  }
  jobs_[job.job_id] = job;
}

std::optional<TranscodingJob> InMemoryPipelineRepository::GetJob(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Lookup(jobs_, job_id);
}

std::vector<TranscodingJob> InMemoryPipelineRepository::ListJobs(
    const std::string& batch_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TranscodingJob> out;
  auto it = batch_jobs_.find(batch_id);
  if (it == batch_jobs_.end()) return out;
  for (const auto& job_id : it->second) {
    out.push_back(jobs_.at(job_id));
  }
  return out;
}

void InMemoryPipelineRepository::PutTarget(const DistributionTarget& target) {
  std::lock_guard<std::mutex> lock(mutex_);
  targets_[{target.asset_id, target.platform_id}] = target;
}

std::vector<DistributionTarget> InMemoryPipelineRepository::ListTargets(
    const std::string& asset_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DistributionTarget> out;
  for (auto it = targets_.lower_bound({asset_id, std::string()});
       it != targets_.end() && it->first.first == asset_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

void InMemoryPipelineRepository::PutForensicRecord(const ForensicRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  forensic_records_[record.asset_id] = record;
}

std::optional<ForensicRecord> InMemoryPipelineRepository::GetForensicRecord(
    const std::string& asset_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Lookup(forensic_records_, asset_id);
}

void InMemoryPipelineRepository::PutPipeline(const PipelineRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  pipelines_[record.upload_id] = record;
}

std::optional<PipelineRecord> InMemoryPipelineRepository::GetPipeline(
    const std::string& upload_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Lookup(pipelines_, upload_id);
}

std::vector<PipelineRecord> InMemoryPipelineRepository::ListPipelines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PipelineRecord> out;
  out.reserve(pipelines_.size());
  for (const auto& [id, record] : pipelines_) out.push_back(record);
  return out;
}

InMemoryPipelineRepository::Contents InMemoryPipelineRepository::DumpContents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Contents c;
  for (const auto& [id, v] : sessions_) c.sessions.push_back(v);
  for (const auto& [id, v] : assets_) c.assets.push_back(v);
  // Batch order is preserved so ListJobs() is stable across a compaction.
  for (const auto& [batch, job_ids] : batch_jobs_) {
    for (const auto& job_id : job_ids) c.jobs.push_back(jobs_.at(job_id));
  }
  for (const auto& [key, v] : targets_) c.targets.push_back(v);
  for (const auto& [id, v] : forensic_records_) c.forensic_records.push_back(v);
  for (const auto& [id, v] : pipelines_) c.pipelines.push_back(v);
  return c;
}

}  // namespace mediaforge::storage
