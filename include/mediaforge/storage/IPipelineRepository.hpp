// Repository: MediaForge
// Component: Pipeline repository interface
// Purpose: Authoritative store for sessions, assets, jobs, distribution
//          targets, forensic records and pipeline records, keyed by opaque ids.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_STORAGE_I_PIPELINE_REPOSITORY_HPP_
#define MEDIAFORGE_STORAGE_I_PIPELINE_REPOSITORY_HPP_

#include <optional>
#include <string>
#include <vector>

#include "mediaforge/core/Types.hpp"

namespace mediaforge::storage {

// Thread-safe. Put* replaces any existing entity with the same key.
// Getters return copies; callers never hold references into the store.
class IPipelineRepository {
 public:
  virtual ~IPipelineRepository() = default;

  virtual void PutSession(const UploadSession& session) = 0;
  virtual std::optional<UploadSession> GetSession(const std::string& upload_id) const = 0;
  virtual void DeleteSession(const std::string& upload_id) = 0;
  virtual std::vector<UploadSession> ListSessions() const = 0;

  virtual void PutAsset(const MediaAsset& asset) = 0;
  virtual std::optional<MediaAsset> GetAsset(const std::string& asset_id) const = 0;

  virtual void PutJob(const TranscodingJob& job) = 0;
  virtual std::optional<TranscodingJob> GetJob(const std::string& job_id) const = 0;
  // Jobs of one batch in creation order.
  virtual std::vector<TranscodingJob> ListJobs(const std::string& batch_id) const = 0;

  virtual void PutTarget(const DistributionTarget& target) = 0;
  // Targets of one asset, ordered by platform id.
  virtual std::vector<DistributionTarget> ListTargets(const std::string& asset_id) const = 0;

  virtual void PutForensicRecord(const ForensicRecord& record) = 0;
  virtual std::optional<ForensicRecord> GetForensicRecord(const std::string& asset_id) const = 0;

  virtual void PutPipeline(const PipelineRecord& record) = 0;
  virtual std::optional<PipelineRecord> GetPipeline(const std::string& upload_id) const = 0;
  virtual std::vector<PipelineRecord> ListPipelines() const = 0;
};

}  // namespace mediaforge::storage

#endif  // MEDIAFORGE_STORAGE_I_PIPELINE_REPOSITORY_HPP_
