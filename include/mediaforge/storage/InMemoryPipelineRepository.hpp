// Repository: MediaForge
// Component: In-process pipeline repository
// Purpose: Map-backed IPipelineRepository. Used directly in tests and as the
//          cache beneath the journal-backed repository.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_STORAGE_IN_MEMORY_PIPELINE_REPOSITORY_HPP_
#define MEDIAFORGE_STORAGE_IN_MEMORY_PIPELINE_REPOSITORY_HPP_

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "mediaforge/storage/IPipelineRepository.hpp"

namespace mediaforge::storage {

class InMemoryPipelineRepository : public IPipelineRepository {
 public:
  InMemoryPipelineRepository() = default;
  ~InMemoryPipelineRepository() override = default;

  InMemoryPipelineRepository(const InMemoryPipelineRepository&) = delete;
  InMemoryPipelineRepository& operator=(const InMemoryPipelineRepository&) = delete;

  void PutSession(const UploadSession& session) override;
  std::optional<UploadSession> GetSession(const std::string& upload_id) const override;
  void DeleteSession(const std::string& upload_id) override;
  std::vector<UploadSession> ListSessions() const override;

  void PutAsset(const MediaAsset& asset) override;
  std::optional<MediaAsset> GetAsset(const std::string& asset_id) const override;

  void PutJob(const TranscodingJob& job) override;
  std::optional<TranscodingJob> GetJob(const std::string& job_id) const override;
  std::vector<TranscodingJob> ListJobs(const std::string& batch_id) const override;

  void PutTarget(const DistributionTarget& target) override;
  std::vector<DistributionTarget> ListTargets(const std::string& asset_id) const override;

  void PutForensicRecord(const ForensicRecord& record) override;
  std::optional<ForensicRecord> GetForensicRecord(const std::string& asset_id) const override;

  void PutPipeline(const PipelineRecord& record) override;
  std::optional<PipelineRecord> GetPipeline(const std::string& upload_id) const override;
  std::vector<PipelineRecord> ListPipelines() const override;

 protected:
  // Every stored entity, for journal compaction.
  struct Contents {
    std::vector<UploadSession> sessions;
    std::vector<MediaAsset> assets;
    std::vector<TranscodingJob> jobs;
    std::vector<DistributionTarget> targets;
    std::vector<ForensicRecord> forensic_records;
    std::vector<PipelineRecord> pipelines;
  };
  Contents DumpContents() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, UploadSession> sessions_;
  std::map<std::string, MediaAsset> assets_;
  std::map<std::string, TranscodingJob> jobs_;
  std::map<std::string, std::vector<std::string>> batch_jobs_;  // batch id → job ids
  std::map<std::pair<std::string, std::string>, DistributionTarget> targets_;
  std::map<std::string, ForensicRecord> forensic_records_;
  std::map<std::string, PipelineRecord> pipelines_;
};

}  // namespace mediaforge::storage

#endif  // MEDIAFORGE_STORAGE_IN_MEMORY_PIPELINE_REPOSITORY_HPP_
