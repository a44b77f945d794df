// Repository: MediaForge
// Component: Pipeline Coordinator
// Purpose: Owns one PipelineRecord and state machine per upload and drives
//          upload -> transcode -> distribution. Transcode completion arrives
//          on orchestrator threads; distribution runs on a coordinator
//          worker thread so the orchestrator is never blocked by network I/O.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_PIPELINE_PIPELINE_COORDINATOR_HPP_
#define MEDIAFORGE_PIPELINE_PIPELINE_COORDINATOR_HPP_

#include <atomic>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mediaforge/config/PipelineConfig.hpp"
#include "mediaforge/core/Types.hpp"
#include "mediaforge/distribution/DistributionFanout.hpp"
#include "mediaforge/distribution/TierPolicy.hpp"
#include "mediaforge/pipeline/IAuditSink.hpp"
#include "mediaforge/pipeline/PipelineEventBus.hpp"
#include "mediaforge/pipeline/PipelineStateMachine.hpp"
#include "mediaforge/storage/IPipelineRepository.hpp"
#include "mediaforge/time/ITimeSource.hpp"
#include "mediaforge/transcode/TranscodingOrchestrator.hpp"
#include "mediaforge/upload/UploadSessionManager.hpp"

namespace mediaforge::pipeline {

struct StartPipelineRequest {
  std::string filename;
  int64_t total_size = 0;
  std::string mime_type;  // Derived from the filename when empty
  OwnerMeta owner;
  std::string tier;
  // Empty means the owner's home platform only.
  std::vector<std::string> platform_selection;
};

struct StartPipelineResult {
  std::string upload_id;
  std::string asset_id;  // Placeholder until the upload completes
  int64_t chunk_size = 0;
  int64_t total_chunks = 0;
  std::vector<distribution::PlatformInfo> available_platforms;
  std::vector<std::string> distribution_platforms;
  int max_platforms = 0;
};

struct CompleteUploadOptions {
  upload::AssetMeta meta;
  // Going straight to distribution must be asked for explicitly.
  bool auto_transcode = true;
  std::vector<std::string> presets;  // Empty = configured defaults
  std::optional<OutputMode> output_mode;
};

struct PipelineStatus {
  PipelineRecord record;
  double upload_progress = 0.0;
  double transcode_progress = 0.0;
  std::vector<DistributionTarget> targets;
};

class PipelineCoordinator {
 public:
  PipelineCoordinator(const config::PipelineConfig& config,
                      std::shared_ptr<storage::IPipelineRepository> repository,
                      std::shared_ptr<upload::UploadSessionManager> uploads,
                      std::shared_ptr<transcode::TranscodingOrchestrator> transcoder,
                      std::shared_ptr<distribution::DistributionFanout> fanout,
                      std::shared_ptr<const distribution::TierPolicy> tiers,
                      std::shared_ptr<PipelineEventBus> events,
                      std::shared_ptr<IAuditSink> audit,
                      std::shared_ptr<time::ITimeSource> time_source);
  ~PipelineCoordinator();

  PipelineCoordinator(const PipelineCoordinator&) = delete;
  PipelineCoordinator& operator=(const PipelineCoordinator&) = delete;

  // Throws PipelineError(kInvalidArgument) for an unknown tier, plus
  // anything InitializeUpload throws.
  StartPipelineResult StartPipeline(const StartPipelineRequest& request);

  upload::ChunkUploadResult UploadChunk(const std::string& upload_id, int64_t chunk_index,
                                        const std::string& data);

  // Returns the asset id. Throws PipelineError: kPipelineNotFound,
  // kIllegalTransition (upload already completed), and anything
  // UploadSessionManager::CompleteUpload throws. A finalize failure also
  // fails the pipeline.
  std::string CompleteUpload(const std::string& upload_id, const CompleteUploadOptions& options);

  // nullopt when no pipeline exists for the id.
  std::optional<PipelineStatus> GetPipelineStatus(const std::string& upload_id) const;

  bool PauseUpload(const std::string& upload_id);
  bool ResumeUpload(const std::string& upload_id);
  bool CancelUpload(const std::string& upload_id);

  // Reloads sessions and pipeline records after a restart. Pipelines in
  // transcoding are re-queued; pipelines in distributing re-run delivery
  // for platforms without a final result. Returns the number resumed.
  int RecoverInFlight();

  // Drops complete and failed pipelines whose last update is older than
  // pipeline_retention_ms from memory. Their records stay in the
  // repository. Returns the number evicted.
  int EvictTerminalPipelines();

  // Joins distribution workers and detaches from collaborator callbacks.
  void Shutdown();

  // Blocks until no distribution worker is running. For tests and shutdown.
  void WaitForIdle();

 private:
  struct Entry {
    PipelineRecord record;
    std::unique_ptr<PipelineStateMachine> machine;
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  Entry& RequireEntryLocked(const std::string& upload_id);
  void SyncRecordLocked(Entry& entry);
  PipelineEvent MakeEventLocked(PipelineEventType type, const Entry& entry) const;
  void Emit(const PipelineEvent& event);

  void QueueTranscodeFor(const std::string& upload_id, const MediaAsset& asset);
  void OnSessionEnded(const std::string& upload_id, const std::string& reason);
  void OnJobEvent(const TranscodingJob& job, transcode::JobEvent event);
  void OnTranscodeFinished(const transcode::BatchOutcome& outcome);
  void OnTargetFinished(const DistributionTarget& target);

  void StartDistribution(const std::string& upload_id, bool resume);
  void RunDistribution(const std::string& upload_id, bool resume);
  void FailPipeline(const std::string& upload_id, const std::string& error);
  void ReapWorkersLocked();

  config::PipelineConfig config_;
  std::shared_ptr<storage::IPipelineRepository> repository_;
  std::shared_ptr<upload::UploadSessionManager> uploads_;
  std::shared_ptr<transcode::TranscodingOrchestrator> transcoder_;
  std::shared_ptr<distribution::DistributionFanout> fanout_;
  std::shared_ptr<const distribution::TierPolicy> tiers_;
  std::shared_ptr<PipelineEventBus> events_;
  std::shared_ptr<IAuditSink> audit_;
  std::shared_ptr<time::ITimeSource> time_source_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> pipelines_;          // upload id -> pipeline
  std::map<std::string, std::string> asset_index_;  // asset id -> upload id

  std::mutex workers_mutex_;
  std::list<Worker> workers_;
  bool shutting_down_ = false;
};

}  // namespace mediaforge::pipeline

#endif  // MEDIAFORGE_PIPELINE_PIPELINE_COORDINATOR_HPP_
