// Repository: MediaForge
// Component: Transcoding Orchestrator
// Purpose: Turns a raw asset into quality variants. One job per valid
//          preset; jobs run in fixed-size groups on worker threads, each
//          group joined before the next starts. Finished variants are
//          signed, published and appended to the asset; once every job of
//          the batch is terminal the adaptive-streaming manifest is built.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_TRANSCODING_ORCHESTRATOR_HPP_
#define MEDIAFORGE_TRANSCODE_TRANSCODING_ORCHESTRATOR_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mediaforge/config/PipelineConfig.hpp"
#include "mediaforge/core/Types.hpp"
#include "mediaforge/forensic/IForensicService.hpp"
#include "mediaforge/storage/IObjectPublisher.hpp"
#include "mediaforge/storage/IPipelineRepository.hpp"
#include "mediaforge/time/ITimeSource.hpp"
#include "mediaforge/transcode/FfmpegCommandBuilder.hpp"
#include "mediaforge/transcode/ITranscodeRunner.hpp"
#include "mediaforge/transcode/MediaProbe.hpp"

namespace mediaforge::transcode {

struct TranscodeRequest {
  std::string asset_id;
  std::string source_location;
  std::vector<std::string> presets;  // Unknown names are skipped
  bool inject_signature = true;
  std::string signature_id;
  forensic::SignaturePayload signature_payload;
  std::vector<std::string> target_platforms;  // Carried through to the outcome
  OutputMode output_mode = OutputMode::kHls;
};

struct BatchStatus {
  std::string batch_id;
  std::string asset_id;
  int total_variants = 0;
  int completed = 0;
  int failed = 0;
  int processing = 0;
  int queued = 0;
  double overall_progress = 0.0;  // Mean of every job's progress, queued = 0
  bool finished = false;
  std::vector<TranscodingJob> jobs;
};

struct BatchOutcome {
  std::string batch_id;
  std::string asset_id;
  int succeeded = 0;
  int failed = 0;
  ProcessingStatus asset_status = ProcessingStatus::kFailed;
  std::string manifest_url;
  std::vector<QualityVariant> variants;
  std::vector<std::string> target_platforms;
  std::string error;  // Set when asset_status is kFailed
};

enum class JobEvent { kStarted, kProgress, kCompleted, kFailed };

// Mean of progress_percent over `jobs`; 0 for an empty list.
double MeanProgress(const std::vector<TranscodingJob>& jobs);

class TranscodingOrchestrator {
 public:
  using CompletionCallback = std::function<void(const BatchOutcome&)>;
  using JobCallback = std::function<void(const TranscodingJob&, JobEvent)>;

  // `probe` may be null; progress then waits for the encoder's own Duration line.
  TranscodingOrchestrator(const config::PipelineConfig& config,
                          std::shared_ptr<storage::IPipelineRepository> repository,
                          std::shared_ptr<ITranscodeRunner> runner,
                          std::shared_ptr<forensic::IForensicService> forensics,
                          std::shared_ptr<storage::IObjectPublisher> publisher,
                          std::shared_ptr<IMediaProbe> probe,
                          std::shared_ptr<time::ITimeSource> time_source);
  ~TranscodingOrchestrator();

  TranscodingOrchestrator(const TranscodingOrchestrator&) = delete;
  TranscodingOrchestrator& operator=(const TranscodingOrchestrator&) = delete;

  // Callbacks run on orchestrator threads. Set before Start().
  void SetCompletionCallback(CompletionCallback callback);
  void SetJobCallback(JobCallback callback);

  void Start();
  // Finishes the running group, leaves the rest queued, joins the dispatcher.
  void Stop();

  // Creates the jobs and returns immediately with the batch id.
  // Throws PipelineError(kAssetNotFound) if the asset is unknown.
  std::string QueueTranscoding(const TranscodeRequest& request);

  // nullopt for an unknown batch id.
  std::optional<BatchStatus> GetJobStatus(const std::string& batch_id) const;

  // True once the batch is no longer in flight: it has finished and the
  // completion callback has returned, or the id was never queued here.
  // False on timeout.
  bool WaitForBatch(const std::string& batch_id, std::chrono::milliseconds timeout) const;

  int GroupSize() const { return group_size_; }

 private:
  struct Batch {
    std::string batch_id;
    TranscodeRequest request;
    std::vector<TranscodingJob> jobs;
  };

  void DispatchLoop();
  void RunBatch(const std::shared_ptr<Batch>& batch);
  void RunJob(const std::shared_ptr<Batch>& batch, size_t index, int64_t probed_duration_ms);
  void UpdateProgress(const std::shared_ptr<Batch>& batch, size_t index, int percent);
  void FinishJob(const std::shared_ptr<Batch>& batch, size_t index, JobStatus status,
                 const std::string& error);
  void AppendVariant(const std::string& asset_id, const QualityVariant& variant);
  BatchOutcome Finalize(const std::shared_ptr<Batch>& batch);
  std::string PublishManifest(const std::string& asset_id, OutputMode mode,
                              const std::vector<QualityVariant>& variants);

  config::PipelineConfig config_;
  EncoderOptions encoder_;
  int group_size_;
  std::shared_ptr<storage::IPipelineRepository> repository_;
  std::shared_ptr<ITranscodeRunner> runner_;
  std::shared_ptr<forensic::IForensicService> forensics_;
  std::shared_ptr<storage::IObjectPublisher> publisher_;
  std::shared_ptr<IMediaProbe> probe_;
  std::shared_ptr<time::ITimeSource> time_source_;

  CompletionCallback on_complete_;
  JobCallback on_job_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::deque<std::shared_ptr<Batch>> queue_;
  std::map<std::string, std::shared_ptr<Batch>> active_;  // Unfinished batches
  bool stop_requested_ = false;
  std::thread dispatcher_;

  std::mutex asset_mutex_;  // Serialises read-modify-write of assets
};

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_TRANSCODING_ORCHESTRATOR_HPP_
