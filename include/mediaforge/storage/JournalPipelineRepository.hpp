// Repository: MediaForge
// Component: Journal-backed pipeline repository
// Purpose: Durable IPipelineRepository. Every mutation is appended to a
//          JSON-lines journal by a dedicated writer thread; on open the
//          journal is replayed into memory and compacted.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_STORAGE_JOURNAL_PIPELINE_REPOSITORY_HPP_
#define MEDIAFORGE_STORAGE_JOURNAL_PIPELINE_REPOSITORY_HPP_

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mediaforge/storage/InMemoryPipelineRepository.hpp"

namespace mediaforge::storage {

class JournalPipelineRepository : public InMemoryPipelineRepository {
 public:
  static constexpr int kFlushIntervalMs = 250;
  static constexpr size_t kFlushRecordsMax = 50;

  // Replays `journal_path` (a corrupt or truncated line is skipped), rewrites
  // it as a snapshot, then starts the writer thread. Throws std::runtime_error
  // if the journal directory cannot be created or the snapshot written.
  explicit JournalPipelineRepository(std::string journal_path);
  ~JournalPipelineRepository() override;

  void PutSession(const UploadSession& session) override;
  void DeleteSession(const std::string& upload_id) override;
  void PutAsset(const MediaAsset& asset) override;
  void PutJob(const TranscodingJob& job) override;
  void PutTarget(const DistributionTarget& target) override;
  void PutForensicRecord(const ForensicRecord& record) override;
  void PutPipeline(const PipelineRecord& record) override;

  // Blocks until every mutation made so far is on disk.
  void Flush();

  const std::string& path() const { return journal_path_; }
  size_t ReplayedRecords() const { return replayed_records_; }
  size_t SkippedRecords() const { return skipped_records_; }

 private:
  void Replay();
  void Compact();
  void Enqueue(std::string line);
  void WriterLoop();

  std::string journal_path_;
  size_t replayed_records_ = 0;
  size_t skipped_records_ = 0;

  // Serialises apply-then-enqueue so journal order matches memory order.
  std::mutex append_mutex_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable written_cv_;
  std::vector<std::string> write_queue_;
  uint64_t enqueued_seq_ = 0;
  uint64_t written_seq_ = 0;
  bool shutdown_ = false;
  std::thread writer_thread_;
};

}  // namespace mediaforge::storage

#endif  // MEDIAFORGE_STORAGE_JOURNAL_PIPELINE_REPOSITORY_HPP_
