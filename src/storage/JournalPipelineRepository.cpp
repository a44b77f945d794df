// Repository: MediaForge
// Component: Journal-backed pipeline repository implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/storage/JournalPipelineRepository.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include "mediaforge/util/FileUtil.hpp"
#include "mediaforge/util/Ids.hpp"
#include "mediaforge/util/Logger.hpp"
#include "storage/StateCodec.hpp"

namespace mediaforge::storage {

namespace {

namespace pb = ::mediaforge::state::v1;

std::string ToJsonLine(const pb::JournalRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;
  options.preserve_proto_field_names = true;
  std::string line;
  const auto status = google::protobuf::util::MessageToJsonString(record, &line, options);
  if (!status.ok()) {
    throw std::runtime_error("journal encode failed: " + std::string(status.message()));
  }
  return line;
}

bool FromJsonLine(const std::string& line, pb::JournalRecord* record) {
  if (line.empty() || line.front() != '{' || line.back() != '}') return false;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(line, record, options).ok();
}

pb::JournalRecord NewPut() {
  pb::JournalRecord record;
  record.set_op(pb::JournalRecord::OP_PUT);
  record.set_emitted_utc(util::FormatUtcIso8601(util::NowUtcMs()));
  return record;
}

}  // namespace

JournalPipelineRepository::JournalPipelineRepository(std::string journal_path)
    : journal_path_(std::move(journal_path)) {
  util::MakeDirs(util::ParentDir(journal_path_));
  Replay();
  Compact();
  writer_thread_ = std::thread(&JournalPipelineRepository::WriterLoop, this);
}

JournalPipelineRepository::~JournalPipelineRepository() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    shutdown_ = true;
  }
  queue_cv_.notify_all();
  if (writer_thread_.joinable()) writer_thread_.join();
}

void JournalPipelineRepository::Replay() {
  std::ifstream in(journal_path_);
  if (!in) return;

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    pb::JournalRecord record;
    if (!FromJsonLine(line, &record)) {
      ++skipped_records_;
      continue;
    }
    try {
      if (record.op() == pb::JournalRecord::OP_DELETE_SESSION) {
        InMemoryPipelineRepository::DeleteSession(record.key());
      } else if (record.op() == pb::JournalRecord::OP_PUT) {
        switch (record.entity_case()) {
          case pb::JournalRecord::kSession:
            InMemoryPipelineRepository::PutSession(codec::FromProto(record.session()));
            break;
          case pb::JournalRecord::kAsset:
            InMemoryPipelineRepository::PutAsset(codec::FromProto(record.asset()));
            break;
          case pb::JournalRecord::kJob:
            InMemoryPipelineRepository::PutJob(codec::FromProto(record.job()));
            break;
          case pb::JournalRecord::kTarget:
            InMemoryPipelineRepository::PutTarget(codec::FromProto(record.target()));
            break;
          case pb::JournalRecord::kForensic:
            InMemoryPipelineRepository::PutForensicRecord(codec::FromProto(record.forensic()));
            break;
          case pb::JournalRecord::kPipeline:
            InMemoryPipelineRepository::PutPipeline(codec::FromProto(record.pipeline()));
            break;
          case pb::JournalRecord::ENTITY_NOT_SET:
            ++skipped_records_;
            continue;
        }
      } else {
        ++skipped_records_;
        continue;
      }
      ++replayed_records_;
    } catch (const std::invalid_argument& e) {
      ++skipped_records_;
      util::Logger::Warn(std::string("[JournalPipelineRepository] skipping record: ") + e.what());
    }
  }
  if (skipped_records_ > 0) {
    util::Logger::Warn("[JournalPipelineRepository] " + std::to_string(skipped_records_) +
                       " unreadable record(s) in " + journal_path_);
  }
  util::Logger::Info("[JournalPipelineRepository] replayed " +
                     std::to_string(replayed_records_) + " record(s) from " + journal_path_);
}

void JournalPipelineRepository::Compact() {
  const Contents contents = DumpContents();
  std::string snapshot;
  auto add = [&snapshot](const pb::JournalRecord& record) {
    snapshot += ToJsonLine(record);
    snapshot += '\n';
  };
  for (const auto& v : contents.sessions) {
    auto r = NewPut();
    codec::ToProto(v, r.mutable_session());
    add(r);
  }
  for (const auto& v : contents.assets) {
    auto r = NewPut();
    codec::ToProto(v, r.mutable_asset());
    add(r);
  }
  for (const auto& v : contents.jobs) {
    auto r = NewPut();
    codec::ToProto(v, r.mutable_job());
    add(r);
  }
  for (const auto& v : contents.targets) {
    auto r = NewPut();
    codec::ToProto(v, r.mutable_target());
    add(r);
  }
  for (const auto& v : contents.forensic_records) {
    auto r = NewPut();
    codec::ToProto(v, r.mutable_forensic());
    add(r);
  }
  for (const auto& v : contents.pipelines) {
    auto r = NewPut();
    codec::ToProto(v, r.mutable_pipeline());
    add(r);
  }
  util::WriteFileAtomic(journal_path_, snapshot);
}

void JournalPipelineRepository::PutSession(const UploadSession& session) {
  auto r = NewPut();
  codec::ToProto(session, r.mutable_session());
  std::lock_guard<std::mutex> lock(append_mutex_);
  InMemoryPipelineRepository::PutSession(session);
  Enqueue(ToJsonLine(r));
}

void JournalPipelineRepository::DeleteSession(const std::string& upload_id) {
  pb::JournalRecord r;
  r.set_op(pb::JournalRecord::OP_DELETE_SESSION);
  r.set_emitted_utc(util::FormatUtcIso8601(util::NowUtcMs()));
  r.set_key(upload_id);
  std::lock_guard<std::mutex> lock(append_mutex_);
  InMemoryPipelineRepository::DeleteSession(upload_id);
  Enqueue(ToJsonLine(r));
}

void JournalPipelineRepository::PutAsset(const MediaAsset& asset) {
  auto r = NewPut();
  codec::ToProto(asset, r.mutable_asset());
  std::lock_guard<std::mutex> lock(append_mutex_);
  InMemoryPipelineRepository::PutAsset(asset);
  Enqueue(ToJsonLine(r));
}

void JournalPipelineRepository::PutJob(const TranscodingJob& job) {
  auto r = NewPut();
  codec::ToProto(job, r.mutable_job());
  std::lock_guard<std::mutex> lock(append_mutex_);
  InMemoryPipelineRepository::PutJob(job);
  Enqueue(ToJsonLine(r));
}

void JournalPipelineRepository::PutTarget(const DistributionTarget& target) {
  auto r = NewPut();
  codec::ToProto(target, r.mutable_target());
  std::lock_guard<std::mutex> lock(append_mutex_);
  InMemoryPipelineRepository::PutTarget(target);
  Enqueue(ToJsonLine(r));
}

void JournalPipelineRepository::PutForensicRecord(const ForensicRecord& record) {
  auto r = NewPut();
  codec::ToProto(record, r.mutable_forensic());
  std::lock_guard<std::mutex> lock(append_mutex_);
  InMemoryPipelineRepository::PutForensicRecord(record);
  Enqueue(ToJsonLine(r));
}

void JournalPipelineRepository::PutPipeline(const PipelineRecord& record) {
  auto r = NewPut();
  codec::ToProto(record, r.mutable_pipeline());
  std::lock_guard<std::mutex> lock(append_mutex_);
  InMemoryPipelineRepository::PutPipeline(record);
  Enqueue(ToJsonLine(r));
}

void JournalPipelineRepository::Enqueue(std::string line) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  write_queue_.push_back(std::move(line));
  ++enqueued_seq_;
  if (write_queue_.size() >= kFlushRecordsMax) queue_cv_.notify_one();
}

void JournalPipelineRepository::Flush() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  const uint64_t target = enqueued_seq_;
  queue_cv_.notify_one();
  written_cv_.wait(lock, [this, target] { return written_seq_ >= target || shutdown_; });
}

void JournalPipelineRepository::WriterLoop() {
  while (true) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, std::chrono::milliseconds(kFlushIntervalMs), [this] {
      return shutdown_ || !write_queue_.empty();
    });
    if (shutdown_ && write_queue_.empty()) break;
    if (write_queue_.empty()) continue;
    std::vector<std::string> batch;
    batch.swap(write_queue_);
    const uint64_t batch_end = enqueued_seq_;
    lock.unlock();

    std::ofstream out(journal_path_, std::ios::app);
    for (const auto& line : batch) out << line << '\n';
    out.flush();

    lock.lock();
    if (!out) {
      util::Logger::Error("[JournalPipelineRepository] append failed on " + journal_path_ +
                          "; retrying " + std::to_string(batch.size()) + " record(s)");
      batch.insert(batch.end(), std::make_move_iterator(write_queue_.begin()),
                   std::make_move_iterator(write_queue_.end()));
      write_queue_.swap(batch);
      if (shutdown_) break;
      queue_cv_.wait_for(lock, std::chrono::milliseconds(kFlushIntervalMs),
                         [this] { return shutdown_; });
      continue;
    }
    written_seq_ = batch_end;
    written_cv_.notify_all();
  }
  std::lock_guard<std::mutex> lock(queue_mutex_);
  written_cv_.notify_all();
}

}  // namespace mediaforge::storage
