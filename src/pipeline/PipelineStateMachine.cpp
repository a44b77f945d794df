// Repository: MediaForge
// Component: Pipeline State Machine implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/pipeline/PipelineStateMachine.hpp"

#include "mediaforge/util/Logger.hpp"

namespace mediaforge::pipeline {

bool IsLegalTransition(PipelineStage from, PipelineStage to) {
  switch (from) {
    case PipelineStage::kUploading:
      return to == PipelineStage::kTranscoding || to == PipelineStage::kDistributing ||
             to == PipelineStage::kFailed;
    case PipelineStage::kTranscoding:
      return to == PipelineStage::kDistributing || to == PipelineStage::kFailed;
    case PipelineStage::kDistributing:
      return to == PipelineStage::kComplete || to == PipelineStage::kFailed;
    case PipelineStage::kComplete:
    case PipelineStage::kFailed:
      return false;
  }
  return false;
}

PipelineStateMachine::PipelineStateMachine()
    : stage_(PipelineStage::kUploading), illegal_transition_total_(0) {}

PipelineStateMachine::PipelineStateMachine(PipelineStage stage,
                                           std::optional<PipelineStage> failed_stage,
                                           std::string error)
    : stage_(stage),
      failed_stage_(failed_stage),
      error_(std::move(error)),
      illegal_transition_total_(0) {}

bool PipelineStateMachine::BeginTranscoding() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stage_ != PipelineStage::kUploading) {
    RecordIllegalTransitionLocked(stage_, PipelineStage::kTranscoding);
    return false;
  }
  return AdvanceLocked(PipelineStage::kTranscoding);
}

bool PipelineStateMachine::SkipTranscoding() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stage_ != PipelineStage::kUploading) {
    RecordIllegalTransitionLocked(stage_, PipelineStage::kDistributing);
    return false;
  }
  return AdvanceLocked(PipelineStage::kDistributing);
}

bool PipelineStateMachine::BeginDistribution() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stage_ != PipelineStage::kTranscoding) {
    RecordIllegalTransitionLocked(stage_, PipelineStage::kDistributing);
    return false;
  }
  return AdvanceLocked(PipelineStage::kDistributing);
}

bool PipelineStateMachine::Complete() {
  std::lock_guard<std::mutex> lock(mutex_);
  return AdvanceLocked(PipelineStage::kComplete);
}

bool PipelineStateMachine::Fail(const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const PipelineStage from = stage_;
  if (!AdvanceLocked(PipelineStage::kFailed)) return false;
  failed_stage_ = from;
  error_ = error;
  return true;
}

PipelineStage PipelineStateMachine::stage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stage_;
}

PipelineStateMachine::Snapshot PipelineStateMachine::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snapshot;
  snapshot.stage = stage_;
  snapshot.failed_stage = failed_stage_;
  snapshot.error = error_;
  snapshot.transitions = transitions_;
  snapshot.illegal_transition_total = illegal_transition_total_;
  return snapshot;
}

bool PipelineStateMachine::AdvanceLocked(PipelineStage to) {
  if (!IsLegalTransition(stage_, to)) {
    RecordIllegalTransitionLocked(stage_, to);
    return false;
  }
  TransitionLocked(to);
  return true;
}

void PipelineStateMachine::TransitionLocked(PipelineStage to) {
  if (stage_ == to) return;
  transitions_[{stage_, to}]++;
  stage_ = to;
}

void PipelineStateMachine::RecordIllegalTransitionLocked(PipelineStage from,
                                                         PipelineStage attempted_to) {
  ++illegal_transition_total_;
  transitions_[{from, attempted_to}]++;
  util::Logger::Warn(std::string("[PipelineStateMachine] Illegal transition ") + ToString(from) +
                     " -> " + ToString(attempted_to));
}

}  // namespace mediaforge::pipeline
