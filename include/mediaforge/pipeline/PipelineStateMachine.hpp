// Repository: MediaForge
// Component: Pipeline State Machine
// Purpose: Stage progression for one upload:
//          uploading -> transcoding -> distributing -> complete,
//          with failed reachable from every non-terminal stage. The only
//          skip is uploading -> distributing when auto-transcode is off.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_PIPELINE_PIPELINE_STATE_MACHINE_HPP_
#define MEDIAFORGE_PIPELINE_PIPELINE_STATE_MACHINE_HPP_

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "mediaforge/core/Types.hpp"

namespace mediaforge::pipeline {

bool IsLegalTransition(PipelineStage from, PipelineStage to);

class PipelineStateMachine {
 public:
  struct Snapshot {
    PipelineStage stage = PipelineStage::kUploading;
    std::optional<PipelineStage> failed_stage;
    std::string error;
    std::map<std::pair<PipelineStage, PipelineStage>, uint64_t> transitions;
    uint64_t illegal_transition_total = 0;
  };

  PipelineStateMachine();
  // Resumes a persisted pipeline.
  PipelineStateMachine(PipelineStage stage, std::optional<PipelineStage> failed_stage,
                       std::string error);

  PipelineStateMachine(const PipelineStateMachine&) = delete;
  PipelineStateMachine& operator=(const PipelineStateMachine&) = delete;

  // Each returns false, and counts an illegal transition, when the current
  // stage does not allow the move.
  bool BeginTranscoding();
  bool SkipTranscoding();
  bool BeginDistribution();
  bool Complete();
  // Records the stage that failed and the message.
  bool Fail(const std::string& error);

  [[nodiscard]] PipelineStage stage() const;
  [[nodiscard]] Snapshot GetSnapshot() const;

 private:
  bool AdvanceLocked(PipelineStage to);
  void TransitionLocked(PipelineStage to);
  void RecordIllegalTransitionLocked(PipelineStage from, PipelineStage attempted_to);

  mutable std::mutex mutex_;
  PipelineStage stage_;
  std::optional<PipelineStage> failed_stage_;
  std::string error_;
  std::map<std::pair<PipelineStage, PipelineStage>, uint64_t> transitions_;
  uint64_t illegal_transition_total_;
};

}  // namespace mediaforge::pipeline

#endif  // MEDIAFORGE_PIPELINE_PIPELINE_STATE_MACHINE_HPP_
