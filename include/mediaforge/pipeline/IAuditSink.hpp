// Repository: MediaForge
// Component: Audit sink
// Purpose: Write-only destination for auditable pipeline events.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_PIPELINE_I_AUDIT_SINK_HPP_
#define MEDIAFORGE_PIPELINE_I_AUDIT_SINK_HPP_

#include "mediaforge/pipeline/PipelineEvents.hpp"

namespace mediaforge::pipeline {

class IAuditSink {
 public:
  virtual ~IAuditSink() = default;
  // Must not throw.
  virtual void Record(const PipelineEvent& event) = 0;
};

// Writes one [Audit] line per event through the Logger.
class LoggerAuditSink : public IAuditSink {
 public:
  void Record(const PipelineEvent& event) override;
};

}  // namespace mediaforge::pipeline

#endif  // MEDIAFORGE_PIPELINE_I_AUDIT_SINK_HPP_
