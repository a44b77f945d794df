// Repository: MediaForge
// Component: Logger audit sink
// Copyright (c) 2026 MediaForge

#include "mediaforge/pipeline/IAuditSink.hpp"

#include <sstream>

#include "mediaforge/util/Ids.hpp"
#include "mediaforge/util/Logger.hpp"

namespace mediaforge::pipeline {

void LoggerAuditSink::Record(const PipelineEvent& event) {
  std::ostringstream line;
  line << "[Audit] " << util::FormatUtcIso8601(event.emitted_utc_ms) << " "
       << ToString(event.type) << " upload=" << event.upload_id;
  if (!event.asset_id.empty()) line << " asset=" << event.asset_id;
  if (!event.job_id.empty()) line << " job=" << event.job_id;
  if (!event.platform_id.empty()) line << " platform=" << event.platform_id;
  if (!event.message.empty()) line << " message=\"" << event.message << "\"";
  util::Logger::Info(line.str());
}

}  // namespace mediaforge::pipeline
