// Repository: MediaForge
// Component: Media probe
// Purpose: Reads duration, picture size and container tags of a media file
//          through libavformat.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_MEDIA_PROBE_HPP_
#define MEDIAFORGE_TRANSCODE_MEDIA_PROBE_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace mediaforge::transcode {

struct ProbeResult {
  int64_t duration_ms = 0;  // 0 if the container does not say
  int32_t width = 0;        // First video stream; 0 if none
  int32_t height = 0;
  std::map<std::string, std::string> tags;  // Container-level metadata
};

class IMediaProbe {
 public:
  virtual ~IMediaProbe() = default;

  // nullopt if the file cannot be opened or parsed.
  virtual std::optional<ProbeResult> Probe(const std::string& uri) const = 0;
};

class FfmpegMediaProbe : public IMediaProbe {
 public:
  // False when built without libavformat; Probe() then always fails.
  static bool Available();

  std::optional<ProbeResult> Probe(const std::string& uri) const override;
};

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_MEDIA_PROBE_HPP_
