// Repository: MediaForge
// Component: Encoder command lines
// Purpose: argv for variant encodes and metadata-only remuxes.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_FFMPEG_COMMAND_BUILDER_HPP_
#define MEDIAFORGE_TRANSCODE_FFMPEG_COMMAND_BUILDER_HPP_

#include <map>
#include <string>
#include <vector>

#include "mediaforge/core/Types.hpp"

namespace mediaforge::transcode {

struct EncoderOptions {
  std::string ffmpeg_path = "ffmpeg";
  bool gpu_acceleration = false;
};

// H.264/AAC MP4 at the preset's resolution, frame rate and bitrates.
std::vector<std::string> BuildTranscodeArgs(const EncoderOptions& options,
                                            const std::string& source,
                                            const std::string& output,
                                            const QualityPreset& preset);

// Stream copy of `source` into `output` with extra container tags.
std::vector<std::string> BuildMetadataArgs(const EncoderOptions& options,
                                           const std::string& source,
                                           const std::string& output,
                                           const std::map<std::string, std::string>& tags);

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_FFMPEG_COMMAND_BUILDER_HPP_
