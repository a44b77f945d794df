// Repository: MediaForge
// Component: Encoder command lines
// Copyright (c) 2026 MediaForge

#include "mediaforge/transcode/FfmpegCommandBuilder.hpp"

namespace mediaforge::transcode {

namespace {

std::string Kbps(int32_t kbps) {
  return std::to_string(kbps) + "k";
}

}  // namespace

std::vector<std::string> BuildTranscodeArgs(const EncoderOptions& options,
                                            const std::string& source,
                                            const std::string& output,
                                            const QualityPreset& preset) {
  std::vector<std::string> args = {options.ffmpeg_path, "-hide_banner", "-nostdin"};
  if (options.gpu_acceleration) {
    args.insert(args.end(), {"-hwaccel", "cuda"});
  }
  args.insert(args.end(), {
      "-i", source,
      "-c:v", options.gpu_acceleration ? "h264_nvenc" : "libx264",
      "-preset", "medium",
      "-profile:v", "high",
      "-level", "4.0",
      "-pix_fmt", "yuv420p",
      "-vf", "scale=" + std::to_string(preset.width) + "x" + std::to_string(preset.height),
      "-r", std::to_string(preset.fps),
      "-b:v", Kbps(preset.video_kbps),
      "-maxrate", Kbps(preset.maxrate_kbps),
      "-bufsize", Kbps(preset.bufsize_kbps),
      "-c:a", "aac",
      "-b:a", Kbps(preset.audio_kbps),
      "-ac", "2",
      "-ar", "48000",
      "-movflags", "+faststart",
      "-y", output,
  });
  return args;
}

std::vector<std::string> BuildMetadataArgs(const EncoderOptions& options,
                                           const std::string& source,
                                           const std::string& output,
                                           const std::map<std::string, std::string>& tags) {
  std::vector<std::string> args = {options.ffmpeg_path, "-hide_banner", "-nostdin",
                                   "-i", source, "-map", "0", "-c", "copy"};
  for (const auto& [key, value] : tags) {
    args.push_back("-metadata");
    args.push_back(key + "=" + value);
  }
  // mp4 drops unknown global tags unless asked to keep them.
  args.insert(args.end(), {"-movflags", "use_metadata_tags", "-y", output});
  return args;
}

}  // namespace mediaforge::transcode
